#pragma once

#include "gtest/gtest.h"
#include "Common.h"
#include "Log.h"
#include "PathEntry.h"
#include <fstream>
#include <sstream>

// Use the project's namespace
using namespace FileToolkit;

/**
 * @brief A base test fixture for all FileToolkit tests.
 *
 * Creates a fresh temporary directory per test with the layout
 *
 *     <tempDir>/directory/
 *     <tempDir>/file.txt      (empty)
 *
 * plus the path of a file that does not exist (<tempDir>/fake.txt),
 * and deletes everything in TearDown.
 */
class BaseTestFixture : public ::testing::Test {
protected:
    // --- Paths ---
    fs::path tempDir;
    fs::path directoryPath;
    fs::path filePath;
    fs::path fakePath;

    // Diagnostics captured from the toolkit's logger
    std::vector<std::string> logLines;

    /**
     * @brief Creates a test file with the given content.
     */
    void touch(const fs::path& path, const std::string& content = "") {
        std::ofstream outfile(path, std::ios::binary);
        outfile << content;
        outfile.close();
    }

    std::string slurp(const fs::path& path) {
        std::ifstream infile(path, std::ios::binary);
        std::ostringstream buffer;
        buffer << infile.rdbuf();
        return buffer.str();
    }

    void SetUp() override {
        tempDir = fs::temp_directory_path() / "file_toolkit_tests"
            / ::testing::UnitTest::GetInstance()->current_test_info()->name();
        fs::remove_all(tempDir);
        fs::create_directories(tempDir);

        directoryPath = tempDir / "directory";
        filePath = tempDir / "file.txt";
        fakePath = tempDir / "fake.txt";
        fs::create_directory(directoryPath);
        touch(filePath);

        Log::setLogger([this](const std::string& line) { logLines.push_back(line); });
    }

    void TearDown() override {
        Log::setLogger(nullptr);

        // Restore permissions so the cleanup can descend everywhere
        std::error_code ec;
        for (auto it = fs::recursive_directory_iterator(tempDir, ec);
             !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
            std::error_code permEc;
            fs::permissions(it->path(), fs::perms::owner_all, fs::perm_options::add, permEc);
        }
        fs::remove_all(tempDir.parent_path(), ec);
    }
};
