#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <stdexcept>
#include <sys/types.h>

// --- C++ Namespace Setup ---

namespace fs = std::filesystem;

/**
 * @brief Global definitions for the File Toolkit.
 */
namespace FileToolkit
{
    const char DIRECTORY_SEPARATOR = '/';

    // Permission bits used by makeDirectory when none are given (rwxrwxr-x)
    const mode_t DEFAULT_DIRECTORY_PERMISSIONS = 0775;

    /**
     * @brief Raised by the content operations (read, append, write) when the
     * underlying OS call fails. The message names the operation only.
     */
    class OperationError : public std::runtime_error {
    public:
        explicit OperationError(const std::string& message)
            : std::runtime_error(message) {}
    };

} // namespace FileToolkit
