#include "gtest/gtest.h"
#include "../src/utils/ArgParser.h"
#include <vector>
#include <string>

// Helper class to manage argc and argv for testing
class ArgvManager {
public:
    ArgvManager(const std::vector<std::string>& args) : m_args(args) {
        m_argv.reserve(m_args.size());
        for (auto& arg : m_args) {
            m_argv.push_back(const_cast<char*>(arg.c_str()));
        }
        m_argc = static_cast<int>(m_argv.size());
    }

    int argc() const { return m_argc; }
    char** argv() { return m_argv.data(); }

private:
    std::vector<std::string> m_args;
    int m_argc;
    std::vector<char*> m_argv;
};

TEST(ArgParserTest, ParseInfoWithPositionalPath) {
    ArgvManager args({"./filetool", "info", "/tmp/file.txt"});
    ArgParser parser;
    auto result = parser.parseArgs(args.argc(), args.argv());

    ASSERT_EQ(result.command, "info");
    ASSERT_EQ(result.stringArgs["path"], "/tmp/file.txt");
    ASSERT_FALSE(result.boolArgs["recursive"]);
    ASSERT_FALSE(result.boolArgs["overwrite"]);
}

TEST(ArgParserTest, ParseListDefaults) {
    ArgvManager args({"./filetool", "list", "--path", "/tmp"});
    ArgParser parser;
    auto result = parser.parseArgs(args.argc(), args.argv());

    ASSERT_EQ(result.command, "list");
    ASSERT_EQ(result.stringArgs["path"], "/tmp");
    ASSERT_EQ(result.stringArgs["type"], "all");
    ASSERT_FALSE(result.boolArgs["all"]);
}

TEST(ArgParserTest, ParseListFlags) {
    ArgvManager args({"./filetool", "list", "/tmp", "-r", "-a", "--type", "files"});
    ArgParser parser;
    auto result = parser.parseArgs(args.argc(), args.argv());

    ASSERT_TRUE(result.boolArgs["recursive"]);
    ASSERT_TRUE(result.boolArgs["all"]);
    ASSERT_EQ(result.stringArgs["type"], "files");
}

TEST(ArgParserTest, ParseMkdirMode) {
    ArgvManager args({"./filetool", "mkdir", "/tmp/new", "--recursive", "--mode", "0700"});
    ArgParser parser;
    auto result = parser.parseArgs(args.argc(), args.argv());

    ASSERT_EQ(result.command, "mkdir");
    ASSERT_TRUE(result.boolArgs["recursive"]);
    ASSERT_EQ(result.intArgs["mode"], 0700);
}

TEST(ArgParserTest, ParseMkdirDefaultMode) {
    ArgvManager args({"./filetool", "mkdir", "/tmp/new"});
    ArgParser parser;
    auto result = parser.parseArgs(args.argc(), args.argv());

    ASSERT_EQ(result.intArgs["mode"], 0775);
}

TEST(ArgParserTest, ParseMove) {
    ArgvManager args({"./filetool", "move", "a.txt", "--destination", "b.txt", "-f"});
    ArgParser parser;
    auto result = parser.parseArgs(args.argc(), args.argv());

    ASSERT_EQ(result.command, "move");
    ASSERT_EQ(result.stringArgs["path"], "a.txt");
    ASSERT_EQ(result.stringArgs["destination"], "b.txt");
    ASSERT_TRUE(result.boolArgs["overwrite"]);
}

TEST(ArgParserTest, ParseWrite) {
    ArgvManager args({"./filetool", "write", "notes.txt", "--content", "hello"});
    ArgParser parser;
    auto result = parser.parseArgs(args.argc(), args.argv());

    ASSERT_EQ(result.command, "write");
    ASSERT_EQ(result.stringArgs["content"], "hello");
}

TEST(ArgParserTest, ParseMissingPath) {
    ArgvManager args({"./filetool", "read"});
    ArgParser parser;

    ASSERT_THROW(parser.parseArgs(args.argc(), args.argv()), std::runtime_error);
}

TEST(ArgParserTest, ParseMissingCommandSpecificOption) {
    ArgvManager move({"./filetool", "move", "a.txt"});
    ASSERT_THROW(ArgParser().parseArgs(move.argc(), move.argv()), std::runtime_error);

    ArgvManager rename({"./filetool", "rename", "a.txt"});
    ASSERT_THROW(ArgParser().parseArgs(rename.argc(), rename.argv()), std::runtime_error);

    ArgvManager append({"./filetool", "append", "a.txt"});
    ASSERT_THROW(ArgParser().parseArgs(append.argc(), append.argv()), std::runtime_error);
}

TEST(ArgParserTest, ParseInvalidValues) {
    ArgvManager mode({"./filetool", "mkdir", "/tmp/new", "--mode", "789"});
    ASSERT_THROW(ArgParser().parseArgs(mode.argc(), mode.argv()), std::runtime_error);

    ArgvManager type({"./filetool", "list", "/tmp", "--type", "sockets"});
    ASSERT_THROW(ArgParser().parseArgs(type.argc(), type.argv()), std::runtime_error);
}

TEST(ArgParserTest, ParseUnknownCommand) {
    ArgvManager args({"./filetool", "format", "/dev/sda"});
    ArgParser parser;

    ASSERT_THROW(parser.parseArgs(args.argc(), args.argv()), std::runtime_error);
}

TEST(ArgParserTest, ParseUnknownOption) {
    ArgvManager args({"./filetool", "info", "a.txt", "--bogus"});
    ArgParser parser;

    ASSERT_THROW(parser.parseArgs(args.argc(), args.argv()), std::exception);
}

TEST(ArgParserTest, ParseHelp) {
    ArgvManager flag({"./filetool", "-h"});
    ASSERT_EQ(ArgParser().parseArgs(flag.argc(), flag.argv()).command, "help");

    ArgvManager command({"./filetool", "help"});
    ASSERT_EQ(ArgParser().parseArgs(command.argc(), command.argv()).command, "help");

    ASSERT_NE(ArgParser().help().find("filetool"), std::string::npos);
}
