#include "ArgParser.h"
#include <iostream>
#include <algorithm>
#include <stdexcept>

using namespace std;

namespace {

const vector<string> COMMANDS = {
    "info", "list", "read", "write", "append", "touch",
    "mkdir", "move", "rename", "rmdir", "rm", "help"
};

const vector<string> LIST_TYPES = { "all", "files", "directories" };

bool isOneOf(const string& value, const vector<string>& choices) {
    return find(choices.begin(), choices.end(), value) != choices.end();
}

// Octal permission string such as "775" or "0700"
int parseMode(const string& text) {
    size_t consumed = 0;
    int mode = 0;
    try {
        mode = stoi(text, &consumed, 8);
    } catch (const std::exception&) {
        throw runtime_error("Invalid mode: " + text);
    }
    if (consumed != text.size() || mode < 0 || mode > 07777) {
        throw runtime_error("Invalid mode: " + text);
    }
    return mode;
}

bool requireOption(const cxxopts::ParseResult& result, const string& name, const string& command) {
    if (!result.count(name)) {
        cerr << "Argument error: --" << name << " is required for command '" << command << "'" << endl;
        return false;
    }
    return true;
}

} // namespace

// --- ArgParser Implementation ---

ArgParser::ArgParser()
    : m_options("filetool", "Inspect and manipulate files and directories.")
{
    m_options.positional_help("<command> [path]");
    m_options.add_options()
        ("command", "Command to execute (info, list, read, write, append, touch, mkdir, move, rename, rmdir, rm, help)", cxxopts::value<string>())
        ("p,path", "The file or directory to operate on", cxxopts::value<string>())
        ("d,destination", "Where to move the entry to (move)", cxxopts::value<string>())
        ("n,name", "The new name of the entry (rename)", cxxopts::value<string>())
        ("c,content", "The content to write or append", cxxopts::value<string>())
        ("r,recursive", "Recurse into subdirectories (list, mkdir, rmdir)", cxxopts::value<bool>()->default_value("false"))
        ("a,all", "Show hidden entries (list)", cxxopts::value<bool>()->default_value("false"))
        ("t,type", "Entries to list: all|files|directories", cxxopts::value<string>()->default_value("all"))
        ("f,overwrite", "Replace an existing destination (touch, move, rename)", cxxopts::value<bool>()->default_value("false"))
        ("m,mode", "Octal permissions of a new directory (mkdir)", cxxopts::value<string>()->default_value("775"))
        ("h,help", "Display this help menu");
    m_options.parse_positional({"command", "path"});
}

std::string ArgParser::help() const {
    return m_options.help();
}

ArgParser::Arguments ArgParser::parseArgs(int argc, char** argv) {
    try {
        auto result = m_options.parse(argc, argv);

        if (result.count("help")) {
            Arguments args;
            args.command = "help";
            return args;
        }

        if (!result.count("command")) {
            throw runtime_error("No command specified.");
        }

        string command = result["command"].as<string>();
        if (!isOneOf(command, COMMANDS)) {
            throw runtime_error("Unknown command: " + command);
        }

        checkRequired(result, command);
        return mapResults(result, command);

    } catch (const cxxopts::OptionException& e) {
        cerr << "Error parsing arguments: " << e.what() << endl;
        throw;
    } catch (const std::exception& e) {
        cerr << "Error: " << e.what() << endl;
        throw;
    }
}

void ArgParser::checkRequired(const cxxopts::ParseResult& result, const string& command) const {
    if (command == "help") return;

    bool ok = requireOption(result, "path", command);
    if (command == "move") ok = requireOption(result, "destination", command) && ok;
    if (command == "rename") ok = requireOption(result, "name", command) && ok;
    if (command == "write" || command == "append") ok = requireOption(result, "content", command) && ok;

    if (!ok) throw runtime_error("Missing required args.");

    if (!isOneOf(result["type"].as<string>(), LIST_TYPES)) {
        throw runtime_error("Unknown list type: " + result["type"].as<string>());
    }
}

ArgParser::Arguments ArgParser::mapResults(const cxxopts::ParseResult& result, const string& command) const {
    Arguments args;
    args.command = command;
    if (command == "help") return args;

    args.stringArgs["path"] = result["path"].as<string>();
    args.stringArgs["destination"] = result.count("destination") ? result["destination"].as<string>() : "";
    args.stringArgs["name"] = result.count("name") ? result["name"].as<string>() : "";
    args.stringArgs["content"] = result.count("content") ? result["content"].as<string>() : "";
    args.stringArgs["type"] = result["type"].as<string>();

    args.boolArgs["recursive"] = result["recursive"].as<bool>();
    args.boolArgs["all"] = result["all"].as<bool>();
    args.boolArgs["overwrite"] = result["overwrite"].as<bool>();

    args.intArgs["mode"] = parseMode(result["mode"].as<string>());

    return args;
}
