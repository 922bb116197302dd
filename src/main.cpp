#include "core/PathEntry.h"
#include "core/Log.h"
#include "utils/ArgParser.h"
#include <iostream>

using namespace FileToolkit;

namespace {

void printInfo(const PathEntry& entry) {
    auto yesNo = [](bool value) { return value ? "yes" : "no"; };
    auto mime = entry.getMimeType();

    std::cout << "path:          " << entry << "\n"
              << "directory:     " << entry.getDirectory() << "\n"
              << "name:          " << entry.getName() << "\n"
              << "extension:     " << entry.getExtension() << "\n"
              << "exists:        " << yesNo(entry.exists()) << "\n"
              << "file:          " << yesNo(entry.isFile()) << "\n"
              << "directory:     " << yesNo(entry.isDirectory()) << "\n"
              << "readable:      " << yesNo(entry.canRead()) << "\n"
              << "writable:      " << yesNo(entry.canWrite()) << "\n"
              << "executable:    " << yesNo(entry.canExecute()) << "\n"
              << "size:          " << entry.length() << "\n"
              << "last modified: " << entry.lastModified() << "\n"
              << "mime type:     " << (mime ? *mime : "unknown") << std::endl;
}

// Runs one command; the return value becomes the exit status
bool run(ArgParser::Arguments& args) {
    PathEntry entry(args.stringArgs["path"]);
    const std::string& command = args.command;
    bool recursive = args.boolArgs["recursive"];
    bool overwrite = args.boolArgs["overwrite"];

    if (command == "info") {
        printInfo(entry);
        return entry.exists();
    }

    if (command == "list") {
        const std::string& type = args.stringArgs["type"];
        bool showHidden = args.boolArgs["all"];
        std::vector<std::string> names;
        if (type == "files") names = entry.listFiles(recursive, showHidden);
        else if (type == "directories") names = entry.listDirectories(recursive, showHidden);
        else names = entry.listAll(recursive, showHidden);

        for (const auto& name : names) {
            std::cout << name << "\n";
        }
        std::cout.flush();
        return entry.isDirectory();
    }

    if (command == "read") {
        std::cout << entry.read();
        std::cout.flush();
        return true;
    }
    if (command == "write") {
        entry.write(args.stringArgs["content"]);
        return true;
    }
    if (command == "append") {
        entry.append(args.stringArgs["content"]);
        return true;
    }

    if (command == "touch") return entry.makeFile(overwrite);
    if (command == "mkdir") return entry.makeDirectory(recursive, static_cast<mode_t>(args.intArgs["mode"]));
    if (command == "rmdir") return entry.removeDirectory(recursive);
    if (command == "rm") return entry.removeFile();

    if (command == "move" || command == "rename") {
        bool moved = command == "move"
            ? entry.move(args.stringArgs["destination"], overwrite)
            : entry.rename(args.stringArgs["name"], overwrite);
        if (moved) {
            Log::info("Moved to: '" + entry.getPath() + "'.");
        }
        return moved;
    }

    Log::error("unhandled command '" + command + "'.");
    return false;
}

} // namespace

int main(int argc, char* argv[]) {
    ArgParser parser;
    ArgParser::Arguments args;

    try {
        args = parser.parseArgs(argc, argv);
    } catch (const std::exception&) {
        std::cerr << parser.help() << std::endl;
        return 1;
    }

    if (args.command == "help") {
        std::cout << parser.help() << std::endl;
        return 0;
    }

    try {
        return run(args) ? 0 : 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
