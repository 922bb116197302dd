#ifndef ARG_PARSER_H
#define ARG_PARSER_H

#include <string>
#include <vector>
#include <map>
#include "cxxopts.hpp" // Requires cxxopts dependency

/**
 * @brief Command line parser for the filetool executable.
 *
 * Usage: filetool <command> [path] [options]
 */
class ArgParser {
public:
    /**
     * @brief Structure to hold the result of the parsed arguments.
     */
    struct Arguments {
        std::string command;
        std::map<std::string, std::string> stringArgs;
        std::map<std::string, bool> boolArgs;
        std::map<std::string, int> intArgs;
    };

    /**
     * @brief Registers the positional command/path and every option.
     */
    ArgParser();

    /**
     * @brief Parses the raw command line arguments.
     * @param argc The argument count.
     * @param argv The argument values.
     * @return The Arguments struct containing the parsed values.
     * @throws std::exception on unknown commands, unknown options or
     * missing required options.
     */
    Arguments parseArgs(int argc, char** argv);

    std::string help() const;

private:
    cxxopts::Options m_options;

    /**
     * @brief Verifies the options each command cannot run without.
     */
    void checkRequired(const cxxopts::ParseResult& result, const std::string& command) const;

    /**
     * @brief Extracts and maps results from cxxopts::ParseResult into Arguments structure.
     */
    Arguments mapResults(const cxxopts::ParseResult& result, const std::string& command) const;
};

#endif // ARG_PARSER_H
