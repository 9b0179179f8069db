#ifndef PIIMASK_CLI_COMMAND_LINE_HPP
#define PIIMASK_CLI_COMMAND_LINE_HPP

#include <string>
#include <stdexcept>

/**
 * @file command_line.hpp
 * @brief Argument parsing for the piimask tool:
 *
 *     piimask mask   <input.json> [-c config] [-o output.json]
 *     piimask unmask <input.txt>  [-c config]
 *     piimask demo   <input.json> [-c config]
 *
 * Everything is validated here, before any configuration is read or vault opened.
 */

namespace piimask {
namespace cli {

struct CommandLine
{
    std::string command;
    std::string inputPath;
    std::string configPath;
    std::string outputPath;
};

inline bool isKnownCommand(const std::string &command)
{
    return command == "mask" || command == "unmask" || command == "demo";
}

/**
 * @throw std::runtime_error on a missing argument, an unknown command or option,
 *        or -o with a command other than mask.
 */
inline CommandLine parseCommandLine(int argc, const char *const *argv)
{
    if (argc < 3) {
        throw std::runtime_error("CommandLine: expected a command and an input path");
    }

    CommandLine cmd;
    cmd.command = argv[1];
    cmd.inputPath = argv[2];
    if (!isKnownCommand(cmd.command)) {
        throw std::runtime_error("CommandLine: unknown command: " + cmd.command);
    }

    for (int i = 3; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            cmd.configPath = argv[++i];
        } else if ((arg == "-o" || arg == "--output") && i + 1 < argc) {
            cmd.outputPath = argv[++i];
        } else {
            throw std::runtime_error("CommandLine: unexpected argument: " + arg);
        }
    }

    if (!cmd.outputPath.empty() && cmd.command != "mask") {
        throw std::runtime_error("CommandLine: -o is only valid with mask");
    }
    return cmd;
}

} // namespace cli
} // namespace piimask

#endif // PIIMASK_CLI_COMMAND_LINE_HPP
