#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

#include "cli/command_line.hpp"
#include "codec/json_codec.hpp"
#include "config/mask_config.hpp"
#include "masking/mask_session.hpp"
#include "util/config_parser.hpp"
#include "util/logger.hpp"

namespace {

void printUsage() {
    std::cerr << "usage:\n"
              << "  piimask mask   <input.json> [-c config] [-o output.json]\n"
              << "  piimask unmask <input.txt>  [-c config]\n"
              << "  piimask demo   <input.json> [-c config]\n";
}

std::string readTextFile(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("cannot open input file: " + path);
    }
    std::ostringstream buf;
    buf << in.rdbuf();
    return buf.str();
}

} // anonymous namespace

int main(int argc, char** argv) {
    using piimask::util::logger::Logger;

    piimask::cli::CommandLine cmd;
    try {
        cmd = piimask::cli::parseCommandLine(argc, argv);
    } catch (const std::runtime_error& ex) {
        Logger::getInstance().error(std::string("[main] ") + ex.what());
        printUsage();
        return 1;
    }
    const std::string& command = cmd.command;
    const std::string& inputPath = cmd.inputPath;
    const std::string& configPath = cmd.configPath;
    const std::string& outputPath = cmd.outputPath;

    try {
        // 1. Parse configuration
        piimask::config::MaskConfig config;
        if (!configPath.empty()) {
            piimask::util::ConfigParser parser(config);
            parser.loadFromFile(configPath);
        }

        Logger::getInstance().setLogLevel(
            config.debug ? piimask::util::logger::LogLevel::DEBUG
                         : piimask::util::logger::parseLogLevel(config.logLevel));
        if (!config.logFile.empty()) {
            Logger::getInstance().enableFileOutput(config.logFile, true);
        }

        // 2. Open the session (and its vault)
        piimask::masking::MaskSession session(config);

        if (command == "mask" || command == "demo") {
            piimask::document::Document input = piimask::codec::readJsonFile(inputPath);
            piimask::document::Document masked = session.maskDocument(input);

            if (command == "mask" && !outputPath.empty()) {
                piimask::codec::writeJsonFile(masked, outputPath);
                Logger::getInstance().info("[main] masked document written to " + outputPath);
            } else {
                std::string maskedText = piimask::codec::renderJson(masked);
                if (command == "demo") {
                    std::cout << "   ###  MASKED PII:\n";
                }
                std::cout << maskedText << "\n";

                if (command == "demo") {
                    std::cout << "\n\n   ###  UNMASKED PII:\n";
                    std::cout << session.unmaskText(maskedText) << "\n";
                }
            }

            Logger::getInstance().info("[main] " + session.describeReport());
        } else {
            if (config.vaultBackend == "memory") {
                Logger::getInstance().warn(
                    "[main] unmask with an in-memory vault has no labels to substitute; "
                    "set vault_backend=sqlite in the config");
            }
            std::cout << session.unmaskText(readTextFile(inputPath));
        }
    } catch (const std::exception& ex) {
        Logger::getInstance().error(std::string("[main] ") + ex.what());
        return 1;
    }

    return 0;
}
