#ifndef PIIMASK_UTIL_CONFIG_PARSER_HPP
#define PIIMASK_UTIL_CONFIG_PARSER_HPP

#include <string>
#include <vector>
#include <fstream>
#include <sstream>
#include <istream>
#include <stdexcept>
#include <cstdint>
#include <algorithm>
#include <cctype>
#include <mutex>
#include "mask_config.hpp"
#include "logger.hpp"

/**
 * @file config_parser.hpp
 * @brief Reads piimask's MaskConfig from a plain "key=value" file.
 *
 * DESIGN GOALS:
 *   - One setting per line, '#' starts a comment line, blank lines are ignored.
 *   - known_keys / masked_keys take comma-separated key names and may be repeated;
 *     each occurrence appends to the list.
 *   - A missing file is not an error (defaults are kept); a malformed line or an
 *     invalid value throws std::runtime_error; an unrecognized key is logged.
 *
 * USAGE:
 *   @code
 *   piimask::config::MaskConfig cfg;
 *   piimask::util::ConfigParser parser(cfg);
 *   parser.loadFromFile("piimask.conf");
 *   @endcode
 *
 * Example file:
 *   @code
 *   # site vocabulary
 *   masked_keys = SSN_NUMBER, PASSPORT
 *   known_keys  = BATCH_ID
 *   vault_backend = sqlite
 *   vault_path = /var/lib/piimask/session.vault
 *   log_level = warn
 *   @endcode
 */

namespace piimask {
namespace util {

class ConfigParser
{
public:
    ConfigParser(piimask::config::MaskConfig &config)
        : config_(config)
    {
    }

    /**
     * @brief Read the given file, parse line by line, storing recognized keys in config_.
     * @throw std::runtime_error if a line is malformed or a value is invalid.
     */
    inline void loadFromFile(const std::string &filepath)
    {
        std::ifstream inFile(filepath);
        if (!inFile.is_open()) {
            piimask::util::logger::warn("ConfigParser: File not found: " + filepath);
            return;
        }

        piimask::util::logger::info("ConfigParser: Loading config from " + filepath);
        loadFromStream(inFile);
        piimask::util::logger::info("ConfigParser: Config loaded.");
    }

    inline void loadFromStream(std::istream &in)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        std::string line;
        std::size_t lineNo = 0;
        while (std::getline(in, line)) {
            ++lineNo;
            trim(line);

            if (line.empty() || line[0] == '#') {
                continue;
            }

            auto pos = line.find('=');
            if (pos == std::string::npos) {
                throw std::runtime_error("ConfigParser: invalid line " + std::to_string(lineNo)
                                         + " (no '='): " + line);
            }
            std::string key = line.substr(0, pos);
            std::string val = line.substr(pos + 1);
            trim(key);
            trim(val);

            applyKeyValue(key, val);
        }
    }

private:
    piimask::config::MaskConfig &config_;
    std::mutex mutex_;

    inline void applyKeyValue(const std::string &key, const std::string &val)
    {
        if (key == "known_keys") {
            auto keys = splitList(val);
            config_.knownKeys.insert(config_.knownKeys.end(), keys.begin(), keys.end());
            piimask::util::logger::debug("ConfigParser: " + std::to_string(keys.size())
                                         + " known keys added");
        }
        else if (key == "masked_keys") {
            auto keys = splitList(val);
            config_.maskedKeys.insert(config_.maskedKeys.end(), keys.begin(), keys.end());
            piimask::util::logger::debug("ConfigParser: " + std::to_string(keys.size())
                                         + " masked keys added");
        }
        else if (key == "max_recursion_depth") {
            config_.maxRecursionDepth = parseUInt(val);
        }
        else if (key == "vault_backend") {
            if (val != "memory" && val != "sqlite") {
                throw std::runtime_error("ConfigParser: vault_backend must be 'memory' or 'sqlite', got '"
                                         + val + "'");
            }
            config_.vaultBackend = val;
        }
        else if (key == "vault_path") {
            config_.vaultPath = val;
        }
        else if (key == "lookup_mode") {
            if (val != "index" && val != "scan") {
                throw std::runtime_error("ConfigParser: lookup_mode must be 'index' or 'scan', got '"
                                         + val + "'");
            }
            config_.lookupMode = val;
        }
        else if (key == "log_level") {
            // validate now so a typo fails at load time
            piimask::util::logger::parseLogLevel(val);
            config_.logLevel = val;
        }
        else if (key == "log_file") {
            config_.logFile = val;
        }
        else if (key == "debug") {
            config_.debug = parseBool(val);
        }
        else {
            piimask::util::logger::warn("ConfigParser: Unrecognized key '" + key + "'");
        }
    }

    static void trim(std::string &s)
    {
        static const std::string whitespace = " \t\r\n";
        auto pos = s.find_first_not_of(whitespace);
        if (pos != std::string::npos) {
            s.erase(0, pos);
        }
        else {
            s.clear();
            return;
        }
        pos = s.find_last_not_of(whitespace);
        if (pos != std::string::npos) {
            s.erase(pos + 1);
        }
    }

    static std::vector<std::string> splitList(const std::string &val)
    {
        std::vector<std::string> items;
        std::stringstream ss(val);
        std::string item;
        while (std::getline(ss, item, ',')) {
            trim(item);
            if (!item.empty()) {
                items.push_back(item);
            }
        }
        return items;
    }

    static uint64_t parseUInt(const std::string &val)
    {
        try {
            size_t idx = 0;
            uint64_t n = std::stoull(val, &idx, 10);
            if (idx != val.size() || val[0] == '-') {
                throw std::runtime_error("Non-numeric suffix");
            }
            return n;
        }
        catch (const std::exception &ex) {
            throw std::runtime_error("ConfigParser: parseUInt failed on '" + val + "': " + ex.what());
        }
    }

    static bool parseBool(const std::string &val)
    {
        std::string lower(val);
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") {
            return true;
        }
        if (lower == "false" || lower == "0" || lower == "no" || lower == "off") {
            return false;
        }
        throw std::runtime_error("ConfigParser: expected a boolean, got '" + val + "'");
    }
};

} // namespace util
} // namespace piimask

#endif // PIIMASK_UTIL_CONFIG_PARSER_HPP
