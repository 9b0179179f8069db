#ifndef PIIMASK_CONFIG_MASK_CONFIG_HPP
#define PIIMASK_CONFIG_MASK_CONFIG_HPP

#include <string>
#include <vector>
#include <cstdint>

/**
 * @file mask_config.hpp
 * @brief Deployment settings for a masking session.
 *
 * USAGE:
 *   - This struct can be populated either manually or through config_parser.hpp
 *   - Extends the default key vocabulary, picks the vault backend, tunes the walker
 *     and sets up logging.
 */

namespace piimask {
namespace config {

/**
 * @struct MaskConfig
 * @brief Holds the settings of one masking session:
 *   - knownKeys / maskedKeys: added to the classifier's default sets.
 *   - maxRecursionDepth: walker depth before it switches to an explicit stack.
 *   - vaultBackend / vaultPath: "memory" (default) or "sqlite" with a database file.
 *   - lookupMode: "index" (default) or "scan" for the vault's dedup search.
 *   - logLevel / logFile / debug: logging setup.
 */
struct MaskConfig
{
    /**
     * @brief Construct a new MaskConfig with defaults:
     *   maxRecursionDepth = 64
     *   vaultBackend = "memory"
     *   vaultPath = "./piimask_vault.sqlite"
     *   lookupMode = "index"
     *   logLevel = "info"
     */
    MaskConfig()
        : maxRecursionDepth(64),
          vaultBackend("memory"),
          vaultPath("./piimask_vault.sqlite"),
          lookupMode("index"),
          logLevel("info"),
          debug(false)
    {
    }

    /// Extra keys whose values are never masked.
    std::vector<std::string> knownKeys;

    /// Extra keys whose values are always masked.
    std::vector<std::string> maskedKeys;

    uint64_t maxRecursionDepth;

    /// "memory" or "sqlite".
    std::string vaultBackend;

    /// SQLite database file, used when vaultBackend == "sqlite".
    std::string vaultPath;

    /// "index" or "scan".
    std::string lookupMode;

    std::string logLevel;

    /// Empty means console only.
    std::string logFile;

    bool debug;
};

} // namespace config
} // namespace piimask

#endif // PIIMASK_CONFIG_MASK_CONFIG_HPP
