#ifndef PIIMASK_VAULT_TOKEN_VAULT_HPP
#define PIIMASK_VAULT_TOKEN_VAULT_HPP

#include <string>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <cstdint>
#include <cctype>
#include <stdexcept>
#include "token_store.hpp"
#include "../util/logger.hpp"

/**
 * @file token_vault.hpp
 * @brief Owns the bijection between synthetic labels ("EMAIL_1") and the original values.
 *
 * DESIGN GOALS:
 *   - maskValue(prefix, value) returns the existing label when this exact prefix already
 *     maps to this exact value; otherwise mints "{PREFIX}_{N}" with N one past the
 *     prefix's previous counter.
 *   - Reuse is scoped to the prefix. "x" under EMAIL and "x" under HOME get two labels.
 *   - Append-only: a label, once stored, is never reassigned or removed.
 *   - Search-then-insert runs under the vault mutex, so one vault can be shared by
 *     several masking threads.
 *   - Dedup uses a per-prefix value->label index. LookupMode::LINEAR_SCAN walks the
 *     store instead, and is the reference the index is checked against.
 *   - Opening a vault over a non-empty store (e.g. a SqliteTokenStore from an earlier
 *     run) rebuilds counters and index from the stored labels.
 *
 * USAGE EXAMPLE:
 *   @code
 *   piimask::vault::TokenVault vault;
 *   std::string a = vault.maskValue("EMAIL", "a@b.com");   // "EMAIL_1"
 *   std::string b = vault.maskValue("EMAIL", "a@b.com");   // "EMAIL_1" again
 *   auto original = vault.get("EMAIL_1");                  // "a@b.com"
 *   @endcode
 */

namespace piimask {
namespace vault {

enum class LookupMode {
    INDEX = 0,
    LINEAR_SCAN
};

/**
 * @struct LabelParts
 * @brief A label split at its last underscore: PREFIX and counter.
 */
struct LabelParts
{
    std::string prefix;
    uint64_t counter;
};

class TokenVault
{
public:
    /**
     * @brief Construct an empty, in-memory vault.
     */
    TokenVault()
        : TokenVault(std::make_shared<InMemoryTokenStore>())
    {
    }

    /**
     * @brief Construct a vault over the given store, rebuilding counters from its contents.
     * @throw std::runtime_error if store is null.
     */
    explicit TokenVault(std::shared_ptr<TokenStore> store, LookupMode mode = LookupMode::INDEX)
        : store_(std::move(store)),
          mode_(mode)
    {
        if (!store_) {
            throw std::runtime_error("TokenVault: token store must not be null.");
        }
        rebuildIndex();
    }

    TokenVault(const TokenVault &) = delete;
    TokenVault &operator=(const TokenVault &) = delete;

    /**
     * @brief Return the label for (keyPrefix, value), minting a new one if needed.
     * @param keyPrefix Field key; normalized with normalizePrefix().
     * @param value The original (sensitive) value.
     * @param reused Optional out-flag: true if an existing label was returned.
     */
    inline std::string maskValue(const std::string &keyPrefix,
                                 const std::string &value,
                                 bool *reused = nullptr)
    {
        const std::string prefix = normalizePrefix(keyPrefix);

        std::lock_guard<std::mutex> lock(mutex_);

        std::optional<std::string> existing = (mode_ == LookupMode::INDEX)
            ? lookupIndex(prefix, value)
            : lookupScan(prefix, value);

        if (existing) {
            if (reused) {
                *reused = true;
            }
            return *existing;
        }

        std::string label;
        do {
            label = prefix + "_" + std::to_string(++counters_[prefix]);
        } while (store_->get(label));

        store_->set(label, value);
        valueIndex_[prefix].emplace(value, label);

        if (label == value) {
            piimask::util::logger::error("TokenVault: NOT MASKED: minted label " + label
                                         + " equals the value it replaces");
        }

        if (reused) {
            *reused = false;
        }
        return label;
    }

    /**
     * @brief Look up the original value for a label. No side effects.
     */
    inline std::optional<std::string> get(const std::string &label) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return store_->get(label);
    }

    inline bool contains(const std::string &label) const
    {
        return get(label).has_value();
    }

    inline std::size_t size() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return store_->size();
    }

    /**
     * @brief Highest counter minted (or loaded) for a prefix; 0 if none.
     */
    inline uint64_t counter(const std::string &keyPrefix) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counters_.find(normalizePrefix(keyPrefix));
        return it == counters_.end() ? 0 : it->second;
    }

    /**
     * @brief Reference dedup search: first stored label, in insertion order, whose
     *        prefix equals keyPrefix and whose value equals value.
     */
    inline std::optional<std::string> findLabelByScan(const std::string &keyPrefix,
                                                      const std::string &value) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return lookupScan(normalizePrefix(keyPrefix), value);
    }

    inline std::optional<std::string> findLabelByIndex(const std::string &keyPrefix,
                                                       const std::string &value) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return lookupIndex(normalizePrefix(keyPrefix), value);
    }

    LookupMode lookupMode() const { return mode_; }

    /**
     * @brief Map a field key to a label prefix: uppercase, with every character outside
     *        [A-Z_] replaced by '_', so that minted labels always match the unmask grammar.
     *        Keys differing only outside [A-Z_] ("E-MAIL", "E_MAIL") share a prefix.
     */
    static std::string normalizePrefix(const std::string &key)
    {
        if (key.empty()) {
            return "_";
        }
        std::string prefix;
        prefix.reserve(key.size());
        for (unsigned char c : key) {
            char up = static_cast<char>(std::toupper(c));
            prefix.push_back((up >= 'A' && up <= 'Z') || up == '_' ? up : '_');
        }
        return prefix;
    }

    /**
     * @brief Split "PREFIX_N" at its last underscore.
     * @return std::nullopt if there is no prefix or N is not a positive decimal number.
     */
    static std::optional<LabelParts> splitLabel(const std::string &label)
    {
        auto pos = label.rfind('_');
        if (pos == std::string::npos || pos == 0 || pos + 1 >= label.size()) {
            return std::nullopt;
        }
        for (std::size_t i = pos + 1; i < label.size(); ++i) {
            if (!std::isdigit(static_cast<unsigned char>(label[i]))) {
                return std::nullopt;
            }
        }

        LabelParts parts;
        parts.prefix = label.substr(0, pos);
        try {
            parts.counter = std::stoull(label.substr(pos + 1));
        } catch (const std::out_of_range &) {
            return std::nullopt;
        }
        if (parts.counter == 0) {
            return std::nullopt;
        }
        return parts;
    }

private:
    std::optional<std::string> lookupIndex(const std::string &prefix, const std::string &value) const
    {
        auto byPrefix = valueIndex_.find(prefix);
        if (byPrefix == valueIndex_.end()) {
            return std::nullopt;
        }
        auto hit = byPrefix->second.find(value);
        if (hit == byPrefix->second.end()) {
            return std::nullopt;
        }
        return hit->second;
    }

    std::optional<std::string> lookupScan(const std::string &prefix, const std::string &value) const
    {
        std::optional<std::string> found;
        store_->forEach([&](const std::string &label, const std::string &stored) {
            if (found || stored != value) {
                return;
            }
            auto parts = splitLabel(label);
            if (parts && parts->prefix == prefix) {
                found = label;
            }
        });
        return found;
    }

    void rebuildIndex()
    {
        std::size_t skipped = 0;
        store_->forEach([&](const std::string &label, const std::string &value) {
            auto parts = splitLabel(label);
            if (!parts) {
                ++skipped;
                return;
            }
            uint64_t &ctr = counters_[parts->prefix];
            if (parts->counter > ctr) {
                ctr = parts->counter;
            }
            valueIndex_[parts->prefix].emplace(value, label);
        });

        if (skipped > 0) {
            piimask::util::logger::warn("TokenVault: ignored " + std::to_string(skipped)
                                        + " stored entries whose labels are not PREFIX_N");
        }
        if (!counters_.empty()) {
            piimask::util::logger::info("TokenVault: loaded " + std::to_string(store_->size())
                                        + " labels across " + std::to_string(counters_.size())
                                        + " prefixes");
        }
    }

    std::shared_ptr<TokenStore> store_;
    LookupMode mode_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, uint64_t> counters_;
    std::unordered_map<std::string, std::unordered_map<std::string, std::string>> valueIndex_;
};

} // namespace vault
} // namespace piimask

#endif // PIIMASK_VAULT_TOKEN_VAULT_HPP
