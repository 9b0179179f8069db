#ifndef PIIMASK_VAULT_TOKEN_STORE_HPP
#define PIIMASK_VAULT_TOKEN_STORE_HPP

#include <string>
#include <vector>
#include <unordered_map>
#include <optional>
#include <functional>
#include <cstddef>

/**
 * @file token_store.hpp
 * @brief Storage plug-in behind the TokenVault: label -> original value.
 *
 * DESIGN GOALS:
 *   - The vault only needs point lookup, point insert, and a full enumeration
 *     (to rebuild its indexes and to run the reference linear scan).
 *   - Enumeration visits entries in insertion order, so the "first match" of a
 *     linear scan is well defined for every backend.
 *   - InMemoryTokenStore is the default. SqliteTokenStore (sqlite_token_store.hpp)
 *     keeps a session's vault on disk so masking and unmasking can run in
 *     different processes.
 */

namespace piimask {
namespace vault {

class TokenStore
{
public:
    using Visitor = std::function<void(const std::string &label, const std::string &value)>;

    virtual ~TokenStore() = default;

    virtual std::optional<std::string> get(const std::string &label) const = 0;

    /// Insert or overwrite. The vault itself never overwrites an existing label.
    virtual void set(const std::string &label, const std::string &value) = 0;

    /// Visit every (label, value) pair in insertion order.
    virtual void forEach(const Visitor &visit) const = 0;

    virtual std::size_t size() const = 0;
};

/**
 * @class InMemoryTokenStore
 * @brief Hash map for lookups plus an insertion-ordered label list for enumeration.
 */
class InMemoryTokenStore : public TokenStore
{
public:
    InMemoryTokenStore() = default;

    std::optional<std::string> get(const std::string &label) const override
    {
        auto it = entries_.find(label);
        if (it == entries_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    void set(const std::string &label, const std::string &value) override
    {
        auto inserted = entries_.emplace(label, value);
        if (inserted.second) {
            order_.push_back(label);
        } else {
            inserted.first->second = value;
        }
    }

    void forEach(const Visitor &visit) const override
    {
        for (const auto &label : order_) {
            visit(label, entries_.at(label));
        }
    }

    std::size_t size() const override
    {
        return entries_.size();
    }

private:
    std::unordered_map<std::string, std::string> entries_;
    std::vector<std::string> order_;
};

} // namespace vault
} // namespace piimask

#endif // PIIMASK_VAULT_TOKEN_STORE_HPP
