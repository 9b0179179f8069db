#ifndef PIIMASK_TEST_UNIT_TEST_TOKEN_VAULT_HPP
#define PIIMASK_TEST_UNIT_TEST_TOKEN_VAULT_HPP

#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include "../../src/vault/token_store.hpp"
#include "../../src/vault/token_vault.hpp"

/**
 * @file test_token_vault.hpp
 * @brief Tests TokenVault allocation, reuse, prefix isolation, and the agreement
 *        between the indexed lookup and the reference linear scan.
 */

namespace piimask {
namespace test {

inline bool runTokenVaultTests()
{
    using namespace piimask::vault;

    bool allPassed = true;
    std::cout << "[test_token_vault] Starting TokenVault tests...\n";

    auto check = [&](bool ok, const std::string &what) {
        if (!ok) {
            std::cerr << "[test_token_vault] FAILED: " << what << "\n";
            allPassed = false;
        }
    };

    // 1) Mint, reuse, and monotonic counters
    {
        TokenVault vault;
        check(vault.size() == 0, "new vault is empty");
        check(vault.maskValue("EMAIL", "a@b.com") == "EMAIL_1", "first EMAIL label");
        check(vault.maskValue("EMAIL", "c@d.com") == "EMAIL_2", "second EMAIL label");
        check(vault.maskValue("EMAIL", "a@b.com") == "EMAIL_1", "reuse of EMAIL_1");
        check(vault.counter("EMAIL") == 2, "reuse does not advance the counter");
        check(vault.size() == 2, "vault holds two labels");
        check(vault.get("EMAIL_2") == std::optional<std::string>("c@d.com"), "get EMAIL_2");
        check(!vault.get("EMAIL_3").has_value(), "EMAIL_3 was never minted");
    }

    // 2) Prefix isolation: same value under two prefixes gets two labels
    {
        TokenVault vault;
        std::string a = vault.maskValue("HOME", "same");
        std::string b = vault.maskValue("MAILING", "same");
        check(a == "HOME_1" && b == "MAILING_1", "isolated labels per prefix");

        // a later HOME occurrence reuses HOME_1 even though MAILING_1 was stored after it
        bool reused = false;
        check(vault.maskValue("HOME", "same", &reused) == "HOME_1" && reused, "HOME reuse");
        check(vault.maskValue("MAILING", "same", &reused) == "MAILING_1" && reused, "MAILING reuse");
    }

    // 3) A prefix that starts another prefix does not share labels
    {
        TokenVault vault;
        vault.maskValue("EMAIL_ADDR", "x@y.z");
        check(vault.maskValue("EMAIL", "x@y.z") == "EMAIL_1", "EMAIL does not reuse EMAIL_ADDR_1");
    }

    // 4) Prefix normalization
    {
        TokenVault vault;
        check(vault.maskValue("email", "a@b.com") == "EMAIL_1", "prefix uppercased");
        check(vault.maskValue("EMAIL", "a@b.com") == "EMAIL_1", "uppercased prefix shares label");
        check(TokenVault::normalizePrefix("phone-2") == "PHONE__", "non [A-Z_] characters replaced");
        check(TokenVault::normalizePrefix("") == "_", "empty key");

        // keys that differ only outside [A-Z_] collapse to one prefix and share labels
        check(vault.maskValue("E-MAIL", "c@d.com") == "E_MAIL_1", "E-MAIL minted under E_MAIL");
        check(vault.maskValue("E_MAIL", "c@d.com") == "E_MAIL_1", "E_MAIL reuses the E-MAIL label");
        check(vault.maskValue("e.mail", "e@f.com") == "E_MAIL_2", "e.mail shares the E_MAIL counter");
        check(vault.counter("E-MAIL") == 2 && vault.counter("E_MAIL") == 2, "one counter for both keys");
    }

    // 5) Label splitting
    {
        auto parts = TokenVault::splitLabel("ENTITY_NAME_12");
        check(parts && parts->prefix == "ENTITY_NAME" && parts->counter == 12, "split ENTITY_NAME_12");
        check(!TokenVault::splitLabel("EMAIL"), "no underscore");
        check(!TokenVault::splitLabel("EMAIL_"), "no digits");
        check(!TokenVault::splitLabel("EMAIL_1a"), "trailing garbage");
        check(!TokenVault::splitLabel("_1"), "empty prefix");
        check(!TokenVault::splitLabel("EMAIL_0"), "zero counter");
    }

    // 6) Minted label equal to its plaintext is kept
    {
        TokenVault vault;
        std::string label = vault.maskValue("X", "X_1");
        check(label == "X_1", "pathological label minted");
        check(vault.get("X_1") == std::optional<std::string>("X_1"), "pathological mapping stored");
    }

    // 7) Index and linear scan agree on a mixed workload
    {
        TokenVault indexed(std::make_shared<InMemoryTokenStore>(), LookupMode::INDEX);
        TokenVault scanned(std::make_shared<InMemoryTokenStore>(), LookupMode::LINEAR_SCAN);

        const std::vector<std::pair<std::string, std::string>> ops = {
            {"EMAIL", "a"}, {"HOME", "a"}, {"EMAIL", "b"}, {"EMAIL", "a"},
            {"HOME", "b"}, {"HOME", "a"}, {"EMAIL_ADDR", "a"}, {"EMAIL", "a"},
            {"DOB", "1980-01-01"}, {"DOB", "1980-01-01"}, {"HOME", "c"}, {"EMAIL", "c"},
        };
        for (const auto &op : ops) {
            std::string l1 = indexed.maskValue(op.first, op.second);
            std::string l2 = scanned.maskValue(op.first, op.second);
            check(l1 == l2, "index/scan agree on " + op.first + ":" + op.second);
            check(indexed.findLabelByScan(op.first, op.second) == indexed.findLabelByIndex(op.first, op.second),
                  "oracle agrees for " + op.first + ":" + op.second);
        }
        check(indexed.size() == scanned.size(), "same vault size");
    }

    // 8) Reopening over a populated store continues the counters
    {
        auto store = std::make_shared<InMemoryTokenStore>();
        store->set("EMAIL_1", "a@b.com");
        store->set("EMAIL_7", "c@d.com");
        store->set("not-a-label", "ignored");

        TokenVault vault(store);
        check(vault.counter("EMAIL") == 7, "counter rebuilt from max label");
        check(vault.maskValue("EMAIL", "c@d.com") == "EMAIL_7", "stored mapping reused");
        check(vault.maskValue("EMAIL", "e@f.com") == "EMAIL_8", "allocation continues after 7");
    }

    // 9) A null store is rejected
    {
        bool threw = false;
        try {
            TokenVault vault(nullptr);
        } catch (const std::runtime_error &) {
            threw = true;
        }
        check(threw, "null store throws");
    }

    if (allPassed) {
        std::cout << "[test_token_vault] All tests PASSED.\n";
    } else {
        std::cerr << "[test_token_vault] Some tests FAILED.\n";
    }
    return allPassed;
}

} // namespace test
} // namespace piimask

#endif // PIIMASK_TEST_UNIT_TEST_TOKEN_VAULT_HPP
