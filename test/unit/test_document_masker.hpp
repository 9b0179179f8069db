#ifndef PIIMASK_TEST_UNIT_TEST_DOCUMENT_MASKER_HPP
#define PIIMASK_TEST_UNIT_TEST_DOCUMENT_MASKER_HPP

#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include "../../src/document/document.hpp"
#include "../../src/masking/document_masker.hpp"
#include "../../src/masking/key_classifier.hpp"
#include "../../src/vault/token_vault.hpp"

/**
 * @file test_document_masker.hpp
 * @brief Tests the walker rules: containers, key/value sites, inline records, scalars,
 *        and the explicit-stack path for deep documents.
 */

namespace piimask {
namespace test {

inline bool runDocumentMaskerTests()
{
    using namespace piimask::masking;
    using piimask::document::Array;
    using piimask::document::Document;
    using piimask::document::Null;
    using piimask::vault::TokenVault;

    bool allPassed = true;
    std::cout << "[test_document_masker] Starting DocumentMasker tests...\n";

    auto check = [&](bool ok, const std::string &what) {
        if (!ok) {
            std::cerr << "[test_document_masker] FAILED: " << what << "\n";
            allPassed = false;
        }
    };

    KeyClassifier classifier;

    // 1) Key/value rules
    {
        TokenVault vault;
        DocumentMasker masker(classifier, vault);

        Document in = Document::object({
            {"ENTITY_ID", Document(1)},
            {"ENTITY_NAME", Document("Robert Smith")},
            {"MATCH_KEY", Document("+NAME+ADDRESS")},
            {"FOO", Document("bar")},
            {"SCORE", Document(42)},
            {"IS_AMBIGUOUS", Document(false)},
            {"RECORD_ID", Document(1001)},
            {"DOB", Document(Null{})},
        });
        Document out = masker.mask(in);

        check(*out.find("ENTITY_ID") == Document(1), "known integer kept");
        check(*out.find("ENTITY_NAME") == Document("ENTITY_NAME_1"), "masked text replaced");
        check(*out.find("MATCH_KEY") == Document("+NAME+ADDRESS"), "known text kept");
        check(*out.find("FOO") == Document("FOO_1"), "unknown text masked");
        check(*out.find("SCORE") == Document(42), "unknown integer kept");
        check(*out.find("IS_AMBIGUOUS") == Document(false), "known bool kept");
        check(*out.find("RECORD_ID") == Document("RECORD_ID_1"), "masked integer replaced");
        check(vault.get("RECORD_ID_1") == std::optional<std::string>("1001"), "masked integer stored as text");
        check(out.find("DOB")->isNull(), "masked null kept");

        check(masker.report().maskedValues == 3, "three fresh labels");
        check(masker.report().unclassifiedKeys.count("FOO") == 1, "FOO reported as unclassified");
        check(in.find("ENTITY_NAME")->asText() == "Robert Smith", "input untouched");
    }

    // 2) Containers recurse regardless of their key's class
    {
        TokenVault vault;
        DocumentMasker masker(classifier, vault);

        Document in = Document::object({
            {"STATUS", Document::object({{"EMAIL", Document("a@b.com")}})},
            {"ENTITY_ID", Document::array({Document("HOME: 1 Main St")})},
            {"EMPTY", Document(Array())},
        });
        Document out = masker.mask(in);

        check(out.find("STATUS")->find("EMAIL")->asText() == "EMAIL_1", "known container key descended");
        check(out.find("ENTITY_ID")->asArray().at(0) == Document("HOME: HOME_1"), "inline record masked");
        check(out.find("EMPTY")->isArray() && out.find("EMPTY")->asArray().empty(), "empty array kept");
    }

    // 3) Inline records and plain scalars in arrays
    {
        TokenVault vault;
        DocumentMasker masker(classifier, vault);

        Document in = Document::array({
            Document("HOME: 1515 Adela Ln Las Vegas NV 89132"),
            Document("STATUS: ACTIVE"),
            Document("just words"),
            Document(7),
            Document(true),
            Document(Null{}),
            Document("HOME: 1515 Adela Ln Las Vegas NV 89132"),
        });
        Document out = masker.mask(in);
        const Array &items = out.asArray();

        check(items.size() == 7, "length preserved");
        check(items[0] == Document("HOME: HOME_1"), "first address");
        check(items[1] == Document("STATUS: ACTIVE"), "known inline kept");
        check(items[2] == Document("just words"), "non-record text kept");
        check(items[3] == Document(7) && items[4] == Document(true) && items[5].isNull(),
              "scalars kept");
        check(items[6] == Document("HOME: HOME_1"), "identical address reuses HOME_1");
        check(masker.report().reusedLabels == 1, "one reuse counted");
    }

    // 4) Real numbers are unsupported at non-key sites, but masked under masked keys
    {
        TokenVault vault;
        DocumentMasker masker(classifier, vault);

        Document in = Document::object({
            {"LIST", Document::array({Document(1.5)})},
            {"FOO", Document(2.5)},
            {"AMOUNT", Document(3.25)},
            {"ACCT_NUM", Document(4.5)},
        });
        Document out = masker.mask(in);

        check(out.find("LIST")->asArray().at(0) == Document(1.5), "real in array kept");
        check(*out.find("FOO") == Document(2.5), "real under unknown key kept");
        check(*out.find("AMOUNT") == Document(3.25), "real under known key kept");
        check(*out.find("ACCT_NUM") == Document("ACCT_NUM_1"), "real under masked key replaced");
        check(masker.report().unsupportedNodes == 2, "two unsupported nodes reported");
    }

    // 5) Deep documents: explicit stack gives the same result as recursion
    {
        auto build = [](int depth) {
            Document node = Document::object({{"EMAIL", Document("deep@x.com")},
                                              {"ENTITY_ID", Document(5)}});
            for (int i = 0; i < depth; ++i) {
                node = Document::array({Document::object({{"LEVEL", Document(i)},
                                                          {"CHILD", node}}),
                                        Document("HOME: 9 Deep Rd")});
            }
            return node;
        };
        Document deep = build(200);

        TokenVault recursiveVault;
        MaskerOptions wide;
        wide.maxRecursionDepth = 10000;
        DocumentMasker recursive(classifier, recursiveVault, wide);

        TokenVault iterativeVault;
        MaskerOptions narrow;
        narrow.maxRecursionDepth = 8;
        DocumentMasker iterative(classifier, iterativeVault, narrow);

        Document a = recursive.mask(deep);
        Document b = iterative.mask(deep);
        check(a == b, "explicit-stack walk matches recursive walk");
        check(iterative.report().iterativeSubtrees > 0, "explicit stack was used");
        check(recursive.report().iterativeSubtrees == 0, "recursion only");
        check(recursiveVault.size() == 2 && iterativeVault.size() == 2, "two distinct values masked");

        MaskerOptions zero;
        zero.maxRecursionDepth = 0;
        TokenVault zeroVault;
        DocumentMasker allIterative(classifier, zeroVault, zero);
        check(allIterative.mask(deep) == a, "depth 0 walks everything iteratively");
    }

    // 6) A scalar root is handled like an array element
    {
        TokenVault vault;
        DocumentMasker masker(classifier, vault);
        check(masker.mask(Document("EMAIL: a@b.com")) == Document("EMAIL: EMAIL_1"), "scalar root");
        check(masker.mask(Document(3)) == Document(3), "integer root");
    }

    // 7) Inline records ending in a line terminator are still masked
    {
        TokenVault vault;
        DocumentMasker masker(classifier, vault);
        Document out = masker.mask(Document::array({
            Document("HOME: 12 Main St\r"),
            Document("HOME: 12 Main St\n"),
            Document("EMAIL: a@b.com\r"),
        }));

        check(out.asArray().at(0) == Document("HOME: HOME_1"), "CR-terminated record masked");
        check(out.asArray().at(1) == Document("HOME: HOME_2"), "LF-terminated record masked");
        check(out.asArray().at(2) == Document("EMAIL: EMAIL_1"), "CR-terminated email masked");
        check(vault.get("HOME_1") == std::optional<std::string>("12 Main St\r"), "CR kept in value");
        check(vault.get("HOME_2") == std::optional<std::string>("12 Main St"), "final LF dropped");
        check(vault.size() == 3, "three values stored");
    }

    // 8) Very deep documents are masked and released without deep recursion
    {
        const int depth = 100000;
        TokenVault vault;
        DocumentMasker masker(classifier, vault);
        {
            Document node = Document::array({Document("HOME: 9 Deep Rd")});
            for (int i = 0; i < depth; ++i) {
                Array wrapper;
                wrapper.push_back(std::move(node));
                node = Document(std::move(wrapper));
            }

            Document out = masker.mask(node);

            const Document *cursor = &out;
            int levels = 0;
            while (cursor->asArray().size() == 1 && cursor->asArray()[0].isArray()) {
                cursor = &cursor->asArray()[0];
                ++levels;
            }
            check(levels == depth, "nesting depth preserved");
            check(cursor->asArray().at(0) == Document("HOME: HOME_1"), "deepest leaf masked");
        }
        check(vault.size() == 1, "one value stored for the deep leaf");
        check(masker.report().iterativeSubtrees == 1, "deep subtree walked iteratively");
    }

    if (allPassed) {
        std::cout << "[test_document_masker] All tests PASSED.\n";
    } else {
        std::cerr << "[test_document_masker] Some tests FAILED.\n";
    }
    return allPassed;
}

} // namespace test
} // namespace piimask

#endif // PIIMASK_TEST_UNIT_TEST_DOCUMENT_MASKER_HPP
