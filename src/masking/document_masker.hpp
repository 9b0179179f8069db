#ifndef PIIMASK_MASKING_DOCUMENT_MASKER_HPP
#define PIIMASK_MASKING_DOCUMENT_MASKER_HPP

#include <string>
#include <vector>
#include <set>
#include <cstddef>
#include "../document/document.hpp"
#include "../codec/json_codec.hpp"
#include "../vault/token_vault.hpp"
#include "../util/logger.hpp"
#include "key_classifier.hpp"
#include "inline_record.hpp"

/**
 * @file document_masker.hpp
 * @brief Walks a result document and replaces sensitive leaves with vault labels.
 *
 * DESIGN GOALS:
 *   - The output has exactly the shape of the input; only scalar leaves change.
 *   - Containers are always descended into, whatever their own key's classification.
 *   - Key/value sites consult the KeyClassifier:
 *       KNOWN   -> value unchanged
 *       MASKED  -> value replaced by a label (non-text scalars by their JSON spelling;
 *                  null has nothing to protect and is kept)
 *       UNKNOWN -> text values masked with a warning, other scalars unchanged
 *   - Text scalars shaped like "KEY: value" are treated as an inline key/value site and
 *     re-rendered as "KEY: <result>".
 *   - Problems never abort the walk: they are logged and the node is kept as is.
 *     Labels minted before a problem stay in the vault.
 *   - Recursion depth is bounded by MaskerOptions::maxRecursionDepth; deeper subtrees
 *     are processed with an explicit work stack.
 *
 * USAGE EXAMPLE:
 *   @code
 *   using namespace piimask;
 *   masking::KeyClassifier classifier;
 *   vault::TokenVault vault;
 *   masking::DocumentMasker masker(classifier, vault);
 *
 *   document::Document masked = masker.mask(codec::readJsonFile("entity.json"));
 *   std::cout << codec::renderJson(masked) << std::endl;
 *   @endcode
 */

namespace piimask {
namespace masking {

using piimask::document::Array;
using piimask::document::Document;
using piimask::document::NodeKind;
using piimask::document::Object;

struct MaskerOptions
{
    /// Containers nested deeper than this are walked iteratively.
    std::size_t maxRecursionDepth = 64;

    /// Emit per-field DEBUG records (keys and labels only, never values).
    bool debug = false;
};

/**
 * @struct MaskingReport
 * @brief Counters accumulated over every mask() call of one DocumentMasker.
 */
struct MaskingReport
{
    std::size_t maskedValues = 0;      ///< leaves replaced by a freshly minted label
    std::size_t reusedLabels = 0;      ///< leaves replaced by an already existing label
    std::size_t unsupportedNodes = 0;  ///< nodes logged as unsupported and kept unchanged
    std::size_t iterativeSubtrees = 0; ///< subtrees handed to the explicit-stack walker
    std::set<std::string> unclassifiedKeys; ///< keys masked by default, for operator review
};

class DocumentMasker
{
public:
    DocumentMasker(const KeyClassifier &classifier,
                   piimask::vault::TokenVault &vault,
                   MaskerOptions options = MaskerOptions())
        : classifier_(classifier),
          vault_(vault),
          options_(options)
    {
    }

    /**
     * @brief Mask a whole document. The input is not modified.
     */
    inline Document mask(const Document &doc)
    {
        return maskNode(doc, 0);
    }

    /**
     * @brief Apply the key/value rule to a single scalar value.
     */
    inline Document maskPair(const std::string &key, const Document &value)
    {
        const KeyClass cls = classifier_.classify(key);

        switch (cls) {
            case KeyClass::KNOWN:
                return value;

            case KeyClass::MASKED:
                if (value.isNull()) {
                    return value;
                }
                if (options_.debug) {
                    piimask::util::logger::debug("DocumentMasker: MASKED: " + key + " ("
                                                 + Document::kindName(value.kind()) + ")");
                }
                return Document(mintLabel(key, piimask::codec::renderScalar(value)));

            case KeyClass::UNKNOWN:
                if (value.isText()) {
                    piimask::util::logger::warn("DocumentMasker: UNKNOWN key: " + key);
                    report_.unclassifiedKeys.insert(key);
                    return Document(mintLabel(key, value.asText()));
                }
                if (value.isReal()) {
                    reportUnsupported(value, key);
                }
                return value;
        }
        return value;
    }

    const MaskingReport &report() const { return report_; }
    void resetReport() { report_ = MaskingReport(); }

    const MaskerOptions &options() const { return options_; }

private:
    // -------------------------------------------------------------------------
    // Recursive walk, down to options_.maxRecursionDepth
    // -------------------------------------------------------------------------
    Document maskNode(const Document &node, std::size_t depth)
    {
        if (node.isContainer() && depth >= options_.maxRecursionDepth) {
            ++report_.iterativeSubtrees;
            if (options_.debug) {
                piimask::util::logger::debug("DocumentMasker: depth " + std::to_string(depth)
                                             + " reached, switching to explicit stack");
            }
            return maskIteratively(node);
        }

        if (node.isArray()) {
            const Array &items = node.asArray();
            Array out;
            out.reserve(items.size());
            for (const auto &elem : items) {
                out.push_back(maskNode(elem, depth + 1));
            }
            return Document(std::move(out));
        }

        if (node.isObject()) {
            Object out;
            for (const auto &member : node.asObject()) {
                if (member.second.isContainer()) {
                    out.append(member.first, maskNode(member.second, depth + 1));
                } else {
                    out.append(member.first, maskPair(member.first, member.second));
                }
            }
            return Document(std::move(out));
        }

        return maskScalar(node);
    }

    // -------------------------------------------------------------------------
    // Leaves that are not directly under an object key
    // -------------------------------------------------------------------------
    Document maskScalar(const Document &node)
    {
        switch (node.kind()) {
            case NodeKind::TEXT: {
                auto rec = parseInlineRecord(node.asText());
                if (!rec) {
                    return node;
                }
                Document result = maskPair(rec->key, Document(rec->value));
                return Document(renderInlineRecord(rec->key, result.asText()));
            }
            case NodeKind::INTEGER:
            case NodeKind::BOOL:
            case NodeKind::NULL_VALUE:
                return node;
            default:
                reportUnsupported(node, "");
                return node;
        }
    }

    // -------------------------------------------------------------------------
    // Explicit-stack walk for deep subtrees. Same rules as maskNode().
    // -------------------------------------------------------------------------
    struct Frame
    {
        const Document *src;
        Document out;
        std::size_t next;
        std::string key; ///< member key in the parent object; unused for array parents
    };

    static Frame openFrame(const Document &src, std::string key)
    {
        Frame f;
        f.src = &src;
        f.out = src.isArray() ? Document(Array()) : Document(Object());
        f.next = 0;
        f.key = std::move(key);
        return f;
    }

    Document maskIteratively(const Document &root)
    {
        std::vector<Frame> stack;
        stack.push_back(openFrame(root, std::string()));
        Document finished;

        while (!stack.empty()) {
            Frame &top = stack.back();

            if (top.src->isArray()) {
                const Array &items = top.src->asArray();
                if (top.next < items.size()) {
                    const Document &child = items[top.next++];
                    if (child.isContainer()) {
                        stack.push_back(openFrame(child, std::string()));
                    } else {
                        top.out.asArray().push_back(maskScalar(child));
                    }
                    continue;
                }
            } else {
                const Object &members = top.src->asObject();
                if (top.next < members.size()) {
                    const auto &member = *(members.begin() + static_cast<std::ptrdiff_t>(top.next++));
                    if (member.second.isContainer()) {
                        stack.push_back(openFrame(member.second, member.first));
                    } else {
                        top.out.asObject().append(member.first, maskPair(member.first, member.second));
                    }
                    continue;
                }
            }

            Frame done = std::move(stack.back());
            stack.pop_back();

            if (stack.empty()) {
                finished = std::move(done.out);
            } else if (stack.back().src->isArray()) {
                stack.back().out.asArray().push_back(std::move(done.out));
            } else {
                stack.back().out.asObject().append(std::move(done.key), std::move(done.out));
            }
        }
        return finished;
    }

    std::string mintLabel(const std::string &key, const std::string &value)
    {
        bool reused = false;
        std::string label = vault_.maskValue(key, value, &reused);
        if (reused) {
            ++report_.reusedLabels;
        } else {
            ++report_.maskedValues;
        }
        if (options_.debug) {
            piimask::util::logger::debug("DocumentMasker: " + key + " => " + label
                                         + (reused ? " (reused)" : ""));
        }
        return label;
    }

    void reportUnsupported(const Document &node, const std::string &key)
    {
        ++report_.unsupportedNodes;
        std::string where = key.empty() ? std::string() : " under key " + key;
        piimask::util::logger::error(std::string("DocumentMasker: Unknown data type: ")
                                     + Document::kindName(node.kind()) + where
                                     + ", passed through unchanged");
    }

    const KeyClassifier &classifier_;
    piimask::vault::TokenVault &vault_;
    MaskerOptions options_;
    MaskingReport report_;
};

} // namespace masking
} // namespace piimask

#endif // PIIMASK_MASKING_DOCUMENT_MASKER_HPP
