#ifndef PIIMASK_MASKING_TEXT_UNMASKER_HPP
#define PIIMASK_MASKING_TEXT_UNMASKER_HPP

#include <string>
#include <vector>
#include <cstddef>
#include "../vault/token_vault.hpp"
#include "../util/logger.hpp"

/**
 * @file text_unmasker.hpp
 * @brief Substitutes original values back for the labels found in arbitrary text.
 *
 * DESIGN GOALS:
 *   - One left-to-right pass over the text, matching the label grammar
 *     [A-Z_]+ '_' [0-9]+ at the leftmost position, longest prefix first, without overlap.
 *   - A label registered in the vault is replaced by its original value. Anything else
 *     that looks like a label (stale or decoy tokens) is copied through unchanged.
 *   - Replacement text is never rescanned, even if an original value itself contains
 *     something label-shaped.
 *
 * USAGE EXAMPLE:
 *   @code
 *   piimask::masking::TextUnmasker unmasker(vault);
 *   std::string plain = unmasker.unmask("contact EMAIL_1 today");
 *   @endcode
 */

namespace piimask {
namespace masking {

/**
 * @struct LabelMatch
 * @brief A label-shaped span [pos, pos + length) in the scanned text.
 */
struct LabelMatch
{
    std::size_t pos;
    std::size_t length;
};

inline bool isLabelHeadChar(char c)
{
    return (c >= 'A' && c <= 'Z') || c == '_';
}

inline bool isLabelDigit(char c)
{
    return c >= '0' && c <= '9';
}

/**
 * @brief Find every label-shaped span in text, in order, without overlap.
 *
 * Within a maximal run of [A-Z_] characters the only underscore that can be followed
 * by a digit is the last character of the run, so a run either yields exactly one
 * match (run + digits) or none at all.
 */
inline std::vector<LabelMatch> findLabels(const std::string &text)
{
    std::vector<LabelMatch> matches;
    const std::size_t n = text.size();
    std::size_t i = 0;

    while (i < n) {
        if (!isLabelHeadChar(text[i])) {
            ++i;
            continue;
        }

        std::size_t runEnd = i;
        while (runEnd < n && isLabelHeadChar(text[runEnd])) {
            ++runEnd;
        }

        // need at least one head character before the separating underscore
        bool hit = runEnd - i >= 2
                   && text[runEnd - 1] == '_'
                   && runEnd < n
                   && isLabelDigit(text[runEnd]);
        if (!hit) {
            i = runEnd;
            continue;
        }

        std::size_t end = runEnd;
        while (end < n && isLabelDigit(text[end])) {
            ++end;
        }
        matches.push_back(LabelMatch{i, end - i});
        i = end;
    }
    return matches;
}

class TextUnmasker
{
public:
    explicit TextUnmasker(const piimask::vault::TokenVault &vault, bool debug = false)
        : vault_(vault),
          debug_(debug)
    {
    }

    /**
     * @brief Replace every vault-registered label in text with its original value.
     */
    inline std::string unmask(const std::string &text) const
    {
        std::string out;
        out.reserve(text.size());

        std::size_t lastHead = 0;
        std::size_t replaced = 0;
        std::size_t missing = 0;

        for (const auto &m : findLabels(text)) {
            const std::string label = text.substr(m.pos, m.length);
            auto original = vault_.get(label);

            out.append(text, lastHead, m.pos - lastHead);
            if (original) {
                out.append(*original);
                ++replaced;
            } else {
                out.append(label);
                ++missing;
                if (debug_) {
                    piimask::util::logger::debug("TextUnmasker: no vault entry for " + label
                                                 + " at offset " + std::to_string(m.pos));
                }
            }
            lastHead = m.pos + m.length;
        }
        out.append(text, lastHead, std::string::npos);

        if (debug_) {
            piimask::util::logger::debug("TextUnmasker: replaced " + std::to_string(replaced)
                                         + " labels, left " + std::to_string(missing)
                                         + " unregistered");
        }
        return out;
    }

private:
    const piimask::vault::TokenVault &vault_;
    bool debug_;
};

} // namespace masking
} // namespace piimask

#endif // PIIMASK_MASKING_TEXT_UNMASKER_HPP
