#ifndef PIIMASK_MASKING_INLINE_RECORD_HPP
#define PIIMASK_MASKING_INLINE_RECORD_HPP

#include <string>
#include <optional>
#include <cctype>

/**
 * @file inline_record.hpp
 * @brief Parser for single-line "key: value" records embedded in text scalars.
 *
 * Result documents list some features as strings such as "HOME: 1515 Adela Ln" or
 * "EMAIL: bsmith@work.com". The grammar is:
 *
 *     identifier ':' whitespace+ rest-of-line
 *
 * where identifier is one or more of [A-Za-z0-9_-] or non-ASCII (UTF-8) bytes. The
 * rest may be empty. A single trailing '\n' ends the line and is not part of the value;
 * any other '\n' means the text is not a record. '\r' is ordinary value content.
 * Whitespace after the colon is consumed greedily, so "HOME:   x" yields the value "x".
 *
 * The scan is a single linear pass; document fields can be arbitrarily long and
 * a backtracking regex engine would recurse once per character here.
 */

namespace piimask {
namespace masking {

struct InlineRecord
{
    std::string key;
    std::string value;
};

inline bool isIdentifierChar(unsigned char c)
{
    return std::isalnum(c) || c == '_' || c == '-' || c >= 0x80;
}

inline bool isRecordSpace(unsigned char c)
{
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

/**
 * @brief Try to read `text` as an inline record.
 * @return The (key, value) pair, or std::nullopt if the whole text does not match.
 */
inline std::optional<InlineRecord> parseInlineRecord(const std::string &text)
{
    std::size_t pos = 0;
    while (pos < text.size() && isIdentifierChar(static_cast<unsigned char>(text[pos]))) {
        ++pos;
    }
    if (pos == 0 || pos >= text.size() || text[pos] != ':') {
        return std::nullopt;
    }
    std::size_t keyEnd = pos++;

    std::size_t valueStart = pos;
    while (valueStart < text.size() && isRecordSpace(static_cast<unsigned char>(text[valueStart]))) {
        ++valueStart;
    }
    if (valueStart == pos) {
        return std::nullopt;
    }

    std::size_t valueEnd = text.size();
    if (valueEnd > valueStart && text[valueEnd - 1] == '\n') {
        --valueEnd;
    }
    if (text.find('\n', valueStart) < valueEnd) {
        return std::nullopt;
    }

    InlineRecord rec;
    rec.key = text.substr(0, keyEnd);
    rec.value = text.substr(valueStart, valueEnd - valueStart);
    return rec;
}

inline std::string renderInlineRecord(const std::string &key, const std::string &value)
{
    return key + ": " + value;
}

} // namespace masking
} // namespace piimask

#endif // PIIMASK_MASKING_INLINE_RECORD_HPP
