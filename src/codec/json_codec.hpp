#ifndef PIIMASK_CODEC_JSON_CODEC_HPP
#define PIIMASK_CODEC_JSON_CODEC_HPP

#include <string>
#include <vector>
#include <fstream>
#include <sstream>
#include <limits>
#include <cstdint>
#include <utility>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include "../document/document.hpp"
#include "../util/logger.hpp"

/**
 * @file json_codec.hpp
 * @brief Converts between JSON text and piimask::document::Document, using
 *        nlohmann::ordered_json.
 *
 * DESIGN GOALS:
 *   - Load the result documents produced upstream (entity-resolution exports) into
 *     the Document tree the masker walks, keeping object members in source order.
 *   - Render masked documents back to text, pretty-printed with a two-space indent,
 *     which is the text later handed to the unmasker.
 *   - Reals render in their shortest round-trip form ("0.1", not "0.10000000000000001").
 *
 * NOTE:
 *   Parsing and fromJsonValue() handle any nesting depth. Rendering recurses once per
 *   nesting level (toJsonValue() and the serializer both do).
 *
 * USAGE:
 *   @code
 *   using namespace piimask::codec;
 *   Document doc = readJsonFile("entity.json");
 *   std::string text = renderJson(doc);
 *   writeJsonFile(doc, "entity.masked.json");
 *   @endcode
 */

namespace piimask {
namespace codec {

using piimask::document::Array;
using piimask::document::Document;
using piimask::document::NodeKind;
using piimask::document::Object;

using Json = nlohmann::ordered_json;

/// Indentation argument of renderJson() for single-line output.
static constexpr int COMPACT = -1;

inline Document fromJsonScalar(const Json &v)
{
    switch (v.type()) {
        case Json::value_t::null:
            return Document();
        case Json::value_t::boolean:
            return Document(v.get<bool>());
        case Json::value_t::number_integer:
            return Document(v.get<int64_t>());
        case Json::value_t::number_unsigned: {
            const uint64_t u = v.get<uint64_t>();
            if (u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                return Document(static_cast<double>(u));
            }
            return Document(static_cast<int64_t>(u));
        }
        case Json::value_t::number_float:
            return Document(v.get<double>());
        case Json::value_t::string:
            return Document(v.get<std::string>());
        default:
            break;
    }
    throw std::runtime_error(std::string("JsonCodec: unsupported JSON value type: ") + v.type_name());
}

/**
 * @brief Convert a parsed JSON value to a Document. Walks with an explicit stack, so
 *        the depth of the input is not limited by the call stack.
 */
inline Document fromJsonValue(const Json &root)
{
    if (!root.is_structured()) {
        return fromJsonScalar(root);
    }

    struct Frame
    {
        const Json *src;
        Document out;
        Json::const_iterator next;
        std::string key; ///< member key in the parent object
    };

    auto openFrame = [](const Json &src, std::string key) {
        Frame f;
        f.src = &src;
        f.out = src.is_array() ? Document(Array()) : Document(Object());
        f.next = src.cbegin();
        f.key = std::move(key);
        return f;
    };

    std::vector<Frame> stack;
    stack.push_back(openFrame(root, std::string()));
    Document finished;

    while (!stack.empty()) {
        Frame &top = stack.back();

        if (top.next != top.src->cend()) {
            const Json &child = top.next.value();
            std::string key = top.src->is_object() ? top.next.key() : std::string();
            ++top.next;

            if (child.is_structured()) {
                stack.push_back(openFrame(child, std::move(key)));
            } else if (top.out.isArray()) {
                top.out.asArray().push_back(fromJsonScalar(child));
            } else {
                top.out.asObject().append(std::move(key), fromJsonScalar(child));
            }
            continue;
        }

        Frame done = std::move(stack.back());
        stack.pop_back();

        if (stack.empty()) {
            finished = std::move(done.out);
        } else if (stack.back().out.isArray()) {
            stack.back().out.asArray().push_back(std::move(done.out));
        } else {
            stack.back().out.asObject().append(std::move(done.key), std::move(done.out));
        }
    }
    return finished;
}

inline Json toJsonValue(const Document &doc)
{
    switch (doc.kind()) {
        case NodeKind::NULL_VALUE:
            return Json(nullptr);
        case NodeKind::BOOL:
            return Json(doc.asBool());
        case NodeKind::INTEGER:
            return Json(doc.asInteger());
        case NodeKind::REAL:
            return Json(doc.asReal());
        case NodeKind::TEXT:
            return Json(doc.asText());
        case NodeKind::ARRAY: {
            Json arr = Json::array();
            for (const auto &elem : doc.asArray()) {
                arr.push_back(toJsonValue(elem));
            }
            return arr;
        }
        case NodeKind::OBJECT: {
            Json obj = Json::object();
            for (const auto &member : doc.asObject()) {
                obj[member.first] = toJsonValue(member.second);
            }
            return obj;
        }
    }
    throw std::runtime_error("JsonCodec: unexpected document node kind");
}

/**
 * @brief Parse JSON text into a Document.
 * @throw std::runtime_error with the parser's diagnostics if the text is not valid JSON.
 */
inline Document parseJson(const std::string &text)
{
    Json root;
    try {
        root = Json::parse(text);
    } catch (const Json::parse_error &e) {
        throw std::runtime_error(std::string("JsonCodec: invalid JSON: ") + e.what());
    }
    return fromJsonValue(root);
}

/**
 * @brief Render a Document as JSON text.
 * @param indent Spaces per nesting level; COMPACT yields single-line output.
 * @throw std::runtime_error if a text node is not valid UTF-8.
 */
inline std::string renderJson(const Document &doc, int indent = 2)
{
    try {
        return toJsonValue(doc).dump(indent);
    } catch (const Json::type_error &e) {
        throw std::runtime_error(std::string("JsonCodec: cannot render document: ") + e.what());
    }
}

/**
 * @brief Textual form of a scalar leaf, as it is stored in the token vault.
 *        Text is returned verbatim (no quotes); other scalars use their JSON spelling.
 */
inline std::string renderScalar(const Document &doc)
{
    if (doc.isText()) {
        return doc.asText();
    }
    if (doc.isInteger()) {
        return std::to_string(doc.asInteger());
    }
    if (doc.isContainer()) {
        throw std::runtime_error("JsonCodec: renderScalar called on a container");
    }
    return renderJson(doc, COMPACT);
}

/**
 * @brief Read and parse a JSON file.
 * @throw std::runtime_error if the file can't be opened or does not contain valid JSON.
 */
inline Document readJsonFile(const std::string &path)
{
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("JsonCodec: cannot open input file: " + path);
    }
    std::ostringstream buf;
    buf << in.rdbuf();

    piimask::util::logger::debug("JsonCodec: read " + std::to_string(buf.str().size())
                                 + " bytes from " + path);
    return parseJson(buf.str());
}

/**
 * @brief Serialize a Document to a file in pretty-print format, followed by a newline.
 * @throw std::runtime_error if the file can't be written.
 */
inline void writeJsonFile(const Document &doc, const std::string &path)
{
    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out.is_open()) {
        throw std::runtime_error("JsonCodec: cannot open output file: " + path);
    }
    out << renderJson(doc) << "\n";
    if (!out) {
        throw std::runtime_error("JsonCodec: failed writing output file: " + path);
    }
}

} // namespace codec
} // namespace piimask

#endif // PIIMASK_CODEC_JSON_CODEC_HPP
