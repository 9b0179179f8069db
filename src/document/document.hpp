#ifndef PIIMASK_DOCUMENT_DOCUMENT_HPP
#define PIIMASK_DOCUMENT_DOCUMENT_HPP

#include <string>
#include <vector>
#include <utility>
#include <variant>
#include <cstdint>
#include <cstddef>
#include <stdexcept>
#include <initializer_list>

/**
 * @file document.hpp
 * @brief The in-memory representation of a result document handed to the masker.
 *
 * DESIGN GOALS:
 *   - A tagged union over the JSON-shaped node kinds: Array, Object, Text, Integer,
 *     Bool, Null and Real.
 *   - Objects keep their members in insertion order; keys are unique within one object.
 *   - Value semantics: copying a Document copies the whole tree.
 *   - Destruction handles any nesting depth. Copying and operator== recurse once
 *     per level, so very deep trees should be moved, not copied.
 *
 * USAGE EXAMPLE:
 *   @code
 *   using namespace piimask::document;
 *   Document entity = Document::object({
 *       {"ENTITY_ID", Document(1)},
 *       {"ENTITY_NAME", Document("Robert Smith")},
 *       {"ADDRESS_DATA", Document::array({Document("HOME: 1515 Adela Ln")})}
 *   });
 *   if (entity.isObject()) {
 *       const Document *name = entity.find("ENTITY_NAME");
 *   }
 *   @endcode
 */

namespace piimask {
namespace document {

class Document;

/// Marker for the JSON null value.
struct Null
{
    bool operator==(const Null &) const { return true; }
    bool operator!=(const Null &) const { return false; }
};

using Array = std::vector<Document>;
using Member = std::pair<std::string, Document>;

/**
 * @class Object
 * @brief Insertion-ordered mapping from string keys to Documents.
 *        Setting an existing key replaces its value in place and keeps its position.
 */
class Object
{
public:
    Object() = default;
    Object(std::initializer_list<Member> members);

    void set(const std::string &key, Document value);

    /// Append without the duplicate-key search; the caller guarantees key is new.
    void append(std::string key, Document value);

    const Document *find(const std::string &key) const;
    Document *find(const std::string &key);

    bool empty() const { return members_.empty(); }
    std::size_t size() const { return members_.size(); }

    std::vector<Member>::const_iterator begin() const { return members_.begin(); }
    std::vector<Member>::const_iterator end() const { return members_.end(); }

    bool operator==(const Object &other) const;
    bool operator!=(const Object &other) const { return !(*this == other); }

private:
    friend class Document;

    std::vector<Member> members_;
};

/**
 * @enum NodeKind
 * @brief The variant tag of a Document, in the order of the underlying std::variant.
 */
enum class NodeKind {
    NULL_VALUE = 0,
    BOOL,
    INTEGER,
    REAL,
    TEXT,
    ARRAY,
    OBJECT
};

/**
 * @class Document
 * @brief A recursively defined JSON-like value.
 */
class Document
{
public:
    using Value = std::variant<Null, bool, int64_t, double, std::string, Array, Object>;

    Document() : value_(Null{}) {}
    Document(Null) : value_(Null{}) {}
    Document(bool b) : value_(b) {}
    Document(int i) : value_(static_cast<int64_t>(i)) {}
    Document(int64_t i) : value_(i) {}
    Document(double d) : value_(d) {}
    Document(const char *s) : value_(std::string(s)) {}
    Document(std::string s) : value_(std::move(s)) {}
    Document(Array a) : value_(std::move(a)) {}
    Document(Object o) : value_(std::move(o)) {}

    Document(const Document &) = default;
    Document(Document &&) = default;
    Document &operator=(const Document &) = default;
    Document &operator=(Document &&) = default;

    /// Nested containers are released through a work list, so destroying an
    /// arbitrarily deep tree does not recurse once per level.
    ~Document() { releaseChildren(); }

    static Document array(std::initializer_list<Document> items)
    {
        return Document(Array(items));
    }

    static Document object(std::initializer_list<Member> members)
    {
        return Document(Object(members));
    }

    NodeKind kind() const { return static_cast<NodeKind>(value_.index()); }

    bool isNull() const { return std::holds_alternative<Null>(value_); }
    bool isBool() const { return std::holds_alternative<bool>(value_); }
    bool isInteger() const { return std::holds_alternative<int64_t>(value_); }
    bool isReal() const { return std::holds_alternative<double>(value_); }
    bool isText() const { return std::holds_alternative<std::string>(value_); }
    bool isArray() const { return std::holds_alternative<Array>(value_); }
    bool isObject() const { return std::holds_alternative<Object>(value_); }
    bool isContainer() const { return isArray() || isObject(); }

    bool asBool() const { return get<bool>("bool"); }
    int64_t asInteger() const { return get<int64_t>("integer"); }
    double asReal() const { return get<double>("real"); }
    const std::string &asText() const { return get<std::string>("text"); }
    const Array &asArray() const { return get<Array>("array"); }
    const Object &asObject() const { return get<Object>("object"); }
    Array &asArray() { return getMutable<Array>("array"); }
    Object &asObject() { return getMutable<Object>("object"); }

    /// Object member lookup; nullptr when this is not an object or the key is absent.
    const Document *find(const std::string &key) const
    {
        const Object *obj = std::get_if<Object>(&value_);
        return obj ? obj->find(key) : nullptr;
    }

    const Value &value() const { return value_; }

    bool operator==(const Document &other) const { return value_ == other.value_; }
    bool operator!=(const Document &other) const { return !(*this == other); }

private:
    template <typename T>
    const T &get(const char *expected) const
    {
        const T *p = std::get_if<T>(&value_);
        if (!p) {
            throw std::runtime_error(std::string("Document: node is not ") + expected
                                     + " (kind=" + kindName(kind()) + ")");
        }
        return *p;
    }

    template <typename T>
    T &getMutable(const char *expected)
    {
        T *p = std::get_if<T>(&value_);
        if (!p) {
            throw std::runtime_error(std::string("Document: node is not ") + expected
                                     + " (kind=" + kindName(kind()) + ")");
        }
        return *p;
    }

    void releaseChildren()
    {
        if (!isContainer()) {
            return;
        }
        std::vector<Document> pending;
        detachChildren(pending);
        while (!pending.empty()) {
            Document child = std::move(pending.back());
            pending.pop_back();
            child.detachChildren(pending);
        }
    }

    /// Moves non-empty child containers to `pending` and clears this container.
    void detachChildren(std::vector<Document> &pending)
    {
        if (Array *items = std::get_if<Array>(&value_)) {
            for (auto &item : *items) {
                if (item.hasChildren()) {
                    pending.push_back(std::move(item));
                }
            }
            items->clear();
        } else if (Object *obj = std::get_if<Object>(&value_)) {
            for (auto &member : obj->members_) {
                if (member.second.hasChildren()) {
                    pending.push_back(std::move(member.second));
                }
            }
            obj->members_.clear();
        }
    }

    bool hasChildren() const
    {
        if (const Array *items = std::get_if<Array>(&value_)) {
            return !items->empty();
        }
        if (const Object *obj = std::get_if<Object>(&value_)) {
            return !obj->empty();
        }
        return false;
    }

public:
    static const char *kindName(NodeKind k)
    {
        switch (k) {
            case NodeKind::NULL_VALUE: return "null";
            case NodeKind::BOOL:       return "bool";
            case NodeKind::INTEGER:    return "integer";
            case NodeKind::REAL:       return "real";
            case NodeKind::TEXT:       return "text";
            case NodeKind::ARRAY:      return "array";
            case NodeKind::OBJECT:     return "object";
        }
        return "unknown";
    }

private:
    Value value_;
};

// ----------------------------------------------------------------------------
//  Object members (defined after Document is complete)
// ----------------------------------------------------------------------------
inline Object::Object(std::initializer_list<Member> members)
{
    for (const auto &m : members) {
        set(m.first, m.second);
    }
}

inline void Object::set(const std::string &key, Document value)
{
    for (auto &m : members_) {
        if (m.first == key) {
            m.second = std::move(value);
            return;
        }
    }
    members_.emplace_back(key, std::move(value));
}

inline void Object::append(std::string key, Document value)
{
    members_.emplace_back(std::move(key), std::move(value));
}

inline const Document *Object::find(const std::string &key) const
{
    for (const auto &m : members_) {
        if (m.first == key) {
            return &m.second;
        }
    }
    return nullptr;
}

inline Document *Object::find(const std::string &key)
{
    for (auto &m : members_) {
        if (m.first == key) {
            return &m.second;
        }
    }
    return nullptr;
}

inline bool Object::operator==(const Object &other) const
{
    return members_ == other.members_;
}

} // namespace document
} // namespace piimask

#endif // PIIMASK_DOCUMENT_DOCUMENT_HPP
