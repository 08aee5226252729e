#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace TagFusion {

enum class ValueKind : std::uint8_t {
    Null,
    Bool,
    Int,      // negative integers
    UInt,     // non-negative integers
    Real,
    String,
    Array,
    Object
};

constexpr std::string_view kind_to_string(ValueKind k) {
    switch(k) {
    case ValueKind::Null:   return "null"; break;
    case ValueKind::Bool:   return "bool"; break;
    case ValueKind::Int:    return "int"; break;
    case ValueKind::UInt:   return "uint"; break;
    case ValueKind::Real:   return "real"; break;
    case ValueKind::String: return "string"; break;
    case ValueKind::Array:  return "array"; break;
    case ValueKind::Object: return "object"; break;
    }
    return "N/A";
}

/// Generic structural tree that every decode call starts from.
///
/// Objects keep their members in document order and may hold repeated keys
/// exactly as the reader produced them; `find` returns the first match.
/// Integers are kept in their exact form: negative values as Int, the rest
/// as UInt, so 64-bit identifiers survive the trip into typed storage.
class Value {
public:
    using Array  = std::vector<Value>;
    using Member = std::pair<std::string, Value>;
    using Object = std::vector<Member>;

    using Storage = std::variant<std::nullptr_t,
                                 bool,
                                 std::int64_t,
                                 std::uint64_t,
                                 double,
                                 std::string,
                                 Array,
                                 Object>;

    Value() : storage_(nullptr) {}
    Value(std::nullptr_t) : storage_(nullptr) {}
    Value(bool b) : storage_(b) {}

    template<class I>
        requires (std::is_integral_v<I> && !std::is_same_v<I, bool> && std::is_signed_v<I>)
    Value(I i) {
        if(i < 0) storage_ = static_cast<std::int64_t>(i);
        else      storage_ = static_cast<std::uint64_t>(i);
    }

    template<class U>
        requires (std::is_integral_v<U> && !std::is_same_v<U, bool> && std::is_unsigned_v<U>)
    Value(U u) : storage_(static_cast<std::uint64_t>(u)) {}

    Value(double d) : storage_(d) {}
    Value(const char * s) : storage_(std::string(s)) {}
    Value(std::string_view s) : storage_(std::string(s)) {}
    Value(std::string s) : storage_(std::move(s)) {}
    Value(Array a) : storage_(std::move(a)) {}
    Value(Object o) : storage_(std::move(o)) {}

    static Value array(std::initializer_list<Value> items) {
        return Value(Array(items));
    }
    static Value object(std::initializer_list<Member> members) {
        return Value(Object(members));
    }

    ValueKind kind() const {
        return static_cast<ValueKind>(storage_.index());
    }

    bool is_null()   const { return kind() == ValueKind::Null; }
    bool is_bool()   const { return kind() == ValueKind::Bool; }
    bool is_number() const {
        return kind() == ValueKind::Int || kind() == ValueKind::UInt || kind() == ValueKind::Real;
    }
    bool is_integer() const { return kind() == ValueKind::Int || kind() == ValueKind::UInt; }
    bool is_string() const { return kind() == ValueKind::String; }
    bool is_array()  const { return kind() == ValueKind::Array; }
    bool is_object() const { return kind() == ValueKind::Object; }

    const bool *          get_bool()   const { return std::get_if<bool>(&storage_); }
    const std::int64_t *  get_int()    const { return std::get_if<std::int64_t>(&storage_); }
    const std::uint64_t * get_uint()   const { return std::get_if<std::uint64_t>(&storage_); }
    const double *        get_real()   const { return std::get_if<double>(&storage_); }
    const std::string *   get_string() const { return std::get_if<std::string>(&storage_); }
    const Array *         get_array()  const { return std::get_if<Array>(&storage_); }
    const Object *        get_object() const { return std::get_if<Object>(&storage_); }
    Array *               get_array()        { return std::get_if<Array>(&storage_); }
    Object *              get_object()       { return std::get_if<Object>(&storage_); }

    // Member lookup; nullptr when this is not an object or the key is absent.
    const Value * find(std::string_view key) const {
        const Object * o = get_object();
        if(!o) return nullptr;
        for(const Member & m : *o) {
            if(m.first == key) return &m.second;
        }
        return nullptr;
    }

    // Number of elements for arrays, members for objects, 0 otherwise.
    std::size_t size() const {
        if(const Array * a = get_array()) return a->size();
        if(const Object * o = get_object()) return o->size();
        return 0;
    }

    friend bool operator==(const Value & l, const Value & r) {
        return l.storage_ == r.storage_;
    }

private:
    Storage storage_;
};

} // namespace TagFusion
