#pragma once

#include <cstddef>
#include <limits>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace TagFusion {
namespace path {

// One step of an error location: an array index, or an object key.
struct PathElement {
    static constexpr std::size_t NOT_AN_INDEX = std::numeric_limits<std::size_t>::max();

    std::size_t array_index = NOT_AN_INDEX;
    std::string field_name;

    PathElement() = default;
    PathElement(std::size_t index) : array_index(index) {}
    PathElement(std::string_view key) : field_name(key) {}

    bool is_index() const { return array_index != NOT_AN_INDEX; }

    friend bool operator==(const PathElement &, const PathElement &) = default;
};

// Location of a decode error, root first. Keys are owned copies, so a path
// stays valid after the decoded tree is gone.
struct Path {
    std::vector<PathElement> storage;

    Path() = default;

    template <class ... PathElems>
        requires (sizeof...(PathElems) > 0)
    Path(PathElems ... args) {
        storage.reserve(sizeof...(args));
        (push_arg(args), ...);
    }

    void push_field(std::string_view key) { storage.emplace_back(key); }
    void push_index(std::size_t index)    { storage.emplace_back(index); }
    void pop() { storage.pop_back(); }

    // Prepends another path, used when an inner decode runs below a known
    // location (content field, nested union field).
    void prepend(const Path & outer) {
        storage.insert(storage.begin(), outer.storage.begin(), outer.storage.end());
    }

    std::size_t length() const { return storage.size(); }
    bool empty() const { return storage.empty(); }

    friend bool operator==(const Path &, const Path &) = default;

    // "$.resource.items[2]"; keys that would read ambiguously are quoted:
    // $["a.b"], $[""].
    std::string to_string() const {
        std::string out = "$";
        for(const PathElement & el : storage) {
            if(el.is_index()) {
                out += "[" + std::to_string(el.array_index) + "]";
            } else if(needs_quoting(el.field_name)) {
                out += "[\"";
                for(char c : el.field_name) {
                    if(c == '"' || c == '\\') out += '\\';
                    out += c;
                }
                out += "\"]";
            } else {
                out += "." + el.field_name;
            }
        }
        return out;
    }

private:
    static bool needs_quoting(std::string_view key) {
        if(key.empty()) return true;
        for(char c : key) {
            if(static_cast<unsigned char>(c) <= ' ' || c == '.' || c == '[' || c == ']' || c == '"' || c == '\\') {
                return true;
            }
        }
        return false;
    }

    template<class ArgT>
    void push_arg(const ArgT & arg) {
        if constexpr (std::is_convertible_v<ArgT, std::string_view>) {
            push_field(std::string_view(arg));
        } else if constexpr (std::is_convertible_v<ArgT, std::size_t>) {
            push_index(static_cast<std::size_t>(arg));
        } else {
            static_assert(!sizeof(arg), "Use integers or str-compatible segments in Path construction");
        }
    }
};

} // namespace path
} // namespace TagFusion
