#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include <yyjson.h>

#include "decoder.hpp"
#include "dispatcher.hpp"
#include "errors.hpp"
#include "parse_result.hpp"
#include "path.hpp"
#include "tagged_union.hpp"
#include "value.hpp"

#ifndef TAGFUSION_MAX_DEPTH
#define TAGFUSION_MAX_DEPTH 512
#endif

namespace TagFusion {

// JSON text materialized into a Value, or the reader error.
class ReadResult {
    Value m_value;
    ParseResult m_result;

public:
    explicit ReadResult(Value v): m_value(std::move(v)) {}
    explicit ReadResult(ParseResult err): m_result(std::move(err)) {}

    operator bool() const {
        return static_cast<bool>(m_result);
    }
    ParseError error() const {
        return m_result.error();
    }
    const ParseResult & result() const {
        return m_result;
    }
    const Value & value() const & {
        return m_value;
    }
    Value && value() && {
        return std::move(m_value);
    }
};

namespace yyjson_tree_detail {

struct DocDeleter {
    void operator()(yyjson_doc * doc) const {
        yyjson_doc_free(doc);
    }
};
struct MutDocDeleter {
    void operator()(yyjson_mut_doc * doc) const {
        yyjson_mut_doc_free(doc);
    }
};
struct WriteBufferDeleter {
    void operator()(char * buf) const {
        std::free(buf);
    }
};

class TreeBuilder {
    path::Path currentPath;
    std::size_t depth = 0;

public:
    bool failed = false;

    ParseResult error() const {
        return ParseResult(ParseError::READER_ERROR, currentPath,
                           "nesting deeper than " + std::to_string(TAGFUSION_MAX_DEPTH) + " levels");
    }

    Value build(yyjson_val * node) {
        switch(yyjson_get_type(node)) {
        case YYJSON_TYPE_BOOL:
            return Value(yyjson_get_bool(node));
        case YYJSON_TYPE_NUM:
            if(yyjson_is_uint(node)) return Value(yyjson_get_uint(node));
            if(yyjson_is_sint(node)) return Value(yyjson_get_sint(node));
            return Value(yyjson_get_real(node));
        case YYJSON_TYPE_STR:
            return Value(std::string(yyjson_get_str(node), yyjson_get_len(node)));
        case YYJSON_TYPE_ARR:
            return buildArray(node);
        case YYJSON_TYPE_OBJ:
            return buildObject(node);
        default:
            return Value();
        }
    }

private:
    bool enter() {
        if(++depth > TAGFUSION_MAX_DEPTH) {
            failed = true;
            return false;
        }
        return true;
    }

    Value buildArray(yyjson_val * arr) {
        Value::Array items;
        if(!enter()) return Value();
        items.reserve(yyjson_arr_size(arr));
        yyjson_arr_iter it;
        yyjson_arr_iter_init(arr, &it);
        std::size_t index = 0;
        while(yyjson_val * item = yyjson_arr_iter_next(&it)) {
            currentPath.push_index(index++);
            items.push_back(build(item));
            if(failed) return Value();
            currentPath.pop();
        }
        depth --;
        return Value(std::move(items));
    }

    // Members keep document order, repeated keys included.
    Value buildObject(yyjson_val * obj) {
        Value::Object members;
        if(!enter()) return Value();
        members.reserve(yyjson_obj_size(obj));
        yyjson_obj_iter it;
        yyjson_obj_iter_init(obj, &it);
        while(yyjson_val * key = yyjson_obj_iter_next(&it)) {
            std::string name(yyjson_get_str(key), yyjson_get_len(key));
            currentPath.push_field(name);
            Value member = build(yyjson_obj_iter_get_val(key));
            if(failed) return Value();
            currentPath.pop();
            members.emplace_back(std::move(name), std::move(member));
        }
        depth --;
        return Value(std::move(members));
    }
};

inline yyjson_mut_val * BuildMutable(yyjson_mut_doc * doc, const Value & v) {
    switch(v.kind()) {
    case ValueKind::Null:   return yyjson_mut_null(doc);
    case ValueKind::Bool:   return yyjson_mut_bool(doc, *v.get_bool());
    case ValueKind::Int:    return yyjson_mut_sint(doc, *v.get_int());
    case ValueKind::UInt:   return yyjson_mut_uint(doc, *v.get_uint());
    case ValueKind::Real:   return yyjson_mut_real(doc, *v.get_real());
    case ValueKind::String: {
        const std::string & s = *v.get_string();
        return yyjson_mut_strncpy(doc, s.data(), s.size());
    }
    case ValueKind::Array: {
        yyjson_mut_val * arr = yyjson_mut_arr(doc);
        if(!arr) return nullptr;
        for(const Value & item : *v.get_array()) {
            yyjson_mut_val * child = BuildMutable(doc, item);
            if(!child || !yyjson_mut_arr_add_val(arr, child)) return nullptr;
        }
        return arr;
    }
    case ValueKind::Object: {
        yyjson_mut_val * obj = yyjson_mut_obj(doc);
        if(!obj) return nullptr;
        for(const Value::Member & m : *v.get_object()) {
            yyjson_mut_val * key = yyjson_mut_strncpy(doc, m.first.data(), m.first.size());
            yyjson_mut_val * child = BuildMutable(doc, m.second);
            if(!key || !child || !yyjson_mut_obj_add(obj, key, child)) return nullptr;
        }
        return obj;
    }
    }
    return nullptr;
}

}

/// Parses JSON text once into a Value. Syntax errors are READER_ERROR with
/// the yyjson message as detail and the byte offset as pos().
inline ReadResult ReadJson(std::string_view json) {
    yyjson_read_err err{};
    // without YYJSON_READ_INSITU the input buffer is not written to
    std::unique_ptr<yyjson_doc, yyjson_tree_detail::DocDeleter> doc(
        yyjson_read_opts(const_cast<char *>(json.data()), json.size(), YYJSON_READ_NOFLAG, nullptr, &err));
    if(!doc) {
        return ReadResult(ParseResult(ParseError::READER_ERROR, path::Path{},
                                      err.msg ? std::string(err.msg) : std::string("unknown reader error"),
                                      err.pos));
    }
    yyjson_tree_detail::TreeBuilder builder;
    Value root = builder.build(yyjson_doc_get_root(doc.get()));
    if(builder.failed) {
        return ReadResult(builder.error());
    }
    return ReadResult(std::move(root));
}

// Serializes a Value as compact JSON (or indented with `pretty`). Non-finite
// numbers are written as null.
inline bool WriteJson(const Value & v, std::string & out, bool pretty = false) {
    std::unique_ptr<yyjson_mut_doc, yyjson_tree_detail::MutDocDeleter> doc(yyjson_mut_doc_new(nullptr));
    if(!doc) return false;
    yyjson_mut_val * root = yyjson_tree_detail::BuildMutable(doc.get(), v);
    if(!root) return false;
    yyjson_mut_doc_set_root(doc.get(), root);

    yyjson_write_flag flags = YYJSON_WRITE_INF_AND_NAN_AS_NULL;
    if(pretty) flags |= YYJSON_WRITE_PRETTY;
    std::size_t len = 0;
    std::unique_ptr<char, yyjson_tree_detail::WriteBufferDeleter> buf(
        yyjson_mut_write(doc.get(), flags, &len));
    if(!buf) return false;
    out.assign(buf.get(), len);
    return true;
}

// Reads `json` once and dispatches the resulting tree; the same tree feeds
// the fallback.
template<ValidRegistry RegistryT>
DispatchResult DispatchJson(TaggedUnion<RegistryT> & out, std::string_view json, std::string_view tag_field,
                            std::string_view content_field, const RegistryT & registry) {
    ReadResult tree = ReadJson(json);
    if(!tree) {
        return DispatchResult::readerError(tree.result());
    }
    return Dispatch(out, tree.value(), tag_field, content_field, registry);
}

template<class InputObjectT>
ParseResult DecodeJson(InputObjectT & obj, std::string_view json) {
    ReadResult tree = ReadJson(json);
    if(!tree) {
        return tree.result();
    }
    return Decode(obj, tree.value());
}

} // namespace TagFusion
