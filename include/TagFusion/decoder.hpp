#pragma once

#include <array>
#include <bitset>
#include <cmath>
#include <cstdint>
#include <limits>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "static_schema.hpp"
#include "options.hpp"
#include "struct_introspection.hpp"
#include "errors.hpp"
#include "parse_result.hpp"
#include "value.hpp"

namespace TagFusion {

namespace decoder_details {


class DecodeContext {
    ParseError error = ParseError::NO_ERROR;
    path::Path currentPath;
    std::string m_detail;

public:
    struct PathGuard {
        DecodeContext & ctx;

        ~PathGuard() {
            if(ctx.error == ParseError::NO_ERROR)
                ctx.currentPath.pop();
        }
    };

    bool withParseError(ParseError err, std::string detail = {}) {
        error = err;
        m_detail = std::move(detail);
        return false;
    }

    // Adopts the failure of a decode that ran below the current location.
    bool withNestedResult(const ParseResult & inner) {
        error = inner.error() == ParseError::NO_ERROR ? ParseError::TRANSFORMER_ERROR : inner.error();
        for(const path::PathElement & el : inner.errorPath().storage) {
            currentPath.storage.push_back(el);
        }
        m_detail = std::string(inner.detail());
        return false;
    }

    ParseError currentError() const { return error; }

    ParseResult result() const {
        return ParseResult(error, currentPath, m_detail);
    }

    PathGuard getArrayItemGuard(std::size_t index) {
        currentPath.push_index(index);
        return PathGuard{*this};
    }
    PathGuard getMapItemGuard(std::string_view key) {
        currentPath.push_field(key);
        return PathGuard{*this};
    }
};

template<class Opts, class Field>
bool DecodeValue(Field & field, const Value & v, DecodeContext & ctx);

// Unwraps Annotated<> and decodes with the options it carries.
template<class Field>
bool DecodeAnnotated(Field & field, const Value & v, DecodeContext & ctx) {
    using Meta = options::detail::annotation_meta_getter<Field>;
    return DecodeValue<typename Meta::options>(Meta::getRef(field), v, ctx);
}

template<class T>
void setNull(T & obj) {
    obj.reset();
}

template<class T>
constexpr bool fitsInteger(std::int64_t v) {
    if constexpr (std::is_signed_v<T>) {
        return v >= static_cast<std::int64_t>(std::numeric_limits<T>::lowest())
            && v <= static_cast<std::int64_t>(std::numeric_limits<T>::max());
    } else {
        return v >= 0 && static_cast<std::uint64_t>(v) <= static_cast<std::uint64_t>(std::numeric_limits<T>::max());
    }
}

template<class T>
constexpr bool fitsInteger(std::uint64_t v) {
    return v <= static_cast<std::uint64_t>(std::numeric_limits<T>::max());
}

template<class T>
bool fitsInteger(double v) {
    // [-2^digits, 2^digits) for signed types, [0, 2^digits) for unsigned
    const double upper = std::ldexp(1.0, std::numeric_limits<T>::digits);
    const double lower = std::is_signed_v<T> ? -upper : 0.0;
    return v >= lower && v < upper;
}


template <class Opts, class ObjT>
    requires static_schema::JsonBool<ObjT>
bool DecodeNonNullValue(ObjT & obj, const Value & v, DecodeContext & ctx) {
    const bool * b = v.get_bool();
    if(!b) {
        return ctx.withParseError(ParseError::NON_BOOL_IN_BOOL_VALUE);
    }
    obj = *b;
    return true;
}

template <class Opts, class ObjT>
    requires static_schema::JsonNumber<ObjT>
bool DecodeNonNullValue(ObjT & obj, const Value & v, DecodeContext & ctx) {
    if(!v.is_number()) {
        return ctx.withParseError(ParseError::NON_NUMERIC_IN_NUMERIC_STORAGE);
    }
    if constexpr (std::is_integral_v<ObjT>) {
        if(const std::int64_t * i = v.get_int()) {
            if(!fitsInteger<ObjT>(*i)) {
                return ctx.withParseError(ParseError::NUMERIC_VALUE_IS_OUT_OF_STORAGE_TYPE_RANGE);
            }
            obj = static_cast<ObjT>(*i);
        } else if(const std::uint64_t * u = v.get_uint()) {
            if(!fitsInteger<ObjT>(*u)) {
                return ctx.withParseError(ParseError::NUMERIC_VALUE_IS_OUT_OF_STORAGE_TYPE_RANGE);
            }
            obj = static_cast<ObjT>(*u);
        } else {
            const double d = *v.get_real();
            if(std::trunc(d) != d) {
                return ctx.withParseError(ParseError::FLOAT_VALUE_IN_INTEGER_STORAGE);
            }
            if(!fitsInteger<ObjT>(d)) {
                return ctx.withParseError(ParseError::NUMERIC_VALUE_IS_OUT_OF_STORAGE_TYPE_RANGE);
            }
            obj = static_cast<ObjT>(d);
        }
    } else {
        double d;
        if(const std::int64_t * i = v.get_int()) {
            d = static_cast<double>(*i);
        } else if(const std::uint64_t * u = v.get_uint()) {
            d = static_cast<double>(*u);
        } else {
            d = *v.get_real();
        }
        if(std::isfinite(d) &&
            (d < double(std::numeric_limits<ObjT>::lowest()) || d > double(std::numeric_limits<ObjT>::max()))) {
            return ctx.withParseError(ParseError::NUMERIC_VALUE_IS_OUT_OF_STORAGE_TYPE_RANGE);
        }
        obj = static_cast<ObjT>(d);
    }
    return true;
}

template <class Opts, class ObjT>
    requires static_schema::JsonString<ObjT>
bool DecodeNonNullValue(ObjT & obj, const Value & v, DecodeContext & ctx) {
    const std::string * s = v.get_string();
    if(!s) {
        return ctx.withParseError(ParseError::NON_STRING_IN_STRING_STORAGE);
    }
    obj = *s;
    return true;
}

template <class Opts, class ObjT>
    requires static_schema::JsonNullable<ObjT>
bool DecodeNonNullValue(ObjT & obj, const Value & v, DecodeContext & ctx) {
    if constexpr (static_schema::detail::is_unique_ptr<ObjT>::value) {
        obj = std::make_unique<typename ObjT::element_type>();
    } else {
        obj.emplace();
    }
    return DecodeAnnotated(*obj, v, ctx);
}

template <class Opts, class ObjT>
    requires static_schema::JsonFixedArray<ObjT>
bool DecodeNonNullValue(ObjT & obj, const Value & v, DecodeContext & ctx) {
    const Value::Array * arr = v.get_array();
    if(!arr) {
        return ctx.withParseError(ParseError::NON_ARRAY_IN_ARRAY_LIKE_VALUE);
    }
    if(arr->size() > obj.size()) {
        return ctx.withParseError(ParseError::FIXED_SIZE_CONTAINER_OVERFLOW);
    }
    for(std::size_t i = 0; i < arr->size(); i ++) {
        typename DecodeContext::PathGuard guard = ctx.getArrayItemGuard(i);
        if(!DecodeAnnotated(obj[i], (*arr)[i], ctx)) {
            return false;
        }
    }
    return true;
}

template <class Opts, class ObjT>
    requires static_schema::JsonDynamicArray<ObjT>
bool DecodeNonNullValue(ObjT & obj, const Value & v, DecodeContext & ctx) {
    const Value::Array * arr = v.get_array();
    if(!arr) {
        return ctx.withParseError(ParseError::NON_ARRAY_IN_ARRAY_LIKE_VALUE);
    }
    obj.clear();
    for(std::size_t i = 0; i < arr->size(); i ++) {
        typename DecodeContext::PathGuard guard = ctx.getArrayItemGuard(i);
        typename ObjT::value_type item{};
        if(!DecodeAnnotated(item, (*arr)[i], ctx)) {
            return false;
        }
        obj.push_back(std::move(item));
    }
    return true;
}

template <class Opts, class ObjT>
    requires static_schema::JsonMap<ObjT>
bool DecodeNonNullValue(ObjT & obj, const Value & v, DecodeContext & ctx) {
    const Value::Object * members = v.get_object();
    if(!members) {
        return ctx.withParseError(ParseError::NON_MAP_IN_MAP_LIKE_VALUE);
    }
    obj.clear();
    for(const Value::Member & m : *members) {
        typename DecodeContext::PathGuard guard = ctx.getMapItemGuard(m.first);
        auto [it, inserted] = obj.try_emplace(typename ObjT::key_type(m.first));
        if(!inserted) {
            return ctx.withParseError(ParseError::DUPLICATE_KEY_IN_MAP);
        }
        if(!DecodeAnnotated(it->second, m.second, ctx)) {
            return false;
        }
    }
    return true;
}


template<class StructT, std::size_t Index>
using StructFieldValue = static_schema::AnnotatedValue<
    introspection::structureElementTypeByIndex<Index, StructT>
>;

template <class ObjT, std::size_t... StructIndex>
bool DecodeStructField(ObjT & structObj, const Value & v, DecodeContext & ctx, std::index_sequence<StructIndex...>, std::size_t requiredIndex) {
    bool ok = false;
    (
        (requiredIndex == StructIndex
             ? (ok = DecodeAnnotated(introspection::getStructElementByIndex<StructIndex>(structObj), v, ctx), 0)
             : 0),
        ...
        );
    return ok;
}

template <class ObjT, std::size_t... StructIndex>
void ResetStructField(ObjT & structObj, std::index_sequence<StructIndex...>, std::size_t requiredIndex) {
    (
        [&] {
            if constexpr (static_schema::JsonNullable<StructFieldValue<ObjT, StructIndex>>) {
                if(requiredIndex == StructIndex) {
                    using Meta = options::detail::annotation_meta_getter<
                        introspection::structureElementTypeByIndex<StructIndex, ObjT>>;
                    setNull(Meta::getRef(introspection::getStructElementByIndex<StructIndex>(structObj)));
                }
            }
        }(),
        ...
        );
}

template<class ObjT, std::size_t... I>
consteval std::array<bool, sizeof...(I)> nullableFields(std::index_sequence<I...>) {
    return { static_schema::JsonNullable<StructFieldValue<ObjT, I>>... };
}


template <class Opts, class ObjT>
    requires static_schema::JsonObject<ObjT>
bool DecodeNonNullValue(ObjT & obj, const Value & v, DecodeContext & ctx) {
    const Value::Object * members = v.get_object();
    if(!members) {
        return ctx.withParseError(ParseError::NON_MAP_IN_MAP_LIKE_VALUE);
    }

    constexpr std::size_t fieldsCount = introspection::structureElementsCount<ObjT>;
    static_assert(introspection::fieldKeysAreUnique<ObjT>(), "[[[ TagFusion ]]] Fields keys are not unique");
    constexpr auto & keys = introspection::structureFieldKeys<ObjT>;
    static constexpr std::array<bool, fieldsCount> isNullable =
        nullableFields<ObjT>(std::make_index_sequence<fieldsCount>{});

    std::bitset<fieldsCount> parsedFieldsByIndex{};

    for(const Value::Member & m : *members) {
        std::size_t structIndex = fieldsCount;
        for(std::size_t i = 0; i < fieldsCount; i ++) {
            if(keys[i] == m.first) {
                structIndex = i;
                break;
            }
        }

        typename DecodeContext::PathGuard guard = ctx.getMapItemGuard(m.first);
        if(structIndex == fieldsCount) {
            if constexpr (Opts::template has_option<options::detail::allow_excess_fields_tag>) {
                continue;
            } else {
                return ctx.withParseError(ParseError::EXCESS_FIELD);
            }
        }
        if(parsedFieldsByIndex[structIndex]) {
            return ctx.withParseError(ParseError::DUPLICATE_KEY_IN_MAP);
        }
        if(!DecodeStructField(obj, m.second, ctx, std::make_index_sequence<fieldsCount>{}, structIndex)) {
            return false;
        }
        parsedFieldsByIndex[structIndex] = true;
    }

    for(std::size_t i = 0; i < fieldsCount; i ++) {
        if(parsedFieldsByIndex[i]) continue;
        if(isNullable[i]) {
            ResetStructField(obj, std::make_index_sequence<fieldsCount>{}, i);
            continue;
        }
        typename DecodeContext::PathGuard guard = ctx.getMapItemGuard(keys[i]);
        return ctx.withParseError(ParseError::MISSING_FIELD);
    }
    return true;
}

template <class Opts, class ObjT>
    requires static_schema::TaggedUnionModel<ObjT>
bool DecodeNonNullValue(ObjT & obj, const Value & v, DecodeContext & ctx) {
    ParseResult r = obj.decode_tagged(v);
    if(!r) {
        return ctx.withNestedResult(r);
    }
    return true;
}


template<class Opts, class Field>
bool DecodeValue(Field & field, const Value & v, DecodeContext & ctx) {
    static_assert(static_schema::DecodableValue<Field>,
                  "[[[ TagFusion ]]] Field type is not a supported TagFusion model type.\n"
                  "see DecodableValue concept for full rules");

    if constexpr (static_schema::AnyValue<Field>) {
        field = v;
        return true;
    } else if constexpr (static_schema::ParseTransformer<Field>) {
        typename Field::wire_type wire{};
        if(!DecodeAnnotated(wire, v, ctx)) {
            return false;
        }
        if(!field.transform_from(wire)) {
            return ctx.withParseError(ParseError::TRANSFORMER_ERROR);
        }
        return true;
    } else if constexpr (static_schema::TaggedUnionModel<Field>) {
        // null is a regular input for the dispatcher (fallback or NOT_A_MAPPING)
        return DecodeNonNullValue<Opts>(field, v, ctx);
    } else {
        if(v.is_null()) {
            if constexpr (static_schema::JsonNullable<Field>) {
                setNull(field);
                return true;
            } else {
                return ctx.withParseError(ParseError::NULL_IN_NON_OPTIONAL);
            }
        }
        return DecodeNonNullValue<Opts>(field, v, ctx);
    }
}

} // namespace decoder_details


// Decodes a Value into a typed model. On failure the model may be partially
// written; callers that need all-or-nothing decode into a temporary.
template <class InputObjectT>
ParseResult Decode(InputObjectT & obj, const Value & v) {
    decoder_details::DecodeContext ctx;
    decoder_details::DecodeAnnotated(obj, v, ctx);
    return ctx.result();
}

// Decodes a value that may be absent (`maybe == nullptr`) the way a struct
// field is decoded: nullable models become empty, others fail with
// MISSING_FIELD. `name`, when given, is the location reported in errors.
template <class InputObjectT>
ParseResult DecodeField(InputObjectT & obj, const Value * maybe, std::string_view name = {}) {
    path::Path location;
    if(!name.empty()) {
        location.push_field(name);
    }
    if(!maybe) {
        using Meta = options::detail::annotation_meta_getter<InputObjectT>;
        if constexpr (static_schema::JsonNullable<typename Meta::value_t>) {
            decoder_details::setNull(Meta::getRef(obj));
            return ParseResult::success();
        } else {
            return ParseResult(ParseError::MISSING_FIELD, std::move(location));
        }
    }
    ParseResult r = Decode(obj, *maybe);
    if(!r) {
        r.errorPath().prepend(location);
    }
    return r;
}

} // namespace TagFusion
