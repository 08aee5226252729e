#pragma once
#include <array>
#include <concepts>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include "options.hpp"
#include "parse_result.hpp"
#include "value.hpp"

namespace TagFusion {

namespace static_schema {

namespace detail {
template<class T>
struct is_std_array : std::false_type {};
template<class T, std::size_t N>
struct is_std_array<std::array<T, N>> : std::true_type {};

template<class T>
struct is_std_optional : std::false_type {};
template<class T>
struct is_std_optional<std::optional<T>> : std::true_type {};

template<class T>
struct is_unique_ptr : std::false_type {};
template<class T>
struct is_unique_ptr<std::unique_ptr<T>> : std::true_type {};
}

using options::detail::annotation_meta_getter;

template<class Field>
using AnnotatedValue = typename annotation_meta_getter<Field>::value_t;

// Models that consume the whole Value as-is and never fail.
template<class T>
concept AnyValue = std::same_as<T, Value>;

template<class T>
concept JsonBool = std::same_as<T, bool>;

template<class T>
concept JsonNumber = std::is_arithmetic_v<T> && !std::same_as<T, bool>;

template<class T>
concept JsonString = std::same_as<T, std::string>;

// Fields of these types may be absent or null.
template<class T>
concept JsonNullable = detail::is_std_optional<T>::value || detail::is_unique_ptr<T>::value;

template<class T>
concept JsonFixedArray = detail::is_std_array<T>::value;

template<class T>
concept JsonMap = requires (T & m, std::string k) {
    typename T::key_type;
    typename T::mapped_type;
    m.try_emplace(std::move(k));
    m.clear();
} && std::constructible_from<typename T::key_type, std::string>;

template <typename T>
concept DynamicContainerTypeConcept = requires (T  v) {
    typename T::value_type;
    v.push_back(std::declval<typename T::value_type>());
    v.clear();
};

template<class T>
concept JsonDynamicArray = !JsonString<T> && !JsonMap<T> && !AnyValue<T>
    && DynamicContainerTypeConcept<T>;

// Custom decoders in transformer form: decode into `wire_type`, then
// convert with `transform_from`.
template<class T>
concept ParseTransformer = requires (T & t, const typename T::wire_type & w) {
    typename T::wire_type;
    { t.transform_from(w) } -> std::convertible_to<bool>;
};

// Adjacently tagged unions embedded in models: decoded through the
// dispatcher instead of field by field.
template<class T>
concept TaggedUnionModel = requires (T & t, const Value & v) {
    typename T::registry_type;
    { T::tag_field } -> std::convertible_to<std::string_view>;
    { T::content_field } -> std::convertible_to<std::string_view>;
    { t.decode_tagged(v) } -> std::same_as<ParseResult>;
};

template<class T>
concept JsonObject = std::is_class_v<T> && std::is_aggregate_v<T>
    && !JsonFixedArray<T> && !ParseTransformer<T> && !TaggedUnionModel<T>;

template<class T>
concept DecodableValue =
       AnyValue<T>
    || JsonBool<T>
    || JsonNumber<T>
    || JsonString<T>
    || JsonNullable<T>
    || JsonFixedArray<T>
    || JsonMap<T>
    || JsonDynamicArray<T>
    || ParseTransformer<T>
    || TaggedUnionModel<T>
    || JsonObject<T>;

} // namespace static_schema
} // namespace TagFusion
