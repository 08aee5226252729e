#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <type_traits>
#include "annotated.hpp"
#include "const_string.hpp"

namespace TagFusion {

template <class ... Opts>
struct OptionsPack {};

namespace options {

namespace detail {

struct key_tag{};
struct allow_excess_fields_tag{};
struct strict_tag_type_tag{};

}

// Renames a struct field in the decoded document.
template<ConstString Desc>
struct key {
    static_assert(Desc.check(), "[[[ TagFusion ]]] key contains control characters");
    using tag = detail::key_tag;
    static constexpr auto desc = Desc;
    static constexpr std::string_view to_string() {
        return "key";
    }
};

// Unknown object keys are ignored instead of failing with EXCESS_FIELD.
struct allow_excess_fields {
    using tag = detail::allow_excess_fields_tag;
    static constexpr std::string_view to_string() {
        return "allow_excess_fields";
    }
};

// Registry option: a tag field holding a non-string value is a hard
// TAG_NOT_A_STRING error, even when a fallback case exists.
struct strict_tag_type {
    using tag = detail::strict_tag_type_tag;
    static constexpr std::string_view to_string() {
        return "strict_tag_type";
    }
};

namespace detail {

template<class Opt, class Tag, class = void>
struct option_matches_tag : std::false_type {};

template<class Opt, class Tag>
struct option_matches_tag<Opt, Tag, std::void_t<typename Opt::tag>>
    : std::bool_constant<std::is_same_v<typename Opt::tag, Tag>> {};

template<class Tag, class... Opts>
struct find_option_by_tag;

template<class Tag>
struct find_option_by_tag<Tag> {
    using type = void;
};

template<class Tag, class First, class... Rest>
struct find_option_by_tag<Tag, First, Rest...> {
private:
    using next = typename find_option_by_tag<Tag, Rest...>::type;

public:
    using type = std::conditional_t<
        option_matches_tag<First, Tag>::value,
        First,
        next
        >;
};

template<class OptPack> struct field_options;
template<class... Opts>
struct field_options<OptionsPack<Opts...>> {

    template<class Tag>
    using option_type = typename detail::find_option_by_tag<Tag, Opts...>::type;

    template<class Tag>
    static constexpr bool has_option = !std::is_void_v<option_type<Tag>>;

    template<class Tag>
    using get_option = option_type<Tag>;
};

using no_options = field_options<OptionsPack<>>;

// Base: plain model type
template<class T>
struct annotation_meta {
    using value_t  = T;
    using options  = no_options;
    static constexpr T & getRef(T & f) {
        return f;
    }
    static constexpr const T & getRef(const T & f) {
        return f;
    }
};

template<class T, class... Opts>
struct annotation_meta<Annotated<T, Opts...>> {
    using value_t  = T;
    using options  = field_options<OptionsPack<Opts...>>;

    static constexpr T & getRef(Annotated<T, Opts...> & f) {
        return f.value;
    }
    static constexpr const T & getRef(const Annotated<T, Opts...> & f) {
        return f.value;
    }
};

template<class Field>
struct annotation_meta_getter : annotation_meta<std::remove_cvref_t<Field>> {};

} // namespace detail

} // namespace options

} // namespace TagFusion
