#pragma once

#include <array>
#include <cstddef>
#include <string_view>
#include <utility>
#include <pfr/tuple_size.hpp>
#include <pfr/core.hpp>
#include <pfr/core_name.hpp>

#include "options.hpp"

namespace TagFusion {

namespace introspection {

template<class StructT>
static constexpr std::size_t structureElementsCount = pfr::tuple_size_v<std::remove_cv_t<StructT>>;

template<std::size_t Index, class StructT>
constexpr decltype(auto) getStructElementByIndex(StructT & s) {
    return (pfr::get<Index>(s));
}

template<std::size_t Index, class StructT>
using structureElementTypeByIndex = pfr::tuple_element_t<Index, std::remove_cv_t<StructT>>;

template<std::size_t Index, class StructT>
static constexpr std::string_view structureElementNameByIndex = pfr::get_name<Index, std::remove_cv_t<StructT>>();

namespace detail {

template<std::size_t Index, class StructT>
consteval std::string_view field_key() {
    using Field = structureElementTypeByIndex<Index, StructT>;
    using Opts  = typename options::detail::annotation_meta_getter<Field>::options;
    if constexpr (Opts::template has_option<options::detail::key_tag>) {
        using KeyOpt = typename Opts::template get_option<options::detail::key_tag>;
        return KeyOpt::desc.toStringView();
    } else {
        return structureElementNameByIndex<Index, StructT>;
    }
}

template<class StructT, std::size_t... I>
consteval std::array<std::string_view, sizeof...(I)> field_keys(std::index_sequence<I...>) {
    return { field_key<I, StructT>()... };
}

}

// Names the decoder matches object keys against: the `key<>` option when
// the field carries one, the C++ member name otherwise.
template<class StructT>
static constexpr auto structureFieldKeys = detail::field_keys<std::remove_cv_t<StructT>>(
    std::make_index_sequence<structureElementsCount<StructT>>{});

template<class StructT>
consteval bool fieldKeysAreUnique() {
    constexpr auto & keys = structureFieldKeys<StructT>;
    for(std::size_t i = 0; i < keys.size(); i ++) {
        for(std::size_t j = i + 1; j < keys.size(); j ++) {
            if(keys[i] == keys[j]) return false;
        }
    }
    return true;
}

} // namespace introspection
} // namespace TagFusion
