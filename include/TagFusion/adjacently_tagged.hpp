#pragma once

#include <cstddef>
#include <string_view>
#include <utility>

#include "const_string.hpp"
#include "dispatcher.hpp"
#include "error_formatting.hpp"
#include "parse_result.hpp"
#include "registry.hpp"
#include "tagged_union.hpp"
#include "value.hpp"

namespace TagFusion {

/// Model type for an adjacently tagged union with fixed field names, usable
/// as a field of ordinary structs:
///
///     struct Envelope {
///         std::string id;
///         AdjacentlyTagged<"resourceType", "resource",
///             TaggedCase<"Number", std::uint64_t>,
///             TaggedCase<"Complex", Complex>,
///             Fallback<Value>> body;
///     };
///
/// The case table is validated at compile time. A dispatch failure is
/// reported by the struct decoder as TAGGED_UNION_ERROR at the field path;
/// for content and fallback failures the path continues into the payload.
template<ConstString TagField, ConstString ContentField, RegistryEntry... Entries>
struct AdjacentlyTagged {
    using registry_type = Registry<Entries...>;
    using union_type = TaggedUnion<registry_type>;

    static constexpr std::string_view tag_field = TagField.toStringView();
    static constexpr std::string_view content_field = ContentField.toStringView();
    static constexpr registry_type registry = *BuildRegistry(Entries{}...);

    union_type value;

    ParseResult decode_tagged(const Value & v) {
        DispatchResult r = Dispatch(value, v, tag_field, content_field, registry);
        if(r) {
            return ParseResult::success();
        }
        path::Path where;
        if(r.error() == DispatchError::CONTENT_INVALID || r.error() == DispatchError::FALLBACK_FAILED) {
            where = r.inner().errorPath();
        }
        return ParseResult(ParseError::TAGGED_UNION_ERROR, std::move(where), DispatchResultToString(r));
    }

    std::size_t index() const { return value.index(); }
    bool is_fallback() const { return value.is_fallback(); }
    std::string_view tag() const { return value.tag(); }

    template<std::size_t I>
    auto & get() { return value.template get<I>(); }
    template<std::size_t I>
    const auto & get() const { return value.template get<I>(); }

    template<std::size_t I>
    auto * get_if() { return value.template get_if<I>(); }
    template<std::size_t I>
    const auto * get_if() const { return value.template get_if<I>(); }
};

} // namespace TagFusion
