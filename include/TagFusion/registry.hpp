#pragma once

#include <array>
#include <cstddef>
#include <string_view>
#include <tuple>
#include <type_traits>

#include "const_string.hpp"
#include "decoder.hpp"
#include "errors.hpp"
#include "options.hpp"
#include "parse_result.hpp"
#include "value.hpp"

namespace TagFusion {

namespace registry_detail {
struct tagged_case_marker {};
struct fallback_marker {};
struct RegistryFactory;
}

// A known payload shape selected by the exact tag string. `DecodeFn`, when
// given, replaces the default payload decoder; it is called with the content
// value, or nullptr when the content field is absent:
//     ParseResult fn(Payload &, const Value *)
template<ConstString Tag, class Payload, auto DecodeFn = nullptr>
struct TaggedCase : registry_detail::tagged_case_marker {
    using payload_type = Payload;
    static constexpr std::string_view tag = Tag.toStringView();
    static constexpr bool tag_is_valid = Tag.check();

    static ParseResult decode(Payload & payload, const Value * content) {
        if constexpr (std::is_null_pointer_v<decltype(DecodeFn)>) {
            return DecodeField(payload, content);
        } else {
            return DecodeFn(payload, content);
        }
    }
};

// Catch-all shape decoded from the whole input when the tag selects nothing.
template<class Payload, auto DecodeFn = nullptr>
struct Fallback : registry_detail::fallback_marker {
    using payload_type = Payload;

    static ParseResult decode(Payload & payload, const Value * whole) {
        if constexpr (std::is_null_pointer_v<decltype(DecodeFn)>) {
            return DecodeField(payload, whole);
        } else {
            return DecodeFn(payload, whole);
        }
    }
};

template<class E>
concept TaggedCaseEntry = std::is_base_of_v<registry_detail::tagged_case_marker, E>;

template<class E>
concept FallbackEntry = std::is_base_of_v<registry_detail::fallback_marker, E>;

template<class E>
concept RegistryEntry = TaggedCaseEntry<E> || FallbackEntry<E>;

namespace registry_detail {

template<class E>
constexpr std::string_view entry_tag() {
    if constexpr (TaggedCaseEntry<E>) {
        return E::tag;
    } else {
        return {};
    }
}

template<class E>
constexpr bool entry_tag_valid() {
    if constexpr (TaggedCaseEntry<E>) {
        return E::tag_is_valid;
    } else {
        return true;
    }
}

template<class... Entries>
constexpr std::size_t find_fallback() {
    constexpr bool isFallback[] = {FallbackEntry<Entries>..., false};
    for(std::size_t i = 0; i < sizeof...(Entries); i ++) {
        if(isFallback[i]) return i;
    }
    return static_cast<std::size_t>(-1);
}

}


/// Ordered, immutable case table.
///
/// The variant index of an entry is its position in `Entries`, fallback
/// included. Registries are plain values: build one with BuildRegistry,
/// keep it `static`/`constexpr` and pass it by const reference. Only
/// BuildRegistry and ValidateRegistry construct them.
template<RegistryEntry... Entries>
class Registry {
public:
    using entries = std::tuple<Entries...>;

    template<std::size_t I>
    using entry_type = std::tuple_element_t<I, entries>;

    static constexpr std::size_t size = sizeof...(Entries);
    static constexpr std::size_t npos = static_cast<std::size_t>(-1);
    static constexpr std::size_t tagged_count = (std::size_t(0) + ... + (TaggedCaseEntry<Entries> ? 1 : 0));

private:
    static constexpr std::array<std::string_view, size> tags_by_index = {registry_detail::entry_tag<Entries>()...};
    static constexpr std::array<bool, size> is_tagged = {TaggedCaseEntry<Entries>...};
    static constexpr std::array<bool, size> tags_valid = {registry_detail::entry_tag_valid<Entries>()...};

    bool m_strictTagType = false;

public:
    static constexpr std::size_t fallback_index = registry_detail::find_fallback<Entries...>();
    static constexpr bool has_fallback = fallback_index != npos;

private:
    friend struct registry_detail::RegistryFactory;

    constexpr Registry() = default;
    constexpr explicit Registry(bool strictTagType): m_strictTagType(strictTagType) {}

public:
    // A non-string tag is TAG_NOT_A_STRING even when a fallback exists.
    constexpr bool strict_tag_type() const {
        return m_strictTagType;
    }

    // Tags of the tagged cases, in declaration order.
    static constexpr std::array<std::string_view, tagged_count> known_tags() {
        std::array<std::string_view, tagged_count> out{};
        std::size_t j = 0;
        for(std::size_t i = 0; i < size; i ++) {
            if(is_tagged[i]) out[j++] = tags_by_index[i];
        }
        return out;
    }

    // Entry index of the first case whose tag equals `tag` byte for byte.
    static constexpr std::size_t find_tag(std::string_view tag) {
        for(std::size_t i = 0; i < size; i ++) {
            if(is_tagged[i] && tags_by_index[i] == tag) return i;
        }
        return npos;
    }

    // Empty for the fallback entry.
    static constexpr std::string_view tag_of(std::size_t index) {
        return index < size ? tags_by_index[index] : std::string_view{};
    }

    static constexpr bool is_tagged_entry(std::size_t index) {
        return index < size && is_tagged[index];
    }

    static constexpr bool tag_is_valid(std::size_t index) {
        return index < size && tags_valid[index];
    }
};


namespace registry_detail {
// Not constexpr: reaching it while constant-evaluating makes an invalid
// registry a compile error.
inline void registry_has_configuration_error() {}
}

template<class RegistryT>
class RegistryBuildResult {
    RegistryT m_registry;
    ConfigError m_error = ConfigError::NO_ERROR;
    std::string_view m_tag;

public:
    constexpr RegistryBuildResult(RegistryT r, ConfigError err = ConfigError::NO_ERROR, std::string_view tag = {}):
        m_registry(r), m_error(err), m_tag(tag)
    {}

    constexpr operator bool() const {
        return m_error == ConfigError::NO_ERROR;
    }
    constexpr ConfigError error() const {
        return m_error;
    }
    // Offending tag for DUPLICATE_TAG and INVALID_TAG.
    constexpr std::string_view tag() const {
        return m_tag;
    }

    constexpr const RegistryT & value() const {
        if consteval {
            if(m_error != ConfigError::NO_ERROR) {
                registry_detail::registry_has_configuration_error();
            }
        }
        return m_registry;
    }
    constexpr const RegistryT & operator*() const {
        return value();
    }
    constexpr const RegistryT * operator->() const {
        return &value();
    }
};

namespace registry_detail {

struct TableCheck {
    ConfigError error = ConfigError::NO_ERROR;
    std::string_view tag;
};

// Table validation only needs the entry types.
template<class R>
constexpr TableCheck CheckTable() {
    if(R::size - R::tagged_count > 1) {
        return {ConfigError::MULTIPLE_FALLBACKS, {}};
    }
    for(std::size_t i = 0; i < R::size; i ++) {
        if(!R::is_tagged_entry(i)) continue;
        if(!R::tag_is_valid(i)) {
            return {ConfigError::INVALID_TAG, R::tag_of(i)};
        }
        for(std::size_t j = i + 1; j < R::size; j ++) {
            if(R::is_tagged_entry(j) && R::tag_of(j) == R::tag_of(i)) {
                return {ConfigError::DUPLICATE_TAG, R::tag_of(i)};
            }
        }
    }
    return {};
}

template<class R>
constexpr RegistryBuildResult<R> Validate(R r) {
    constexpr TableCheck check = CheckTable<R>();
    return RegistryBuildResult<R>(r, check.error, check.tag);
}

template<class... Opts>
constexpr bool strict_tag_type_requested() {
    return options::detail::field_options<OptionsPack<Opts...>>::template has_option<options::detail::strict_tag_type_tag>;
}

struct RegistryFactory {
    template<class R>
    static constexpr R make(bool strictTagType = false) {
        return R(strictTagType);
    }
};

}

// A case table whose entries passed validation. TaggedUnion and Dispatch
// accept nothing else, so a table with duplicate tags, two fallbacks or a
// bad tag cannot be dispatched at all.
template<class R>
concept ValidRegistry = requires {
    R::size;
    R::tagged_count;
} && (registry_detail::CheckTable<R>().error == ConfigError::NO_ERROR);

// Builds and validates a case table. Fails with DUPLICATE_TAG (two cases
// share a tag), MULTIPLE_FALLBACKS or INVALID_TAG (control characters in a
// tag). Zero tagged cases and zero fallbacks are both valid.
template<RegistryEntry... Entries>
constexpr RegistryBuildResult<Registry<Entries...>> BuildRegistry(Entries...) {
    return registry_detail::Validate(registry_detail::RegistryFactory::make<Registry<Entries...>>());
}

// Same, with registry options: BuildRegistry(OptionsPack<options::strict_tag_type>{}, ...)
template<class... Opts, RegistryEntry... Entries>
constexpr RegistryBuildResult<Registry<Entries...>> BuildRegistry(OptionsPack<Opts...>, Entries...) {
    return registry_detail::Validate(
        registry_detail::RegistryFactory::make<Registry<Entries...>>(registry_detail::strict_tag_type_requested<Opts...>()));
}

// static_assert(ValidateRegistry<TaggedCase<"A", int>, Fallback<Value>>());
template<RegistryEntry... Entries>
consteval RegistryBuildResult<Registry<Entries...>> ValidateRegistry() {
    return registry_detail::Validate(registry_detail::RegistryFactory::make<Registry<Entries...>>());
}

} // namespace TagFusion
