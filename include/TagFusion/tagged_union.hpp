#pragma once

#include <cstddef>
#include <string_view>
#include <utility>
#include <variant>

#include "registry.hpp"

namespace TagFusion {

namespace tagged_union_detail {

template<class R, class Seq>
struct storage_for;

template<class R, std::size_t... I>
struct storage_for<R, std::index_sequence<I...>> {
    using type = std::variant<std::monostate, typename R::template entry_type<I>::payload_type...>;
};

}

/// Result of a successful dispatch: exactly one alternative of the registry,
/// either a tagged case with its decoded payload or the fallback payload.
///
/// Alternatives are addressed by registry entry index, so two cases sharing
/// a payload type stay distinguishable. A default-constructed union holds
/// nothing (`has_value() == false`) until a dispatch assigns it.
template<ValidRegistry RegistryT>
class TaggedUnion {
public:
    using registry_type = RegistryT;
    using storage_type = typename tagged_union_detail::storage_for<
        RegistryT, std::make_index_sequence<RegistryT::size>>::type;

    template<std::size_t I>
    using payload_type = typename RegistryT::template entry_type<I>::payload_type;

    static constexpr std::size_t npos = RegistryT::npos;

    TaggedUnion() = default;

    bool has_value() const {
        return storage.index() != 0;
    }

    // Registry entry index of the held alternative, npos when empty.
    std::size_t index() const {
        return has_value() ? storage.index() - 1 : npos;
    }

    bool is_fallback() const {
        return RegistryT::has_fallback && index() == RegistryT::fallback_index;
    }

    // Tag of the held case; empty for the fallback and for an empty union.
    std::string_view tag() const {
        return RegistryT::tag_of(index());
    }

    template<std::size_t I>
    payload_type<I> & get() {
        return std::get<I + 1>(storage);
    }
    template<std::size_t I>
    const payload_type<I> & get() const {
        return std::get<I + 1>(storage);
    }

    template<std::size_t I>
    payload_type<I> * get_if() {
        return std::get_if<I + 1>(&storage);
    }
    template<std::size_t I>
    const payload_type<I> * get_if() const {
        return std::get_if<I + 1>(&storage);
    }

    template<std::size_t I, class... Args>
    payload_type<I> & emplace(Args &&... args) {
        return storage.template emplace<I + 1>(std::forward<Args>(args)...);
    }

    // Calls `f(payload)` with the held payload, or `f(std::monostate{})`
    // when the union is empty.
    template<class F>
    decltype(auto) visit(F && f) {
        return std::visit(std::forward<F>(f), storage);
    }
    template<class F>
    decltype(auto) visit(F && f) const {
        return std::visit(std::forward<F>(f), storage);
    }

    const storage_type & variant() const {
        return storage;
    }

private:
    storage_type storage;
};

} // namespace TagFusion
