#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "errors.hpp"
#include "parse_result.hpp"
#include "path.hpp"
#include "registry.hpp"
#include "tagged_union.hpp"
#include "value.hpp"

namespace TagFusion {

enum class SelectorAction {
    USE_FALLBACK,
    REPORT_ERROR
};

// Policy table of the dispatcher. Only selector-resolution failures may be
// answered with the fallback; content and fallback failures are always
// reported.
constexpr SelectorAction ClassifySelectorFailure(DispatchError failure, bool hasFallback, bool strictTagType = false) {
    switch(failure) {
    case DispatchError::NOT_A_MAPPING:
    case DispatchError::MISSING_TAG_FIELD:
    case DispatchError::UNKNOWN_VARIANT:
        return hasFallback ? SelectorAction::USE_FALLBACK : SelectorAction::REPORT_ERROR;
    case DispatchError::TAG_NOT_A_STRING:
        return hasFallback && !strictTagType ? SelectorAction::USE_FALLBACK : SelectorAction::REPORT_ERROR;
    case DispatchError::NO_ERROR:
    case DispatchError::CONTENT_INVALID:
    case DispatchError::FALLBACK_FAILED:
    case DispatchError::READER_ERROR:
        return SelectorAction::REPORT_ERROR;
    }
    return SelectorAction::REPORT_ERROR;
}


/// Outcome of one dispatch call.
///
/// Which details are meaningful depends on the error:
///  - NOT_A_MAPPING, TAG_NOT_A_STRING: found_kind()
///  - MISSING_TAG_FIELD, TAG_NOT_A_STRING: tag_field()
///  - UNKNOWN_VARIANT: tag_value(), known_tags()
///  - CONTENT_INVALID: variant_index(), tag_value(), inner()
///  - FALLBACK_FAILED, READER_ERROR: inner()
/// On success variant_index() is the entry index stored in the union.
class DispatchResult {
public:
    static constexpr std::size_t npos = static_cast<std::size_t>(-1);

    DispatchResult() = default;

    static DispatchResult success(std::size_t variantIndex) {
        DispatchResult r;
        r.m_variantIndex = variantIndex;
        return r;
    }

    static DispatchResult notAMapping(ValueKind found) {
        DispatchResult r(DispatchError::NOT_A_MAPPING);
        r.m_foundKind = found;
        return r;
    }

    static DispatchResult missingTagField(std::string_view tagField) {
        DispatchResult r(DispatchError::MISSING_TAG_FIELD);
        r.m_tagField = tagField;
        return r;
    }

    static DispatchResult tagNotAString(std::string_view tagField, ValueKind found) {
        DispatchResult r(DispatchError::TAG_NOT_A_STRING);
        r.m_tagField = tagField;
        r.m_foundKind = found;
        return r;
    }

    template<std::size_t N>
    static DispatchResult unknownVariant(std::string_view tagField, std::string_view tagValue,
                                         const std::array<std::string_view, N> & knownTags) {
        DispatchResult r(DispatchError::UNKNOWN_VARIANT);
        r.m_tagField = tagField;
        r.m_tagValue = tagValue;
        r.m_knownTags.assign(knownTags.begin(), knownTags.end());
        return r;
    }

    static DispatchResult contentInvalid(std::size_t variantIndex, std::string_view tagValue, ParseResult inner) {
        DispatchResult r(DispatchError::CONTENT_INVALID);
        r.m_variantIndex = variantIndex;
        r.m_tagValue = tagValue;
        r.m_inner = std::move(inner);
        return r;
    }

    static DispatchResult fallbackFailed(std::size_t variantIndex, ParseResult inner) {
        DispatchResult r(DispatchError::FALLBACK_FAILED);
        r.m_variantIndex = variantIndex;
        r.m_inner = std::move(inner);
        return r;
    }

    static DispatchResult readerError(ParseResult inner) {
        DispatchResult r(DispatchError::READER_ERROR);
        r.m_inner = std::move(inner);
        return r;
    }

    operator bool() const {
        return m_error == DispatchError::NO_ERROR;
    }

    DispatchError error() const {
        return m_error;
    }
    std::string_view tag_field() const {
        return m_tagField;
    }
    std::string_view tag_value() const {
        return m_tagValue;
    }
    const std::vector<std::string_view> & known_tags() const {
        return m_knownTags;
    }
    std::size_t variant_index() const {
        return m_variantIndex;
    }
    ValueKind found_kind() const {
        return m_foundKind;
    }
    // Error of the payload decoder (CONTENT_INVALID), of the fallback
    // decoder (FALLBACK_FAILED) or of the JSON reader (READER_ERROR).
    const ParseResult & inner() const {
        return m_inner;
    }

private:
    explicit DispatchResult(DispatchError err): m_error(err) {}

    DispatchError m_error = DispatchError::NO_ERROR;
    std::string m_tagField;
    std::string m_tagValue;
    // Tags are views of the registry's static storage.
    std::vector<std::string_view> m_knownTags;
    std::size_t m_variantIndex = npos;
    ValueKind m_foundKind = ValueKind::Null;
    ParseResult m_inner;
};


namespace dispatcher_details {

template<std::size_t I, class RegistryT>
DispatchResult DecodeCaseAt(TaggedUnion<RegistryT> & out, const Value * content, std::string_view contentField) {
    using Entry = typename RegistryT::template entry_type<I>;
    typename Entry::payload_type payload{};
    ParseResult r = Entry::decode(payload, content);
    if(!r) {
        r.errorPath().prepend(path::Path(contentField));
        return DispatchResult::contentInvalid(I, RegistryT::tag_of(I), std::move(r));
    }
    out.template emplace<I>(std::move(payload));
    return DispatchResult::success(I);
}

template<class RegistryT, std::size_t... I>
DispatchResult DecodeCase(TaggedUnion<RegistryT> & out, std::size_t index, const Value * content,
                          std::string_view contentField, std::index_sequence<I...>) {
    DispatchResult res;
    (void)((index == I ? (res = DecodeCaseAt<I>(out, content, contentField), true) : false) || ...);
    return res;
}

// The fallback sees the whole input, tag and content fields included.
template<class RegistryT>
DispatchResult ResolveSelectorFailure(TaggedUnion<RegistryT> & out, const Value & raw,
                                      DispatchResult failure, const RegistryT & registry) {
    if(ClassifySelectorFailure(failure.error(), RegistryT::has_fallback, registry.strict_tag_type())
        == SelectorAction::REPORT_ERROR) {
        return failure;
    }
    if constexpr (RegistryT::has_fallback) {
        constexpr std::size_t I = RegistryT::fallback_index;
        using Entry = typename RegistryT::template entry_type<I>;
        typename Entry::payload_type payload{};
        ParseResult r = Entry::decode(payload, &raw);
        if(!r) {
            return DispatchResult::fallbackFailed(I, std::move(r));
        }
        out.template emplace<I>(std::move(payload));
        return DispatchResult::success(I);
    } else {
        return failure;
    }
}

}

/// Decodes an adjacently tagged value.
///
/// Reads `tag_field` of `raw`, decodes `content_field` with the matching
/// case, and falls back to decoding the whole `raw` only when the tag does
/// not select a case. A case that is selected and fails to decode reports
/// CONTENT_INVALID even when a fallback exists. `out` is written only on
/// success.
template<ValidRegistry RegistryT>
DispatchResult Dispatch(TaggedUnion<RegistryT> & out, const Value & raw, std::string_view tag_field,
                        std::string_view content_field, const RegistryT & registry) {
    if(!raw.is_object()) {
        return dispatcher_details::ResolveSelectorFailure(out, raw, DispatchResult::notAMapping(raw.kind()), registry);
    }

    const Value * tag = raw.find(tag_field);
    if(!tag) {
        return dispatcher_details::ResolveSelectorFailure(out, raw, DispatchResult::missingTagField(tag_field), registry);
    }
    const std::string * tagValue = tag->get_string();
    if(!tagValue) {
        return dispatcher_details::ResolveSelectorFailure(out, raw,
            DispatchResult::tagNotAString(tag_field, tag->kind()), registry);
    }

    const std::size_t index = RegistryT::find_tag(*tagValue);
    if(index == RegistryT::npos) {
        return dispatcher_details::ResolveSelectorFailure(out, raw,
            DispatchResult::unknownVariant(tag_field, *tagValue, RegistryT::known_tags()), registry);
    }

    return dispatcher_details::DecodeCase(out, index, raw.find(content_field), content_field,
                                          std::make_index_sequence<RegistryT::size>{});
}

} // namespace TagFusion
