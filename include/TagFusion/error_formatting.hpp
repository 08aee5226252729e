#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "dispatcher.hpp"
#include "errors.hpp"
#include "parse_result.hpp"
#include "registry.hpp"

namespace TagFusion {

namespace error_formatting_detail {

inline std::string quoted(std::string_view s) {
    return "\"" + std::string(s) + "\"";
}

}

// "When decoding $.resource.b, error 'MISSING_FIELD'"
inline std::string ParseResultToString(const ParseResult & res) {
    if(res) {
        return "NO_ERROR";
    }
    std::string out;
    if(res.error() == ParseError::READER_ERROR) {
        out = "When reading input at byte " + std::to_string(res.pos()) + ", error 'READER_ERROR'";
    } else {
        out = "When decoding " + res.errorPath().to_string() + ", error '" + std::string(error_to_string(res.error())) + "'";
    }
    if(!res.detail().empty()) {
        out += ": " + std::string(res.detail());
    }
    return out;
}

inline std::string DispatchResultToString(const DispatchResult & res) {
    using error_formatting_detail::quoted;

    std::string out(dispatch_error_to_string(res.error()));
    switch(res.error()) {
    case DispatchError::NO_ERROR:
        break;
    case DispatchError::NOT_A_MAPPING:
        out += ": expected an object, found " + std::string(kind_to_string(res.found_kind()));
        break;
    case DispatchError::MISSING_TAG_FIELD:
        out += ": no " + quoted(res.tag_field()) + " field";
        break;
    case DispatchError::TAG_NOT_A_STRING:
        out += ": " + quoted(res.tag_field()) + " holds " + std::string(kind_to_string(res.found_kind()));
        break;
    case DispatchError::UNKNOWN_VARIANT: {
        out += ": " + quoted(res.tag_value()) + ", known tags: [";
        for(std::size_t i = 0; i < res.known_tags().size(); i ++) {
            if(i) out += ", ";
            out += quoted(res.known_tags()[i]);
        }
        out += "]";
        break;
    }
    case DispatchError::CONTENT_INVALID:
        out += " in case #" + std::to_string(res.variant_index()) + " " + quoted(res.tag_value())
               + ". " + ParseResultToString(res.inner());
        break;
    case DispatchError::FALLBACK_FAILED:
    case DispatchError::READER_ERROR:
        out += ". " + ParseResultToString(res.inner());
        break;
    }
    return out;
}

template<class RegistryT>
std::string RegistryResultToString(const RegistryBuildResult<RegistryT> & res) {
    std::string out(config_error_to_string(res.error()));
    if(!res.tag().empty()) {
        out += ": " + error_formatting_detail::quoted(res.tag());
    }
    return out;
}

} // namespace TagFusion
