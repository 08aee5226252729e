#pragma once

#include <string_view>
namespace TagFusion {


// Payload decoding errors: what went wrong while decoding a Value into a
// typed model.
enum class ParseError {
    NO_ERROR,

    MISSING_FIELD,
    EXCESS_FIELD,
    DUPLICATE_KEY_IN_MAP,
    NULL_IN_NON_OPTIONAL,

    NON_BOOL_IN_BOOL_VALUE,
    NON_NUMERIC_IN_NUMERIC_STORAGE,
    NUMERIC_VALUE_IS_OUT_OF_STORAGE_TYPE_RANGE,
    FLOAT_VALUE_IN_INTEGER_STORAGE,
    NON_STRING_IN_STRING_STORAGE,
    NON_ARRAY_IN_ARRAY_LIKE_VALUE,
    NON_MAP_IN_MAP_LIKE_VALUE,
    FIXED_SIZE_CONTAINER_OVERFLOW,

    TRANSFORMER_ERROR,
    TAGGED_UNION_ERROR,
    READER_ERROR
};

constexpr std::string_view error_to_string(ParseError e) {
    switch(e) {
    case ParseError::NO_ERROR: return "NO_ERROR"; break;
    case ParseError::MISSING_FIELD: return "MISSING_FIELD"; break;
    case ParseError::EXCESS_FIELD: return "EXCESS_FIELD"; break;
    case ParseError::DUPLICATE_KEY_IN_MAP: return "DUPLICATE_KEY_IN_MAP"; break;
    case ParseError::NULL_IN_NON_OPTIONAL: return "NULL_IN_NON_OPTIONAL"; break;
    case ParseError::NON_BOOL_IN_BOOL_VALUE: return "NON_BOOL_IN_BOOL_VALUE"; break;
    case ParseError::NON_NUMERIC_IN_NUMERIC_STORAGE: return "NON_NUMERIC_IN_NUMERIC_STORAGE"; break;
    case ParseError::NUMERIC_VALUE_IS_OUT_OF_STORAGE_TYPE_RANGE: return "NUMERIC_VALUE_IS_OUT_OF_STORAGE_TYPE_RANGE"; break;
    case ParseError::FLOAT_VALUE_IN_INTEGER_STORAGE: return "FLOAT_VALUE_IN_INTEGER_STORAGE"; break;
    case ParseError::NON_STRING_IN_STRING_STORAGE: return "NON_STRING_IN_STRING_STORAGE"; break;
    case ParseError::NON_ARRAY_IN_ARRAY_LIKE_VALUE: return "NON_ARRAY_IN_ARRAY_LIKE_VALUE"; break;
    case ParseError::NON_MAP_IN_MAP_LIKE_VALUE: return "NON_MAP_IN_MAP_LIKE_VALUE"; break;
    case ParseError::FIXED_SIZE_CONTAINER_OVERFLOW: return "FIXED_SIZE_CONTAINER_OVERFLOW"; break;
    case ParseError::TRANSFORMER_ERROR: return "TRANSFORMER_ERROR"; break;
    case ParseError::TAGGED_UNION_ERROR: return "TAGGED_UNION_ERROR"; break;
    case ParseError::READER_ERROR: return "READER_ERROR"; break;
    }
    return "N/A";
}


// ============================================================================
// Dispatch Errors
// ============================================================================

// Selector-resolution failures (NOT_A_MAPPING .. UNKNOWN_VARIANT) are only
// reported when no fallback case exists, or when the registry asks for a
// strict tag type. CONTENT_INVALID is reported whether or not a fallback
// exists.
enum class DispatchError {
    NO_ERROR,
    NOT_A_MAPPING,
    MISSING_TAG_FIELD,
    TAG_NOT_A_STRING,
    UNKNOWN_VARIANT,
    CONTENT_INVALID,
    FALLBACK_FAILED,
    READER_ERROR
};

constexpr std::string_view dispatch_error_to_string(DispatchError e) {
    switch(e) {
    case DispatchError::NO_ERROR: return "NO_ERROR"; break;
    case DispatchError::NOT_A_MAPPING: return "NOT_A_MAPPING"; break;
    case DispatchError::MISSING_TAG_FIELD: return "MISSING_TAG_FIELD"; break;
    case DispatchError::TAG_NOT_A_STRING: return "TAG_NOT_A_STRING"; break;
    case DispatchError::UNKNOWN_VARIANT: return "UNKNOWN_VARIANT"; break;
    case DispatchError::CONTENT_INVALID: return "CONTENT_INVALID"; break;
    case DispatchError::FALLBACK_FAILED: return "FALLBACK_FAILED"; break;
    case DispatchError::READER_ERROR: return "READER_ERROR"; break;
    }
    return "N/A";
}


// ============================================================================
// Registry Configuration Errors
// ============================================================================

enum class ConfigError {
    NO_ERROR,
    DUPLICATE_TAG,
    MULTIPLE_FALLBACKS,
    INVALID_TAG
};

constexpr std::string_view config_error_to_string(ConfigError e) {
    switch(e) {
    case ConfigError::NO_ERROR: return "NO_ERROR"; break;
    case ConfigError::DUPLICATE_TAG: return "DUPLICATE_TAG"; break;
    case ConfigError::MULTIPLE_FALLBACKS: return "MULTIPLE_FALLBACKS"; break;
    case ConfigError::INVALID_TAG: return "INVALID_TAG"; break;
    }
    return "N/A";
}

} // namespace TagFusion
