#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

#include "path.hpp"
#include "errors.hpp"

namespace TagFusion {


// Outcome of decoding one Value into a typed model (or of reading JSON text
// into a Value). Converts to true on success.
class ParseResult {
    ParseError m_error = ParseError::NO_ERROR;
    path::Path currentPath;
    std::string m_detail;
    std::size_t m_pos = 0;

public:
    ParseResult() = default;
    ParseResult(ParseError err, path::Path p, std::string detail = {}, std::size_t pos = 0):
        m_error(err), currentPath(std::move(p)), m_detail(std::move(detail)), m_pos(pos)
    {}

    static ParseResult success() { return ParseResult{}; }

    operator bool() const {
        return m_error == ParseError::NO_ERROR;
    }

    ParseError error() const {
        return m_error;
    }
    const path::Path & errorPath() const {
        return currentPath;
    }
    path::Path & errorPath() {
        return currentPath;
    }
    // Free-form context: reader messages, custom decoder text, rendered
    // diagnostics of a nested tagged union.
    std::string_view detail() const {
        return m_detail;
    }
    // Byte offset in the source text, meaningful for READER_ERROR only.
    std::size_t pos() const {
        return m_pos;
    }
};

} // namespace TagFusion
