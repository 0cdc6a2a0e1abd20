#pragma once

#include <string_view>

#include "signalbox/core/protocol/parser/result.hpp"

#include <simdjson.h>

/*
================================================================================
JSON Parsing Helpers (Low-Level Primitives)
================================================================================

Low-level, allocation-free helpers used by the inbound parser to extract
primitive JSON values from simdjson DOM elements.

Responsibilities:
  • Enforce basic JSON structural rules (object presence, type correctness)
  • Parse primitive field types
  • Never allocate memory
  • Never perform domain validation
  • Never log or report errors

IMPORTANT:
  - Helpers MUST NOT interpret values semantically
  - Helpers MUST NOT emit logs
  - Helpers MUST NOT throw exceptions

================================================================================
*/


namespace signalbox::core::protocol::parser::helper {

// ============================================================================
// ROOT TYPE
// ============================================================================

[[nodiscard]]
inline parser::Result require_object(const simdjson::dom::element& root) noexcept {
    return (root.type() == simdjson::dom::element_type::OBJECT) ? parser::Result::Ok : parser::Result::InvalidSchema;
}

// ============================================================================
// REQUIRED FIELD PARSERS
// ============================================================================

// The returned view points into the parser's document: valid until the next
// parse on the same simdjson parser.
[[nodiscard]]
inline parser::Result parse_string_required(const simdjson::dom::element& obj, const char* key, std::string_view& out) noexcept {
    // Parent must be an object
    if (require_object(obj) != parser::Result::Ok) {
        return parser::Result::InvalidSchema;
    }
    // Lookup field
    auto field = obj[key];
    if (field.error()) {
        return parser::Result::InvalidSchema;
    }
    // Extract string
    if (field.get(out)) {
        return parser::Result::InvalidSchema;
    }
    return parser::Result::Ok;
}

} // namespace signalbox::core::protocol::parser::helper
