#pragma once

#include "types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace domore::core {

// A JSON object found embedded in free text
struct JsonCandidate {
    size_t offset = 0;        // Byte offset of the opening brace
    size_t length = 0;        // Length up to and including the closing brace
    std::string text;         // The raw span
    Json value;               // Parsed object
    bool fenced = false;      // Inside a ``` block
    std::string fence_label;  // Label of the enclosing fence, lower-cased ("json", "js", ...)
};

// Single-pass bracket-balanced scanner over agent output.
//
// Keeps a stack of open braces while tracking string literal/escape state and
// ``` fence delimiters; a fence delimiter discards any braces still open. Each
// closing brace yields a balanced span. Spans are tried outermost first: a
// parsed object is consumed whole, an unparseable one gives way to the spans
// nested inside it. Objects in any fence are returned, labelled with the fence.
// Results are non-overlapping and in order of offset.
std::vector<JsonCandidate> find_json_objects(std::string_view text);

}  // namespace domore::core
