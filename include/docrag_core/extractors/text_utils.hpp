#pragma once

#include <cstddef>
#include <string>

namespace docrag_core {
namespace textutil {

// Strips ASCII whitespace from both ends.
std::string trim(const std::string& text);

// Replaces invalid UTF-8 sequences with U+FFFD.
std::string to_valid_utf8(const std::string& text);

// Prefix of at most `max_chars` code points. `text` must be valid UTF-8.
std::string truncate_chars(const std::string& text, size_t max_chars);

// Turns every '\n' and '\r' into a space.
std::string single_line(std::string text);

}  // namespace textutil
}  // namespace docrag_core
