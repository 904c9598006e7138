#include "docrag_core/extractors/text_utils.hpp"

#include <utf8.h>

#include <algorithm>
#include <iterator>

namespace docrag_core {
namespace textutil {

namespace {
constexpr const char* WHITESPACE = " \t\n\r\f\v";
}

std::string trim(const std::string& text) {
  const size_t first = text.find_first_not_of(WHITESPACE);
  if (first == std::string::npos) {
    return "";
  }
  const size_t last = text.find_last_not_of(WHITESPACE);
  return text.substr(first, last - first + 1);
}

std::string to_valid_utf8(const std::string& text) {
  if (utf8::is_valid(text.begin(), text.end())) {
    return text;
  }
  std::string valid;
  utf8::replace_invalid(text.begin(), text.end(), std::back_inserter(valid));
  return valid;
}

std::string truncate_chars(const std::string& text, size_t max_chars) {
  auto it = text.begin();
  for (size_t count = 0; it != text.end() && count < max_chars; ++count) {
    utf8::next(it, text.end());
  }
  return std::string(text.begin(), it);
}

std::string single_line(std::string text) {
  std::replace(text.begin(), text.end(), '\n', ' ');
  std::replace(text.begin(), text.end(), '\r', ' ');
  return text;
}

}  // namespace textutil
}  // namespace docrag_core
