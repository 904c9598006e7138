#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "docrag_core/types/chunk.hpp"

namespace docrag_core {

class ChunkerError : public std::exception {
 public:
  explicit ChunkerError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

/**
 * @brief Splits extracted page text into overlapping fixed-size windows.
 *
 * Sizes are counted in Unicode code points, not bytes. Each page is trimmed
 * first; blank pages produce nothing. Consecutive windows of one page share
 * exactly `overlap` characters.
 */
class PageChunker {
 public:
  static constexpr size_t DEFAULT_MAX_CHARS = 1800;
  static constexpr size_t DEFAULT_OVERLAP = 200;

  explicit PageChunker(size_t max_chars = DEFAULT_MAX_CHARS, size_t overlap = DEFAULT_OVERLAP);

  // pages[i] is the text of page i + 1
  std::vector<Chunk> chunk_pages(const std::vector<std::string>& pages) const;

  size_t max_chars() const {
    return max_chars_;
  }
  size_t overlap() const {
    return overlap_;
  }

 private:
  void chunk_page(int page_number, const std::string& page_text, std::vector<Chunk>& out) const;

  size_t max_chars_;
  size_t overlap_;
};

}  // namespace docrag_core
