#include "docrag_core/extractors/page_chunker.hpp"

#include <utf8.h>

#include <algorithm>

#include "docrag_core/extractors/text_utils.hpp"

namespace docrag_core {

PageChunker::PageChunker(size_t max_chars, size_t overlap)
    : max_chars_(max_chars), overlap_(overlap) {
  if (max_chars_ == 0) {
    throw ChunkerError("max_chars must be greater than 0");
  }
  if (overlap_ >= max_chars_) {
    throw ChunkerError("overlap (" + std::to_string(overlap_) +
                       ") must be smaller than max_chars (" + std::to_string(max_chars_) + ")");
  }
}

std::vector<Chunk> PageChunker::chunk_pages(const std::vector<std::string>& pages) const {
  std::vector<Chunk> chunks;
  for (size_t i = 0; i < pages.size(); ++i) {
    chunk_page(static_cast<int>(i + 1), pages[i], chunks);
  }
  return chunks;
}

void PageChunker::chunk_page(int page_number,
                             const std::string& page_text,
                             std::vector<Chunk>& out) const {
  // Extracted PDF text is not guaranteed to be valid UTF-8.
  const std::string text = textutil::trim(textutil::to_valid_utf8(page_text));
  if (text.empty()) {
    return;
  }

  // Byte offset of every code point, plus the end of the string.
  std::vector<size_t> offsets;
  offsets.reserve(text.size() + 1);
  for (auto it = text.begin(); it != text.end(); utf8::next(it, text.end())) {
    offsets.push_back(static_cast<size_t>(it - text.begin()));
  }
  const size_t length = offsets.size();
  offsets.push_back(text.size());

  size_t start = 0;
  while (start < length) {
    const size_t end = std::min(length, start + max_chars_);
    out.push_back({page_number, text.substr(offsets[start], offsets[end] - offsets[start])});
    if (end == length) {
      break;
    }
    start = end - overlap_;
  }
}

}  // namespace docrag_core
