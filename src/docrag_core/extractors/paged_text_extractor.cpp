#include "docrag_core/extractors/paged_text_extractor.hpp"

#include <fstream>
#include <sstream>

namespace docrag_core {

bool PagedTextExtractor::can_handle(const fs::path& file_path) const {
  const std::string extension = file_path.extension().string();
  return extension == ".txt";
}

std::string PagedTextExtractor::get_string_content(const fs::path& file_path) const {
  std::ifstream file_stream(file_path, std::ios::binary);
  if (!file_stream.is_open()) {
    throw PagedTextExtractorError("Could not open file: " + file_path.string());
  }

  std::stringstream buffer;
  buffer << file_stream.rdbuf();
  return buffer.str();
}

std::vector<std::string> PagedTextExtractor::read_pages(const fs::path& file_path) const {
  if (!can_handle(file_path)) {
    throw PagedTextExtractorError("Unsupported file type: " + file_path.string());
  }
  return split_pages(get_string_content(file_path));
}

std::vector<std::string> PagedTextExtractor::split_pages(const std::string& content) {
  std::vector<std::string> pages;
  if (content.empty()) {
    return pages;
  }

  size_t start = 0;
  while (start <= content.size()) {
    const size_t brk = content.find(PAGE_BREAK, start);
    if (brk == std::string::npos) {
      // Text after the last form feed is only a page if there is any.
      if (start < content.size()) {
        pages.push_back(content.substr(start));
      }
      break;
    }
    pages.push_back(content.substr(start, brk - start));
    start = brk + 1;
  }
  return pages;
}

}  // namespace docrag_core
