#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace docrag_core {

class PagedTextExtractorError : public std::exception {
 public:
  explicit PagedTextExtractorError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Reads text dumped by `pdftotext` and friends, where each page ends with
// a form feed.
class PagedTextExtractor {
 public:
  static constexpr char PAGE_BREAK = '\f';

  bool can_handle(const fs::path& file_path) const;

  // One string per page, in page order. Blank pages are kept so page
  // numbers stay aligned with the source document.
  std::vector<std::string> read_pages(const fs::path& file_path) const;

  static std::vector<std::string> split_pages(const std::string& content);

 private:
  std::string get_string_content(const fs::path& file_path) const;
};

}  // namespace docrag_core
