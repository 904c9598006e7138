#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "docrag_core/types/chunk.hpp"
#include "docrag_core/types/document_index.hpp"

namespace docrag_core {

class OllamaClient;

class IndexStoreError : public std::exception {
 public:
  explicit IndexStoreError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

/**
 * @brief One JSON artifact per document holding its parallel arrays.
 *
 * Writes go to a uniquely named temporary file in the index directory and are
 * renamed over the target, so a reader sees either the previous index or the
 * new one. Concurrent builds of the same document are last-writer-wins.
 */
class IndexStore {
 public:
  IndexStore(const std::filesystem::path &index_dir, std::shared_ptr<OllamaClient> ollama_client);

  // Disable copy constructor and assignment
  IndexStore(const IndexStore &) = delete;
  IndexStore &operator=(const IndexStore &) = delete;

  // Embeds every chunk and replaces the document's index. Any embedding
  // failure aborts before anything is written.
  DocumentIndex build(const std::string &doc_id, const std::vector<Chunk> &chunks);

  // Missing documents load as an empty index.
  DocumentIndex load(const std::string &doc_id) const;

  void save(const std::string &doc_id, const DocumentIndex &index);
  bool exists(const std::string &doc_id) const;
  bool remove(const std::string &doc_id);

  std::filesystem::path path_for(const std::string &doc_id) const;
  const std::filesystem::path &index_dir() const {
    return index_dir_;
  }

 private:
  static void validate_doc_id(const std::string &doc_id);
  std::filesystem::path temp_path_for(const std::string &doc_id) const;

  std::filesystem::path index_dir_;
  std::shared_ptr<OllamaClient> ollama_client_;
};

}  // namespace docrag_core
