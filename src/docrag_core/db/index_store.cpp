#include "docrag_core/db/index_store.hpp"

#include <atomic>
#include <chrono>
#include <fstream>
#include <functional>
#include <iostream>
#include <sstream>
#include <thread>

#include <nlohmann/json.hpp>

#include "docrag_core/llm/ollama_client.hpp"

namespace docrag_core {

namespace {

constexpr const char *INDEX_EXTENSION = ".json";

std::atomic<unsigned long long> temp_counter{0};

}  // namespace

IndexStore::IndexStore(const std::filesystem::path &index_dir,
                       std::shared_ptr<OllamaClient> ollama_client)
    : index_dir_(index_dir), ollama_client_(std::move(ollama_client)) {
  std::error_code ec;
  std::filesystem::create_directories(index_dir_, ec);
  if (ec) {
    throw IndexStoreError("Could not create index directory " + index_dir_.string() + ": " +
                          ec.message());
  }
}

void IndexStore::validate_doc_id(const std::string &doc_id) {
  if (doc_id.empty()) {
    throw IndexStoreError("Document id cannot be empty");
  }
  if (doc_id.front() == '.') {
    throw IndexStoreError("Document id cannot start with '.': " + doc_id);
  }
  for (char c : doc_id) {
    const bool allowed = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                         (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.';
    if (!allowed) {
      throw IndexStoreError("Document id contains an invalid character: " + doc_id);
    }
  }
}

std::filesystem::path IndexStore::path_for(const std::string &doc_id) const {
  validate_doc_id(doc_id);
  return index_dir_ / (doc_id + INDEX_EXTENSION);
}

std::filesystem::path IndexStore::temp_path_for(const std::string &doc_id) const {
  std::ostringstream name;
  name << "." << doc_id << "." << std::hash<std::thread::id>{}(std::this_thread::get_id())
       << "." << std::chrono::steady_clock::now().time_since_epoch().count() << "."
       << temp_counter.fetch_add(1) << ".tmp";
  return index_dir_ / name.str();
}

DocumentIndex IndexStore::build(const std::string &doc_id, const std::vector<Chunk> &chunks) {
  validate_doc_id(doc_id);

  DocumentIndex index;
  index.texts.reserve(chunks.size());
  index.pages.reserve(chunks.size());
  for (const auto &chunk : chunks) {
    if (chunk.text.empty()) {
      throw IndexStoreError("Refusing to index an empty chunk for document " + doc_id);
    }
    index.texts.push_back(chunk.text);
    index.pages.push_back(chunk.page);
  }

  if (!index.texts.empty()) {
    if (!ollama_client_) {
      throw IndexStoreError("No embedding provider configured for document " + doc_id);
    }
    std::cout << "[IndexStore] Embedding " << index.texts.size() << " chunks for document "
              << doc_id << std::endl;
    index.embeddings = ollama_client_->get_embeddings(index.texts);

    if (index.embeddings.size() != index.texts.size()) {
      throw IndexStoreError("Embedding provider returned " +
                            std::to_string(index.embeddings.size()) + " vectors for " +
                            std::to_string(index.texts.size()) + " chunks");
    }
    for (const auto &vec : index.embeddings) {
      if (vec.empty()) {
        throw IndexStoreError("Received empty embedding for a chunk of document " + doc_id);
      }
    }
    if (!index.is_consistent()) {
      throw IndexStoreError("Embedding provider returned vectors of differing dimensions");
    }
  }

  save(doc_id, index);
  std::cout << "[IndexStore] Indexed document " << doc_id << " with " << index.size()
            << " chunks" << std::endl;
  return index;
}

void IndexStore::save(const std::string &doc_id, const DocumentIndex &index) {
  const std::filesystem::path target = path_for(doc_id);
  if (!index.is_consistent()) {
    throw IndexStoreError("Refusing to persist an inconsistent index for document " + doc_id);
  }
  for (int page : index.pages) {
    if (page < 1) {
      throw IndexStoreError("Refusing to persist page " + std::to_string(page) + " for document " +
                            doc_id + ", pages are 1-based");
    }
  }

  nlohmann::json record;
  record["texts"] = index.texts;
  record["pages"] = index.pages;
  record["embeddings"] = index.embeddings;
  const std::string payload = record.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

  const std::filesystem::path temp = temp_path_for(doc_id);
  {
    std::ofstream out(temp, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
      throw IndexStoreError("Could not open temporary index file: " + temp.string());
    }
    out << payload;
    out.flush();
    if (!out) {
      out.close();
      std::error_code ignored;
      std::filesystem::remove(temp, ignored);
      throw IndexStoreError("Failed to write temporary index file: " + temp.string());
    }
  }

  std::error_code ec;
  std::filesystem::rename(temp, target, ec);
  if (ec) {
    std::error_code ignored;
    std::filesystem::remove(temp, ignored);
    throw IndexStoreError("Failed to replace index " + target.string() + ": " + ec.message());
  }
}

DocumentIndex IndexStore::load(const std::string &doc_id) const {
  const std::filesystem::path path = path_for(doc_id);
  DocumentIndex index;

  std::error_code ec;
  if (!std::filesystem::exists(path, ec) && !ec) {
    // No index yet reads as an empty document.
    return index;
  }
  std::ifstream in(path, std::ios::binary);
  if (ec || !in.is_open()) {
    throw IndexStoreError("Could not open index for document " + doc_id + ": " + path.string());
  }

  try {
    nlohmann::json record = nlohmann::json::parse(in);
    index.texts = record.value("texts", std::vector<std::string>{});
    index.pages = record.value("pages", std::vector<int>{});
    index.embeddings = record.value("embeddings", std::vector<std::vector<float>>{});
  } catch (const nlohmann::json::exception &e) {
    throw IndexStoreError("Corrupt index for document " + doc_id + ": " + e.what());
  }

  if (!index.is_consistent()) {
    throw IndexStoreError("Corrupt index for document " + doc_id + ": " +
                          std::to_string(index.texts.size()) + " texts, " +
                          std::to_string(index.pages.size()) + " pages, " +
                          std::to_string(index.embeddings.size()) + " embeddings");
  }
  for (size_t i = 0; i < index.pages.size(); ++i) {
    if (index.pages[i] < 1) {
      throw IndexStoreError("Corrupt index for document " + doc_id + ": chunk " +
                            std::to_string(i) + " has page " + std::to_string(index.pages[i]));
    }
  }
  return index;
}

bool IndexStore::exists(const std::string &doc_id) const {
  return std::filesystem::exists(path_for(doc_id));
}

bool IndexStore::remove(const std::string &doc_id) {
  std::error_code ec;
  const bool removed = std::filesystem::remove(path_for(doc_id), ec);
  if (ec) {
    throw IndexStoreError("Failed to remove index for document " + doc_id + ": " + ec.message());
  }
  return removed;
}

}  // namespace docrag_core
