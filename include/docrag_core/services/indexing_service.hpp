#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "docrag_core/db/index_store.hpp"
#include "docrag_core/extractors/page_chunker.hpp"

namespace docrag_core {

class IndexingService {
 public:
  struct IndexingResult {
    std::string doc_id;
    size_t chunks;
  };
  struct OverviewEntry {
    int page;
    std::string preview;
  };
  struct IndexOverview {
    size_t chunks;
    std::vector<OverviewEntry> entries;
  };

  static constexpr size_t DEFAULT_OVERVIEW_ENTRIES = 5;
  static constexpr size_t DEFAULT_OVERVIEW_PREVIEW_CHARS = 200;

  IndexingService(std::shared_ptr<IndexStore> index_store, PageChunker chunker = PageChunker());

  // Chunks the pages and replaces the document's index.
  IndexingResult index_document(const std::string &doc_id, const std::vector<std::string> &pages);

  // Quick look at what indexing would produce, without any embedding calls.
  IndexOverview overview(const std::vector<std::string> &pages,
                         size_t max_entries = DEFAULT_OVERVIEW_ENTRIES,
                         size_t preview_chars = DEFAULT_OVERVIEW_PREVIEW_CHARS) const;

 private:
  std::shared_ptr<IndexStore> index_store_;
  PageChunker chunker_;
};

}  // namespace docrag_core
