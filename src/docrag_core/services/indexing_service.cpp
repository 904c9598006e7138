#include "docrag_core/services/indexing_service.hpp"

#include <iostream>

#include "docrag_core/extractors/text_utils.hpp"

namespace docrag_core {

IndexingService::IndexingService(std::shared_ptr<IndexStore> index_store, PageChunker chunker)
    : index_store_(std::move(index_store)), chunker_(chunker) {}

IndexingService::IndexingResult IndexingService::index_document(
    const std::string &doc_id, const std::vector<std::string> &pages) {
  std::vector<Chunk> chunks = chunker_.chunk_pages(pages);
  if (chunks.empty()) {
    std::cout << "[Indexing] Document " << doc_id << " has no extractable text ("
              << pages.size() << " pages)" << std::endl;
  }
  DocumentIndex index = index_store_->build(doc_id, chunks);
  return {doc_id, index.size()};
}

IndexingService::IndexOverview IndexingService::overview(const std::vector<std::string> &pages,
                                                         size_t max_entries,
                                                         size_t preview_chars) const {
  std::vector<Chunk> chunks = chunker_.chunk_pages(pages);

  IndexOverview result{chunks.size(), {}};
  for (size_t i = 0; i < chunks.size() && i < max_entries; ++i) {
    result.entries.push_back(
        {chunks[i].page,
         textutil::single_line(textutil::truncate_chars(chunks[i].text, preview_chars))});
  }
  return result;
}

}  // namespace docrag_core
