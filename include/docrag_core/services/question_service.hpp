#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "docrag_core/db/index_store.hpp"
#include "docrag_core/llm/ollama_client.hpp"
#include "docrag_core/services/relevance_judge.hpp"
#include "docrag_core/types/query_options.hpp"

namespace docrag_core {

class QuestionServiceError : public std::exception {
 public:
  explicit QuestionServiceError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

class QuestionService {
 public:
  struct RetrievedChunk {
    size_t index;
    int page;
    float score;
  };
  struct AnswerResult {
    std::string answer;
    std::vector<RetrievedChunk> sources;
  };

  static constexpr size_t DEFAULT_MMR_POOL_MULTIPLIER = 4;

  // `judge` may be null, in which case use_llm_rerank is ignored.
  QuestionService(std::shared_ptr<IndexStore> index_store,
                  std::shared_ptr<OllamaClient> ollama_client,
                  std::shared_ptr<RelevanceJudge> judge,
                  size_t mmr_pool_multiplier = DEFAULT_MMR_POOL_MULTIPLIER);

  // Grounded answer over one document. A document without an index still
  // gets an answer, framed as having no readable content.
  AnswerResult answer(const std::string &doc_id,
                      const std::string &question,
                      const QueryOptions &options = {});

  // Ranked, diversified and optionally judged chunks, in context order.
  std::vector<RetrievedChunk> retrieve(const DocumentIndex &index,
                                       const std::string &question,
                                       const QueryOptions &options);

  static void validate(const QueryOptions &options);

 private:
  std::shared_ptr<IndexStore> index_store_;
  std::shared_ptr<OllamaClient> ollama_client_;
  std::shared_ptr<RelevanceJudge> judge_;
  size_t mmr_pool_multiplier_;
};

}  // namespace docrag_core
