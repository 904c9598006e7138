#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "docrag_core/llm/ollama_client.hpp"

namespace docrag_core {

/**
 * @brief Asks the chat model to reorder a few candidate passages.
 *
 * Reranking is an optimization: rerank() never throws. Provider errors and
 * unusable answers fall back to the identity order.
 */
class RelevanceJudge {
 public:
  static constexpr size_t DEFAULT_PREVIEW_CHARS = 500;

  // Tagged parse result. `ok` is false when nothing usable survived
  // sanitizing.
  struct RankingParse {
    bool ok = false;
    std::vector<size_t> value;
  };

  explicit RelevanceJudge(std::shared_ptr<OllamaClient> ollama_client,
                          size_t preview_chars = DEFAULT_PREVIEW_CHARS);

  // Returns k positions into `candidates`, most relevant first.
  std::vector<size_t> rerank(const std::string &question,
                             const std::vector<std::string> &candidates,
                             size_t k) const;

  // Accepts a bare JSON array, an object with a "ranking", "order" or
  // "indices" array, or prose with one bracketed array in it. Drops
  // non-integers, out-of-range values and duplicates.
  static RankingParse parse_ranking(const std::string &response, size_t candidate_count);

  std::vector<ChatMessage> build_messages(const std::string &question,
                                          const std::vector<std::string> &candidates,
                                          size_t k) const;

  size_t preview_chars() const {
    return preview_chars_;
  }

 private:
  std::string preview(const std::string &text) const;
  static std::vector<size_t> identity(size_t k);

  std::shared_ptr<OllamaClient> ollama_client_;
  size_t preview_chars_;
};

}  // namespace docrag_core
