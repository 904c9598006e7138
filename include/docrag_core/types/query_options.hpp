#pragma once

#include <string>

namespace docrag_core {

enum class RetrievalStrategy { Cosine, Mmr };

std::string to_string(RetrievalStrategy strategy);
// Throws std::invalid_argument for anything but "cosine" or "mmr".
RetrievalStrategy retrieval_strategy_from_string(const std::string& str);

struct QueryOptions {
  static constexpr int MIN_K = 1;
  static constexpr int MAX_K = 25;

  int k = 6;
  RetrievalStrategy strategy = RetrievalStrategy::Mmr;
  float mmr_lambda = 0.3f;
  bool use_llm_rerank = false;
};

}  // namespace docrag_core
