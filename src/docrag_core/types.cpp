#include "docrag_core/types.hpp"

#include <stdexcept>

namespace docrag_core {

bool DocumentIndex::is_consistent() const {
  if (texts.size() != pages.size() || texts.size() != embeddings.size()) {
    return false;
  }
  const size_t dim = dimension();
  for (const auto& vec : embeddings) {
    if (vec.size() != dim) {
      return false;
    }
  }
  return true;
}

std::string to_string(RetrievalStrategy strategy) {
  switch (strategy) {
    case RetrievalStrategy::Cosine:
      return "cosine";
    case RetrievalStrategy::Mmr:
      return "mmr";
    default:
      return "unknown";
  }
}

RetrievalStrategy retrieval_strategy_from_string(const std::string& str) {
  if (str == "cosine")
    return RetrievalStrategy::Cosine;
  if (str == "mmr")
    return RetrievalStrategy::Mmr;
  throw std::invalid_argument("Unknown retrieval strategy: " + str);
}

}  // namespace docrag_core
