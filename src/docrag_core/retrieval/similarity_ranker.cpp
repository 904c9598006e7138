#include "docrag_core/retrieval/similarity_ranker.hpp"

#include <algorithm>
#include <cmath>

namespace docrag_core {
namespace retrieval {

std::vector<float> normalize(const std::vector<float>& vec) {
  double sum = 0.0;
  for (float v : vec) {
    sum += static_cast<double>(v) * v;
  }
  const float norm = static_cast<float>(std::sqrt(sum)) + NORM_EPSILON;

  std::vector<float> out;
  out.reserve(vec.size());
  for (float v : vec) {
    out.push_back(v / norm);
  }
  return out;
}

std::vector<std::vector<float>> normalize_rows(const std::vector<std::vector<float>>& rows) {
  std::vector<std::vector<float>> out;
  out.reserve(rows.size());
  for (const auto& row : rows) {
    out.push_back(normalize(row));
  }
  return out;
}

float dot(const std::vector<float>& a, const std::vector<float>& b) {
  if (a.size() != b.size()) {
    throw RetrievalError("Vector dimension mismatch. Expected " + std::to_string(a.size()) +
                         ", got " + std::to_string(b.size()));
  }
  float sum = 0.0f;
  for (size_t i = 0; i < a.size(); ++i) {
    sum += a[i] * b[i];
  }
  return sum;
}

SimilarityRanker::SimilarityRanker(const DocumentIndex& index)
    : normalized_(normalize_rows(index.embeddings)), dimension_(index.dimension()) {
  if (!index.is_consistent()) {
    throw RetrievalError("Document index is inconsistent: " + std::to_string(index.texts.size()) +
                         " texts, " + std::to_string(index.pages.size()) + " pages, " +
                         std::to_string(index.embeddings.size()) + " embeddings");
  }
}

std::vector<ScoredIndex> SimilarityRanker::rank(const std::vector<float>& normalized_query) const {
  std::vector<ScoredIndex> scored;
  if (normalized_.empty()) {
    return scored;
  }
  if (normalized_query.size() != dimension_) {
    throw RetrievalError("Query dimension " + std::to_string(normalized_query.size()) +
                         " does not match index dimension " + std::to_string(dimension_));
  }

  scored.reserve(normalized_.size());
  for (size_t i = 0; i < normalized_.size(); ++i) {
    scored.push_back({i, dot(normalized_[i], normalized_query)});
  }
  std::stable_sort(scored.begin(), scored.end(), [](const ScoredIndex& a, const ScoredIndex& b) {
    return a.score > b.score;
  });
  return scored;
}

}  // namespace retrieval
}  // namespace docrag_core
