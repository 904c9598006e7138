#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "docrag_core/types/document_index.hpp"

namespace docrag_core {
namespace retrieval {

class RetrievalError : public std::exception {
 public:
  explicit RetrievalError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Added to every norm so zero vectors normalize to zero instead of NaN.
constexpr float NORM_EPSILON = 1e-9f;

std::vector<float> normalize(const std::vector<float>& vec);
std::vector<std::vector<float>> normalize_rows(const std::vector<std::vector<float>>& rows);
float dot(const std::vector<float>& a, const std::vector<float>& b);

struct ScoredIndex {
  size_t index;
  float score;
};

/**
 * @brief Cosine ranking of every indexed chunk against a query.
 *
 * Stored vectors are normalized once on construction so the same ranker can
 * serve the MMR step afterwards.
 */
class SimilarityRanker {
 public:
  explicit SimilarityRanker(const DocumentIndex& index);

  // All indices by descending score; equal scores keep index order.
  // `normalized_query` must already be unit length.
  std::vector<ScoredIndex> rank(const std::vector<float>& normalized_query) const;

  const std::vector<std::vector<float>>& normalized_vectors() const {
    return normalized_;
  }
  size_t dimension() const {
    return dimension_;
  }

 private:
  std::vector<std::vector<float>> normalized_;
  size_t dimension_;
};

}  // namespace retrieval
}  // namespace docrag_core
