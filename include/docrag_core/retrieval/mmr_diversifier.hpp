#pragma once

#include <cstddef>
#include <vector>

namespace docrag_core {
namespace retrieval {

/**
 * @brief Maximal Marginal Relevance selection.
 *
 * Greedy: the most relevant candidate is taken first, then repeatedly the
 * candidate maximizing
 *   lambda * relevance - (1 - lambda) * max_similarity_to_selected.
 * lambda = 1 is pure relevance, lambda = 0 pure diversity. The first
 * candidate scanned wins ties. Not globally optimal.
 */
class MmrDiversifier {
 public:
  static constexpr float DEFAULT_LAMBDA = 0.3f;

  explicit MmrDiversifier(float lambda = DEFAULT_LAMBDA);

  // `candidates` and `query` must be unit length. Returns positions into
  // `candidates` in selection order; k is clamped to candidates.size().
  std::vector<size_t> select(const std::vector<std::vector<float>>& candidates,
                             const std::vector<float>& query,
                             size_t k) const;

  float lambda() const {
    return lambda_;
  }

 private:
  float lambda_;
};

}  // namespace retrieval
}  // namespace docrag_core
