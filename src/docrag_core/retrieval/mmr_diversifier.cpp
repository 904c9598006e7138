#include "docrag_core/retrieval/mmr_diversifier.hpp"

#include <algorithm>
#include <limits>
#include <string>

#include "docrag_core/retrieval/similarity_ranker.hpp"

namespace docrag_core {
namespace retrieval {

MmrDiversifier::MmrDiversifier(float lambda) : lambda_(lambda) {
  if (!(lambda_ >= 0.0f && lambda_ <= 1.0f)) {
    throw RetrievalError("MMR lambda must be within [0, 1], got " + std::to_string(lambda_));
  }
}

std::vector<size_t> MmrDiversifier::select(const std::vector<std::vector<float>>& candidates,
                                           const std::vector<float>& query,
                                           size_t k) const {
  const size_t n = candidates.size();
  k = std::min(k, n);
  std::vector<size_t> selected;
  if (k == 0) {
    return selected;
  }
  selected.reserve(k);

  std::vector<float> relevance(n);
  for (size_t i = 0; i < n; ++i) {
    relevance[i] = dot(candidates[i], query);
  }

  std::vector<bool> taken(n, false);
  // Running max similarity of each candidate to anything selected so far.
  std::vector<float> redundancy(n, -std::numeric_limits<float>::infinity());

  auto take = [&](size_t pick) {
    taken[pick] = true;
    selected.push_back(pick);
    for (size_t i = 0; i < n; ++i) {
      if (!taken[i]) {
        redundancy[i] = std::max(redundancy[i], dot(candidates[i], candidates[pick]));
      }
    }
  };

  size_t first = 0;
  for (size_t i = 1; i < n; ++i) {
    if (relevance[i] > relevance[first]) {
      first = i;
    }
  }
  take(first);

  while (selected.size() < k) {
    size_t best = n;
    float best_score = -std::numeric_limits<float>::infinity();
    for (size_t i = 0; i < n; ++i) {
      if (taken[i]) {
        continue;
      }
      const float score = lambda_ * relevance[i] - (1.0f - lambda_) * redundancy[i];
      if (best == n || score > best_score) {
        best = i;
        best_score = score;
      }
    }
    take(best);
  }
  return selected;
}

}  // namespace retrieval
}  // namespace docrag_core
