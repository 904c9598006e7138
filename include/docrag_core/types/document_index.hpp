#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace docrag_core {

// Per-document embedding index. The three arrays are parallel: entry i of
// each describes the same chunk.
struct DocumentIndex {
  std::vector<std::string> texts;
  std::vector<int> pages;
  std::vector<std::vector<float>> embeddings;

  size_t size() const {
    return texts.size();
  }
  bool empty() const {
    return texts.empty();
  }

  // True when the arrays have equal length and every vector has the same
  // dimension.
  bool is_consistent() const;

  // Dimension of the stored vectors, 0 for an empty index.
  size_t dimension() const {
    return embeddings.empty() ? 0 : embeddings.front().size();
  }
};

}  // namespace docrag_core
