#pragma once

#include <string>
#include <vector>

namespace docrag_core {

// A window of page text. Pages are 1-based.
struct Chunk {
  int page;
  std::string text;
};

}  // namespace docrag_core
