#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "docrag_core/llm/ollama_client.hpp"
#include "docrag_core/types/document_index.hpp"

namespace docrag_core {

// Renders retrieved chunks into the prompt handed to the answer model.
class ContextAssembler {
 public:
  // "(p.<page>) <text>" with the text trimmed and line breaks turned into
  // spaces, so every item is exactly one line.
  static std::string render_item(int page, const std::string &text);

  // Items for `selected` (indices into `index`), separated by blank lines.
  static std::string render_context(const DocumentIndex &index, const std::vector<size_t> &selected);

  static std::vector<ChatMessage> build_answer_messages(const std::string &question,
                                                        const std::string &context);

  // Framing used when the document has nothing indexed.
  static std::vector<ChatMessage> build_no_index_messages(const std::string &question);
};

}  // namespace docrag_core
