#include "docrag_core/services/context_assembler.hpp"

#include <stdexcept>

#include "docrag_core/extractors/text_utils.hpp"

namespace docrag_core {

namespace {

const char *const ANSWER_SYSTEM_PROMPT =
    "You are a document analysis assistant. Answer briefly and precisely. "
    "Use ONLY the provided contexts; if the information is missing, say so. "
    "Cite the relevant pages.";

const char *const NO_INDEX_SYSTEM_PROMPT =
    "You are a document analysis assistant. The document has no indexed text. "
    "Ask the user to provide a readable or OCR-processed PDF.";

}  // namespace

std::string ContextAssembler::render_item(int page, const std::string &text) {
  return "(p." + std::to_string(page) + ") " + textutil::single_line(textutil::trim(text));
}

std::string ContextAssembler::render_context(const DocumentIndex &index,
                                             const std::vector<size_t> &selected) {
  std::string context;
  for (size_t i = 0; i < selected.size(); ++i) {
    const size_t idx = selected[i];
    if (idx >= index.size()) {
      throw std::out_of_range("Selected chunk " + std::to_string(idx) + " is outside the index (" +
                              std::to_string(index.size()) + " chunks)");
    }
    if (i > 0) {
      context += "\n\n";
    }
    context += render_item(index.pages[idx], index.texts[idx]);
  }
  return context;
}

std::vector<ChatMessage> ContextAssembler::build_answer_messages(const std::string &question,
                                                                 const std::string &context) {
  return {{"system", ANSWER_SYSTEM_PROMPT},
          {"user", "Question: " + question + "\n\nCONTEXTS:\n" + context}};
}

std::vector<ChatMessage> ContextAssembler::build_no_index_messages(const std::string &question) {
  return {{"system", NO_INDEX_SYSTEM_PROMPT},
          {"user", "Document has no readable index. Question: " + question}};
}

}  // namespace docrag_core
