#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace docrag_core {
namespace detail {

// Vector from an /api/embed ("embeddings", nested or flat) or legacy
// /api/embeddings ("embedding") reply. Throws OllamaError on any other shape.
std::vector<float> parse_embedding_response(const nlohmann::json &response);

// "message.content" of an /api/chat reply. Throws OllamaError if missing.
std::string parse_chat_response(const nlohmann::json &response);

}  // namespace detail
}  // namespace docrag_core
