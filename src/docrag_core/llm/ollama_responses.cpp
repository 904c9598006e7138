#include "docrag_core/llm/ollama_responses.hpp"

#include "docrag_core/llm/ollama_client.hpp"

namespace docrag_core {
namespace detail {

std::vector<float> parse_embedding_response(const nlohmann::json &response) {
  try {
    if (response.contains("embeddings")) {
      const auto &embeddings = response["embeddings"];
      if (!embeddings.is_array() || embeddings.empty()) {
        throw OllamaError("Embeddings field is not a non-empty array");
      }
      if (embeddings[0].is_array()) {
        return embeddings[0].get<std::vector<float>>();
      }
      return embeddings.get<std::vector<float>>();
    }
    if (response.contains("embedding")) {
      return response["embedding"].get<std::vector<float>>();
    }
  } catch (const nlohmann::json::exception &e) {
    throw OllamaError("Malformed embedding response: " + std::string(e.what()));
  }
  throw OllamaError("Response does not contain embedding field");
}

std::string parse_chat_response(const nlohmann::json &response) {
  if (!response.is_object() || !response.contains("message") ||
      !response["message"].is_object() || !response["message"].contains("content") ||
      !response["message"]["content"].is_string()) {
    throw OllamaError("Chat response does not contain message content");
  }
  return response["message"]["content"].get<std::string>();
}

}  // namespace detail
}  // namespace docrag_core
