#pragma once

#include <gmock/gmock.h>

#include <memory>
#include <string>
#include <vector>

#include "docrag_core/llm/ollama_client.hpp"
#include "docrag_core/llm/ollama_connection.hpp"

namespace docrag_tests {

/**
 * Mock class for OllamaClient to use in tests. The connection is never
 * used, so no server is needed.
 */
class MockOllamaClient : public docrag_core::OllamaClient {
 public:
  MockOllamaClient()
      : docrag_core::OllamaClient(
            std::make_shared<docrag_core::OllamaConnection>("http://localhost:11434"),
            "nomic-embed-text",
            "llama3.1:8b",
            docrag_core::ModelOptions{},
            docrag_core::RetryPolicy::no_retry()) {}

  MOCK_METHOD(std::vector<float>, get_embedding, (const std::string& text), (override));
  MOCK_METHOD(std::vector<std::vector<float>>, get_embeddings,
              (const std::vector<std::string>& texts_to_embed), (override));
  MOCK_METHOD(std::string, chat,
              (const std::vector<docrag_core::ChatMessage>& messages,
               docrag_core::ResponseFormat format),
              (override));
  MOCK_METHOD(bool, is_server_available, (), (override));
};

}  // namespace docrag_tests
