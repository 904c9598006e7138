#include <gtest/gtest.h>

#include <memory>

#include <nlohmann/json.hpp>

#include "docrag_core/llm/ollama_client.hpp"
#include "docrag_core/llm/ollama_connection.hpp"
#include "docrag_core/llm/ollama_responses.hpp"

namespace docrag_core {

using nlohmann::json;

TEST(EmbeddingResponseTest, ReadsNestedEmbeddings) {
  json response = json::parse(R"({"model": "nomic-embed-text", "embeddings": [[0.1, 0.2, 0.3]]})");

  auto vec = detail::parse_embedding_response(response);

  ASSERT_EQ(vec.size(), 3u);
  EXPECT_FLOAT_EQ(vec[0], 0.1f);
  EXPECT_FLOAT_EQ(vec[2], 0.3f);
}

TEST(EmbeddingResponseTest, ReadsFirstOfSeveralNestedEmbeddings) {
  json response = json::parse(R"({"embeddings": [[1.0, 2.0], [3.0, 4.0]]})");

  EXPECT_EQ(detail::parse_embedding_response(response), (std::vector<float>{1.0f, 2.0f}));
}

TEST(EmbeddingResponseTest, ReadsFlatEmbeddings) {
  json response = json::parse(R"({"embeddings": [0.5, -0.5]})");

  EXPECT_EQ(detail::parse_embedding_response(response), (std::vector<float>{0.5f, -0.5f}));
}

TEST(EmbeddingResponseTest, ReadsLegacyEmbeddingField) {
  json response = json::parse(R"({"embedding": [0.25, 0.75, 1.0]})");

  EXPECT_EQ(detail::parse_embedding_response(response), (std::vector<float>{0.25f, 0.75f, 1.0f}));
}

TEST(EmbeddingResponseTest, RejectsEmptyEmbeddings) {
  json response = json::parse(R"({"embeddings": []})");
  EXPECT_THROW(detail::parse_embedding_response(response), OllamaError);
}

TEST(EmbeddingResponseTest, RejectsNonArrayEmbeddings) {
  json response = json::parse(R"({"embeddings": "oops"})");
  EXPECT_THROW(detail::parse_embedding_response(response), OllamaError);
}

TEST(EmbeddingResponseTest, RejectsNonNumericValues) {
  json nested = json::parse(R"({"embeddings": [["a", "b"]]})");
  json legacy = json::parse(R"({"embedding": {"x": 1}})");

  EXPECT_THROW(detail::parse_embedding_response(nested), OllamaError);
  EXPECT_THROW(detail::parse_embedding_response(legacy), OllamaError);
}

TEST(EmbeddingResponseTest, RejectsMissingField) {
  json response = json::parse(R"({"error": "model not found"})");
  EXPECT_THROW(detail::parse_embedding_response(response), OllamaError);
}

TEST(ChatResponseTest, ReadsMessageContent) {
  json response = json::parse(
      R"({"model": "llama3.1:8b", "message": {"role": "assistant", "content": "Rent is due monthly (p.2)."}, "done": true})");

  EXPECT_EQ(detail::parse_chat_response(response), "Rent is due monthly (p.2).");
}

TEST(ChatResponseTest, KeepsEmptyContent) {
  json response = json::parse(R"({"message": {"role": "assistant", "content": ""}})");
  EXPECT_EQ(detail::parse_chat_response(response), "");
}

TEST(ChatResponseTest, RejectsMissingMessage) {
  EXPECT_THROW(detail::parse_chat_response(json::parse(R"({"done": true})")), OllamaError);
  EXPECT_THROW(detail::parse_chat_response(json::parse(R"({"message": "text"})")), OllamaError);
  EXPECT_THROW(detail::parse_chat_response(json::parse("[1, 2]")), OllamaError);
}

TEST(ChatResponseTest, RejectsMissingOrNonStringContent) {
  EXPECT_THROW(detail::parse_chat_response(json::parse(R"({"message": {"role": "assistant"}})")),
               OllamaError);
  EXPECT_THROW(detail::parse_chat_response(json::parse(R"({"message": {"content": 42}})")),
               OllamaError);
}

TEST(OllamaClientTest, EmptyTextNeedsNoServer) {
  OllamaClient client(std::make_shared<OllamaConnection>("http://127.0.0.1:1"), "nomic-embed-text",
                      "llama3.1:8b", ModelOptions{}, RetryPolicy::no_retry());

  EXPECT_TRUE(client.get_embedding("").empty());
  EXPECT_EQ(client.get_embeddings({"", ""}), (std::vector<std::vector<float>>{{}, {}}));
}

TEST(OllamaClientTest, RequiresConnection) {
  EXPECT_THROW(OllamaClient(nullptr, "nomic-embed-text", "llama3.1:8b"), OllamaError);
}

}  // namespace docrag_core
