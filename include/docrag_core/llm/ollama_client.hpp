#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "docrag_core/llm/ollama_connection.hpp"
#include "docrag_core/llm/retry_policy.hpp"

namespace docrag_core {

class OllamaError : public std::exception {
 public:
  explicit OllamaError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

struct ChatMessage {
  std::string role;
  std::string content;
};

enum class ResponseFormat { Text, Json };

// Runtime options forwarded with every request.
struct ModelOptions {
  std::optional<int> num_gpu;
  std::optional<int> main_gpu;
  bool low_vram = false;
};

class OllamaClient {
 public:
  OllamaClient(std::shared_ptr<OllamaConnection> connection,
               const std::string &embedding_model,
               const std::string &chat_model,
               ModelOptions model_options = {},
               RetryPolicy retry_policy = {});
  virtual ~OllamaClient() = default;

  // Disable copy constructor and assignment
  OllamaClient(const OllamaClient &) = delete;
  OllamaClient &operator=(const OllamaClient &) = delete;

  // Empty text yields an empty vector without a request.
  virtual std::vector<float> get_embedding(const std::string &text);

  // One vector per input, same order.
  virtual std::vector<std::vector<float>> get_embeddings(const std::vector<std::string> &texts_to_embed);

  // Returns the assistant message content.
  virtual std::string chat(const std::vector<ChatMessage> &messages, ResponseFormat format);

  virtual bool is_server_available();

  const std::string &embedding_model() const {
    return embedding_model_;
  }
  const std::string &chat_model() const {
    return chat_model_;
  }

 private:
  std::shared_ptr<OllamaConnection> connection_;
  std::string embedding_model_;
  std::string chat_model_;
  ModelOptions model_options_;
  RetryPolicy retry_policy_;
};

}  // namespace docrag_core
