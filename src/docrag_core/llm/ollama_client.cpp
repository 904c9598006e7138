#include "docrag_core/llm/ollama_client.hpp"

#include <iostream>

// Ahead of ollama.hpp so its embedded copy of the json library is skipped and
// every translation unit shares one nlohmann::json.
#include <nlohmann/json.hpp>

#include "ollama.hpp"

#include "docrag_core/llm/ollama_responses.hpp"

namespace docrag_core {

namespace {

ollama::options to_request_options(const ModelOptions &model_options) {
  ollama::options opts;
  if (model_options.num_gpu) {
    opts["num_gpu"] = *model_options.num_gpu;
  }
  if (model_options.main_gpu) {
    opts["main_gpu"] = *model_options.main_gpu;
  }
  if (model_options.low_vram) {
    opts["low_vram"] = true;
  }
  return opts;
}

}  // namespace

OllamaClient::OllamaClient(std::shared_ptr<OllamaConnection> connection,
                           const std::string &embedding_model,
                           const std::string &chat_model,
                           ModelOptions model_options,
                           RetryPolicy retry_policy)
    : connection_(std::move(connection)),
      embedding_model_(embedding_model),
      chat_model_(chat_model),
      model_options_(model_options),
      retry_policy_(retry_policy) {
  if (!connection_) {
    throw OllamaError("OllamaClient requires a connection");
  }
}

std::vector<float> OllamaClient::get_embedding(const std::string &text) {
  if (text.empty()) {
    return {};
  }
  connection_->ensure_ready();
  const ollama::options opts = to_request_options(model_options_);

  try {
    ollama::response response = with_retry<ollama::exception>(
        retry_policy_, "embedding request", [&] {
          return ollama::generate_embeddings(embedding_model_, text, opts);
        });

    return detail::parse_embedding_response(response.as_json());

  } catch (const ollama::exception &e) {
    throw OllamaError("Embedding generation failed: " + std::string(e.what()));
  } catch (const nlohmann::json::exception &e) {
    throw OllamaError("Malformed embedding response: " + std::string(e.what()));
  }
}

// The server accepts batched input, but ollama-hpp's helper only takes a
// single string, so texts are embedded one request at a time.
std::vector<std::vector<float>> OllamaClient::get_embeddings(
    const std::vector<std::string> &texts_to_embed) {
  std::vector<std::vector<float>> embeddings;
  embeddings.reserve(texts_to_embed.size());
  for (size_t i = 0; i < texts_to_embed.size(); ++i) {
    embeddings.push_back(get_embedding(texts_to_embed[i]));
    if ((i + 1) % 25 == 0) {
      std::cout << "[Ollama] Embedded " << (i + 1) << " of " << texts_to_embed.size()
                << " texts" << std::endl;
    }
  }
  return embeddings;
}

std::string OllamaClient::chat(const std::vector<ChatMessage> &messages, ResponseFormat format) {
  connection_->ensure_ready();

  ollama::messages request_messages;
  for (const auto &message : messages) {
    request_messages.push_back(ollama::message(message.role, message.content));
  }
  const ollama::options opts = to_request_options(model_options_);
  const std::string format_name = format == ResponseFormat::Json ? "json" : "";

  try {
    ollama::response response = with_retry<ollama::exception>(
        retry_policy_, "chat request", [&] {
          return ollama::chat(chat_model_, request_messages, opts, format_name);
        });

    return detail::parse_chat_response(response.as_json());

  } catch (const ollama::exception &e) {
    throw OllamaError("Chat request failed: " + std::string(e.what()));
  } catch (const nlohmann::json::exception &e) {
    throw OllamaError("Malformed chat response: " + std::string(e.what()));
  }
}

bool OllamaClient::is_server_available() {
  return connection_->is_server_available();
}

}  // namespace docrag_core
