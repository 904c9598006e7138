#pragma once

#include <chrono>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "docrag_core/llm/ollama_client.hpp"
#include "docrag_core/llm/retry_policy.hpp"
#include "docrag_core/types/query_options.hpp"

class Config {
 public:
  std::string index_dir;
  std::string feedback_file;
  std::string ollama_url;
  std::string chat_model;
  std::string embedding_model;
  std::optional<int> num_gpu_layers;
  std::optional<int> main_gpu;
  bool low_vram;
  int request_timeout_seconds;

  // Chunking
  int chunk_max_chars;
  int chunk_overlap;

  // Query defaults
  int top_k;
  std::string strategy;
  float mmr_lambda;
  int mmr_pool_multiplier;
  bool use_llm_rerank;
  int judge_preview_chars;

  // Provider retries
  int retry_max_attempts;
  int retry_initial_backoff_ms;

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string& filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw std::runtime_error("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const std::exception& e) {
      throw std::runtime_error(std::string("Failed to parse JSON in config file '") + filename + "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json& json_config) {
    Config config;

    try {
      config.index_dir = json_config.value("index_dir", std::string("./data/vectors"));
      config.feedback_file =
          json_config.value("feedback_file", std::string("./data/feedback/relevance.jsonl"));
      config.ollama_url = json_config.value("ollama_url", std::string("http://127.0.0.1:11434"));
      config.chat_model = json_config.value("chat_model", std::string("llama3.1:8b"));
      config.embedding_model = json_config.value("embedding_model", std::string("nomic-embed-text"));
      config.num_gpu_layers = optional_int(json_config, "num_gpu_layers");
      config.main_gpu = optional_int(json_config, "main_gpu");
      config.low_vram = json_config.value("low_vram", false);
      config.request_timeout_seconds = json_config.value("request_timeout_seconds", 120);

      config.chunk_max_chars = json_config.value("chunk_max_chars", 1800);
      config.chunk_overlap = json_config.value("chunk_overlap", 200);

      config.top_k = json_config.value("top_k", 6);
      config.strategy = json_config.value("strategy", std::string("mmr"));
      config.mmr_lambda = json_config.value("mmr_lambda", 0.3f);
      config.mmr_pool_multiplier = json_config.value("mmr_pool_multiplier", 4);
      config.use_llm_rerank = json_config.value("use_llm_rerank", false);
      config.judge_preview_chars = json_config.value("judge_preview_chars", 500);

      config.retry_max_attempts = json_config.value("retry_max_attempts", 3);
      config.retry_initial_backoff_ms = json_config.value("retry_initial_backoff_ms", 250);
    } catch (const nlohmann::json::exception& e) {
      throw std::runtime_error(std::string("Invalid value type in config: ") + e.what());
    }

    config.validate();
    return config;
  }

  docrag_core::ModelOptions model_options() const {
    docrag_core::ModelOptions options;
    options.num_gpu = num_gpu_layers;
    options.main_gpu = main_gpu;
    options.low_vram = low_vram;
    return options;
  }

  docrag_core::RetryPolicy retry_policy() const {
    docrag_core::RetryPolicy policy;
    policy.max_attempts = retry_max_attempts;
    policy.initial_delay = std::chrono::milliseconds(retry_initial_backoff_ms);
    return policy;
  }

  docrag_core::QueryOptions query_options() const {
    docrag_core::QueryOptions options;
    options.k = top_k;
    options.strategy = docrag_core::retrieval_strategy_from_string(strategy);
    options.mmr_lambda = mmr_lambda;
    options.use_llm_rerank = use_llm_rerank;
    return options;
  }

 private:
  static std::optional<int> optional_int(const nlohmann::json& json_config, const char* key) {
    if (!json_config.contains(key) || json_config.at(key).is_null()) {
      return std::nullopt;
    }
    return json_config.at(key).get<int>();
  }

  void validate() const {
    if (index_dir.empty()) {
      throw std::runtime_error("index_dir cannot be empty");
    }
    if (feedback_file.empty()) {
      throw std::runtime_error("feedback_file cannot be empty");
    }
    if (ollama_url.empty()) {
      throw std::runtime_error("ollama_url cannot be empty");
    }
    if (chat_model.empty()) {
      throw std::runtime_error("chat_model cannot be empty");
    }
    if (embedding_model.empty()) {
      throw std::runtime_error("embedding_model cannot be empty");
    }
    if (request_timeout_seconds <= 0) {
      throw std::runtime_error("request_timeout_seconds must be greater than 0");
    }
    if (chunk_max_chars <= 0) {
      throw std::runtime_error("chunk_max_chars must be greater than 0");
    }
    if (chunk_overlap < 0 || chunk_overlap >= chunk_max_chars) {
      throw std::runtime_error("chunk_overlap must be in [0, chunk_max_chars)");
    }
    if (top_k < docrag_core::QueryOptions::MIN_K || top_k > docrag_core::QueryOptions::MAX_K) {
      throw std::runtime_error("top_k must be between 1 and 25");
    }
    if (strategy != "cosine" && strategy != "mmr") {
      throw std::runtime_error("strategy must be 'cosine' or 'mmr'");
    }
    if (mmr_lambda < 0.0f || mmr_lambda > 1.0f) {
      throw std::runtime_error("mmr_lambda must be within [0, 1]");
    }
    if (mmr_pool_multiplier < 1) {
      throw std::runtime_error("mmr_pool_multiplier must be at least 1");
    }
    if (judge_preview_chars <= 0) {
      throw std::runtime_error("judge_preview_chars must be greater than 0");
    }
    if (retry_max_attempts < 1) {
      throw std::runtime_error("retry_max_attempts must be at least 1");
    }
    if (retry_initial_backoff_ms < 0) {
      throw std::runtime_error("retry_initial_backoff_ms cannot be negative");
    }
  }
};
