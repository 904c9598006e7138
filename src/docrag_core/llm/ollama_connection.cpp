#include "docrag_core/llm/ollama_connection.hpp"

#include <iostream>

#include "ollama.hpp"

namespace docrag_core {

OllamaConnection::OllamaConnection(const std::string& ollama_url, std::chrono::seconds timeout)
    : ollama_url_(ollama_url), timeout_(timeout) {}

void OllamaConnection::ensure_ready() {
  std::call_once(init_flag_, [this] { setup_server_connection(); });
}

void OllamaConnection::setup_server_connection() {
  ollama::setServerURL(ollama_url_);
  ollama::setReadTimeout(static_cast<int>(timeout_.count()));
  ollama::setWriteTimeout(static_cast<int>(timeout_.count()));
  std::cout << "[Ollama] Using server " << ollama_url_ << " (timeout " << timeout_.count()
            << "s)" << std::endl;
}

bool OllamaConnection::is_server_available() {
  ensure_ready();
  return ollama::is_running();
}

}  // namespace docrag_core
