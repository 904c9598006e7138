#pragma once

#include <chrono>
#include <mutex>
#include <string>

namespace docrag_core {

/**
 * @brief Process-scoped handle on the Ollama server.
 *
 * ollama-hpp keeps its HTTP client in a library-wide object, so there should
 * be exactly one connection per process. It is created at startup and shared
 * by every client; nothing touches the network until the first call to
 * ensure_ready().
 */
class OllamaConnection {
 public:
  explicit OllamaConnection(const std::string& ollama_url,
                            std::chrono::seconds timeout = std::chrono::seconds(120));
  ~OllamaConnection() = default;

  // Disable copy constructor and assignment
  OllamaConnection(const OllamaConnection&) = delete;
  OllamaConnection& operator=(const OllamaConnection&) = delete;

  // Applies the URL and timeouts to the library on first use.
  void ensure_ready();

  bool is_server_available();

  const std::string& url() const {
    return ollama_url_;
  }
  std::chrono::seconds timeout() const {
    return timeout_;
  }

 private:
  void setup_server_connection();

  std::string ollama_url_;
  std::chrono::seconds timeout_;
  std::once_flag init_flag_;
};

}  // namespace docrag_core
