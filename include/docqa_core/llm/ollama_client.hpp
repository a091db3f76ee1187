#pragma once

#include <exception>
#include <string>
#include <vector>

namespace docqa_core {

class OllamaError : public std::exception {
 public:
  explicit OllamaError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

struct OllamaSettings {
  std::string url = "http://localhost:11434";
  std::string embedding_model = "mxbai-embed-large";
  std::string chat_model = "llama3.1:8b";
  int timeout_seconds = 120;
};

// Thin wrapper over the Ollama HTTP API. Methods are virtual so services can be
// exercised against a mock in tests.
class OllamaClient {
 public:
  explicit OllamaClient(const OllamaSettings &settings);
  virtual ~OllamaClient() = default;

  // Disable copy constructor and assignment
  OllamaClient(const OllamaClient &) = delete;
  OllamaClient &operator=(const OllamaClient &) = delete;

  // One embedding request for the whole batch; result order matches input order
  virtual std::vector<std::vector<float>> get_embeddings(const std::vector<std::string> &texts);

  // Single non-streaming chat completion
  virtual std::string chat(const std::string &system_prompt,
                           const std::string &user_prompt,
                           float temperature);

  virtual bool is_server_available();

  const OllamaSettings &settings() const {
    return settings_;
  }

 private:
  OllamaSettings settings_;

  // Helper methods
  void setup_server_connection();
};

}  // namespace docqa_core
