#pragma once

#include <exception>
#include <memory>
#include <string>
#include <vector>

#include "docqa_core/llm/ollama_client.hpp"

namespace docqa_core {

class EmbeddingProviderError : public std::exception {
 public:
  explicit EmbeddingProviderError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

/**
 * @class EmbeddingService
 * @brief Turns ordered text batches into ordered embedding vectors.
 *
 * Inputs larger than the provider batch limit are sent as consecutive sub-batches and
 * the results concatenated in input order. A call either returns one vector per input
 * or throws EmbeddingProviderError; partial results are never returned. Nothing is
 * retried here.
 */
class EmbeddingService {
 public:
  EmbeddingService(std::shared_ptr<OllamaClient> ollama_client, size_t max_batch_size);
  virtual ~EmbeddingService() = default;

  virtual std::vector<std::vector<float>> embed(const std::vector<std::string> &texts);

  std::vector<float> embed_one(const std::string &text);

  size_t max_batch_size() const {
    return max_batch_size_;
  }

 private:
  std::vector<std::vector<float>> embed_batch(const std::vector<std::string> &batch);

  std::shared_ptr<OllamaClient> ollama_client_;
  size_t max_batch_size_;
};

}  // namespace docqa_core
