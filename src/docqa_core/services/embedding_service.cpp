#include "docqa_core/services/embedding_service.hpp"

#include <algorithm>
#include <stdexcept>

namespace docqa_core {

EmbeddingService::EmbeddingService(std::shared_ptr<OllamaClient> ollama_client,
                                   size_t max_batch_size)
    : ollama_client_(std::move(ollama_client)), max_batch_size_(max_batch_size) {
  if (!ollama_client_) {
    throw std::invalid_argument("EmbeddingService requires an OllamaClient");
  }
  if (max_batch_size_ == 0) {
    throw std::invalid_argument("Embedding batch size must be greater than 0");
  }
}

std::vector<std::vector<float>> EmbeddingService::embed(const std::vector<std::string> &texts) {
  std::vector<std::vector<float>> vectors;
  vectors.reserve(texts.size());

  for (size_t begin = 0; begin < texts.size(); begin += max_batch_size_) {
    const size_t end = std::min(texts.size(), begin + max_batch_size_);
    std::vector<std::string> batch(texts.begin() + begin, texts.begin() + end);

    auto batch_vectors = embed_batch(batch);
    for (auto &vector : batch_vectors) {
      if (!vectors.empty() && vector.size() != vectors.front().size()) {
        throw EmbeddingProviderError("Provider returned vectors of differing dimension (" +
                                     std::to_string(vectors.front().size()) + " and " +
                                     std::to_string(vector.size()) + ")");
      }
      vectors.push_back(std::move(vector));
    }
  }
  return vectors;
}

std::vector<float> EmbeddingService::embed_one(const std::string &text) {
  auto vectors = embed({text});
  return std::move(vectors.front());
}

std::vector<std::vector<float>> EmbeddingService::embed_batch(
    const std::vector<std::string> &batch) {
  std::vector<std::vector<float>> vectors;
  try {
    vectors = ollama_client_->get_embeddings(batch);
  } catch (const std::exception &e) {
    throw EmbeddingProviderError(std::string("Embedding provider call failed: ") + e.what());
  }

  if (vectors.size() != batch.size()) {
    throw EmbeddingProviderError("Embedding provider returned " + std::to_string(vectors.size()) +
                                 " vectors for " + std::to_string(batch.size()) + " inputs");
  }
  for (size_t i = 0; i < vectors.size(); ++i) {
    if (vectors[i].empty()) {
      throw EmbeddingProviderError("Embedding provider returned an empty vector for input " +
                                   std::to_string(i));
    }
  }
  return vectors;
}

}  // namespace docqa_core
