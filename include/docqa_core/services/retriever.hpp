#pragma once

#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "docqa_core/index/corpus_store.hpp"
#include "docqa_core/index/vector_index.hpp"
#include "docqa_core/services/embedding_service.hpp"
#include "docqa_core/types/chunk.hpp"

namespace docqa_core {

// The user has not built an index yet (or reset it). Expected, not a failure.
class IndexNotBuilt : public std::exception {
 public:
  explicit IndexNotBuilt(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

struct RetrieverOptions {
  int default_top_k = 6;
  int max_top_k = 20;
  size_t preview_length = 300;
};

class Retriever {
 public:
  Retriever(std::shared_ptr<EmbeddingService> embedding_service,
            const CorpusStore &corpus_store,
            const VectorIndex &vector_index,
            RetrieverOptions options = {});

  // Natural-language retrieval. Returns at most min(top_k, indexed chunks) results,
  // best first. Missing top_k means the default; out-of-range values are clamped.
  // @throw IndexNotBuilt before any provider call when nothing is indexed
  std::vector<QueryResult> retrieve(const std::string &question,
                                    std::optional<int> top_k = std::nullopt) const;

  std::vector<QueryResult> retrieve_by_vector(const std::vector<float> &query_vector,
                                              std::optional<int> top_k = std::nullopt) const;

  int clamp_top_k(std::optional<int> requested) const;

  const RetrieverOptions &options() const {
    return options_;
  }

 private:
  void ensure_ready() const;

  std::shared_ptr<EmbeddingService> embedding_service_;
  const CorpusStore &corpus_store_;
  const VectorIndex &vector_index_;
  RetrieverOptions options_;
};

}  // namespace docqa_core
