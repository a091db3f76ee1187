#include "docqa_core/services/retriever.hpp"

#include <algorithm>
#include <stdexcept>

#include "docqa_core/text/utf8_text.hpp"

namespace docqa_core {

Retriever::Retriever(std::shared_ptr<EmbeddingService> embedding_service,
                     const CorpusStore &corpus_store,
                     const VectorIndex &vector_index,
                     RetrieverOptions options)
    : embedding_service_(std::move(embedding_service)),
      corpus_store_(corpus_store),
      vector_index_(vector_index),
      options_(options) {
  if (options_.max_top_k < 1) {
    throw std::invalid_argument("max_top_k must be at least 1");
  }
  options_.default_top_k = std::clamp(options_.default_top_k, 1, options_.max_top_k);
}

std::vector<QueryResult> Retriever::retrieve(const std::string &question,
                                             std::optional<int> top_k) const {
  ensure_ready();
  // Convert the question to a vector embedding
  std::vector<float> query_embedding = embedding_service_->embed_one(question);
  return retrieve_by_vector(query_embedding, top_k);
}

std::vector<QueryResult> Retriever::retrieve_by_vector(const std::vector<float> &query_vector,
                                                       std::optional<int> top_k) const {
  ensure_ready();
  if (corpus_store_.generation() != vector_index_.generation() ||
      corpus_store_.indexed_count() != vector_index_.size()) {
    throw std::logic_error("Corpus store (generation " +
                           std::to_string(corpus_store_.generation()) + ", " +
                           std::to_string(corpus_store_.indexed_count()) +
                           " indexed) is out of sync with the vector index (generation " +
                           std::to_string(vector_index_.generation()) + ", " +
                           std::to_string(vector_index_.size()) + " vectors)");
  }

  const auto hits = vector_index_.search(query_vector, clamp_top_k(top_k));

  std::vector<QueryResult> results;
  results.reserve(hits.size());
  for (const auto &hit : hits) {
    const Chunk &chunk = corpus_store_.chunk_at(hit.position);
    QueryResult result;
    result.chunk_id = chunk.id;
    result.file = chunk.file;
    result.preview = text::truncate_code_points(chunk.text, options_.preview_length, true);
    result.text = chunk.text;
    result.score = hit.score;
    results.push_back(std::move(result));
  }
  return results;
}

int Retriever::clamp_top_k(std::optional<int> requested) const {
  if (!requested.has_value()) {
    return options_.default_top_k;
  }
  return std::clamp(*requested, 1, options_.max_top_k);
}

void Retriever::ensure_ready() const {
  if (vector_index_.empty()) {
    throw IndexNotBuilt("The index has not been built. Upload documents and build the index first.");
  }
}

}  // namespace docqa_core
