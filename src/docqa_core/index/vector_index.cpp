#include "docqa_core/index/vector_index.hpp"

#include <faiss/utils/distances.h>

#include <algorithm>

namespace docqa_core {

VectorIndex::VectorIndex() = default;

VectorIndex::~VectorIndex() = default;

std::vector<VectorPosition> VectorIndex::add(const std::vector<std::vector<float>> &vectors) {
  if (vectors.empty()) {
    return {};
  }

  const size_t expected = dimension_ == 0 ? vectors.front().size() : dimension_;
  validate_dimensions(vectors, expected);

  if (!faiss_index_) {
    faiss_index_ = std::make_unique<faiss::IndexFlatIP>(static_cast<faiss::idx_t>(expected));
    dimension_ = expected;
  }

  const auto first = static_cast<VectorPosition>(faiss_index_->ntotal);
  std::vector<float> flat = flatten_normalized(vectors, dimension_);
  faiss_index_->add(static_cast<faiss::idx_t>(vectors.size()), flat.data());

  std::vector<VectorPosition> positions;
  positions.reserve(vectors.size());
  for (size_t i = 0; i < vectors.size(); ++i) {
    positions.push_back(first + static_cast<VectorPosition>(i));
  }
  return positions;
}

std::vector<IndexHit> VectorIndex::search(const std::vector<float> &query_vector, int k) const {
  if (!faiss_index_ || faiss_index_->ntotal == 0) {
    // If the index is empty or not built, we can't search.
    throw EmptyIndex("Vector index is empty. Cannot perform search.");
  }
  if (query_vector.size() != dimension_) {
    throw DimensionMismatch("Query vector dimension mismatch. Expected " +
                            std::to_string(dimension_) + ", got " +
                            std::to_string(query_vector.size()));
  }

  const int actual_k = std::min(k, static_cast<int>(faiss_index_->ntotal));
  if (actual_k <= 0) {
    return {};
  }

  std::vector<float> query = flatten_normalized({query_vector}, dimension_);
  std::vector<float> scores(actual_k);
  std::vector<faiss::idx_t> labels(actual_k);
  faiss_index_->search(1, query.data(), actual_k, scores.data(), labels.data());

  std::vector<IndexHit> hits;
  hits.reserve(actual_k);
  for (int i = 0; i < actual_k; ++i) {
    if (labels[i] < 0) {
      continue;
    }
    hits.push_back({static_cast<VectorPosition>(labels[i]), scores[i]});
  }
  // Faiss does not promise an order among equal scores
  std::stable_sort(hits.begin(), hits.end(), [](const IndexHit &a, const IndexHit &b) {
    if (a.score != b.score) {
      return a.score > b.score;
    }
    return a.position < b.position;
  });
  return hits;
}

std::vector<VectorPosition> VectorIndex::rebuild(const std::vector<std::vector<float>> &vectors) {
  if (!vectors.empty()) {
    validate_dimensions(vectors, vectors.front().size());
  }
  clear();
  return add(vectors);
}

void VectorIndex::clear() {
  faiss_index_.reset();
  dimension_ = 0;
  ++generation_;
}

size_t VectorIndex::size() const {
  return faiss_index_ ? static_cast<size_t>(faiss_index_->ntotal) : 0;
}

void VectorIndex::validate_dimensions(const std::vector<std::vector<float>> &vectors,
                                      size_t expected) const {
  if (expected == 0) {
    throw DimensionMismatch("Cannot index zero-dimensional vectors");
  }
  for (size_t i = 0; i < vectors.size(); ++i) {
    if (vectors[i].size() != expected) {
      throw DimensionMismatch("Vector dimension mismatch at batch row " + std::to_string(i) +
                              ". Expected " + std::to_string(expected) + ", got " +
                              std::to_string(vectors[i].size()));
    }
  }
}

std::vector<float> VectorIndex::flatten_normalized(const std::vector<std::vector<float>> &vectors,
                                                   size_t dimension) {
  std::vector<float> flat;
  flat.reserve(vectors.size() * dimension);
  for (const auto &vector : vectors) {
    flat.insert(flat.end(), vector.begin(), vector.end());
  }
  // zero vectors are left untouched by faiss and score 0 against everything
  faiss::fvec_renorm_L2(dimension, vectors.size(), flat.data());
  return flat;
}

}  // namespace docqa_core
