#pragma once

#include <faiss/IndexFlat.h>

#include <cstdint>
#include <exception>
#include <memory>
#include <string>
#include <vector>

#include "docqa_core/types/chunk.hpp"

namespace docqa_core {

class DimensionMismatch : public std::exception {
 public:
  explicit DimensionMismatch(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

class EmptyIndex : public std::exception {
 public:
  explicit EmptyIndex(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

struct IndexHit {
  VectorPosition position = 0;
  float score = 0.0f;
};

/**
 * @class VectorIndex
 * @brief Exact in-memory nearest-neighbour index over chunk embeddings.
 *
 * Vectors are L2-normalised on the way in and searched by inner product, so scores
 * are cosine similarities and results are ranked by descending score. Row i of the
 * index is position i. The dimension is fixed by the first add after construction,
 * clear() or rebuild(). Not synchronised; the owner serialises access.
 */
class VectorIndex {
 public:
  VectorIndex();
  ~VectorIndex();

  VectorIndex(const VectorIndex &) = delete;
  VectorIndex &operator=(const VectorIndex &) = delete;

  // Appends the vectors and returns their positions (current size, size + 1, ...).
  // Either all vectors are stored or none are.
  std::vector<VectorPosition> add(const std::vector<std::vector<float>> &vectors);

  // Best-first hits; k is clamped to size(). Equal scores keep position order.
  std::vector<IndexHit> search(const std::vector<float> &query_vector, int k) const;

  // Replaces the whole structure with `vectors` at positions 0..n-1 and starts a new
  // generation. The dimension is taken from the new vectors.
  std::vector<VectorPosition> rebuild(const std::vector<std::vector<float>> &vectors);

  // Drops every vector and the fixed dimension; starts a new generation.
  void clear();

  size_t size() const;
  bool empty() const {
    return size() == 0;
  }
  // 0 until the first vector has been added
  size_t dimension() const {
    return dimension_;
  }
  std::uint64_t generation() const {
    return generation_;
  }

 private:
  std::unique_ptr<faiss::IndexFlatIP> faiss_index_;
  size_t dimension_ = 0;
  std::uint64_t generation_ = 0;

  // Helper methods
  void validate_dimensions(const std::vector<std::vector<float>> &vectors,
                           size_t expected) const;
  static std::vector<float> flatten_normalized(const std::vector<std::vector<float>> &vectors,
                                               size_t dimension);
};

}  // namespace docqa_core
