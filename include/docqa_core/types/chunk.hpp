#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace docqa_core {

using ChunkId = std::int64_t;
using VectorPosition = std::int64_t;

// A passage of one uploaded file. text never changes after creation; vector_position
// stays empty until the chunk's embedding is committed to the vector index.
struct Chunk {
  ChunkId id = 0;
  std::string file;
  std::string text;
  std::optional<VectorPosition> vector_position;

  bool is_indexed() const {
    return vector_position.has_value();
  }
};

// One ranked retrieval hit. text is the full chunk text handed to the answer
// composer; preview is the bounded excerpt meant for display.
struct QueryResult {
  ChunkId chunk_id = 0;
  std::string file;
  std::string preview;
  std::string text;
  float score = 0.0f;
};

}  // namespace docqa_core
