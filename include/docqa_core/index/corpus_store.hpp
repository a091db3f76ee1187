#pragma once

#include <cstdint>
#include <exception>
#include <string>
#include <vector>

#include "docqa_core/types.hpp"

namespace docqa_core {

class ChunkNotFound : public std::exception {
 public:
  explicit ChunkNotFound(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

/**
 * @class CorpusStore
 * @brief Ordered chunk table kept in lockstep with the VectorIndex.
 *
 * Chunk ids are handed out from 0 in creation order and never reused until clear().
 * Within one index generation every indexed chunk owns a distinct position and the
 * positions form the dense range 0..indexed_count()-1, so index row i always maps back
 * to exactly one chunk. Not synchronised; the owner serialises access.
 */
class CorpusStore {
 public:
  CorpusStore() = default;

  // Non-copyable to keep a single source of truth for the corpus
  CorpusStore(const CorpusStore &) = delete;
  CorpusStore &operator=(const CorpusStore &) = delete;

  // Creates a pending chunk
  Chunk append(const std::string &file, const std::string &text);

  // Commits a chunk to the next dense position of the current generation.
  // @throw ChunkNotFound if the id is unknown
  // @throw std::logic_error if the chunk is already indexed or the position is not the
  //        next free one
  void mark_indexed(ChunkId chunk_id, VectorPosition vector_position);

  // @throw ChunkNotFound if the id is unknown
  const Chunk &get(ChunkId chunk_id) const;

  // @throw ChunkNotFound if no chunk holds the position
  const Chunk &chunk_at(VectorPosition vector_position) const;

  std::vector<Chunk> all_pending() const;
  std::vector<Chunk> all() const;

  // Forgets every vector position and adopts the index generation about to be
  // filled by a full rebuild. Chunks themselves are kept.
  void begin_generation(std::uint64_t generation);

  // Back to the initial state: no chunks, no files, ids restart at 0.
  // The generation is left for the owner to realign with begin_generation().
  void clear();

  void record_file(const FileRecord &record);
  const std::vector<FileRecord> &files() const {
    return files_;
  }

  size_t size() const {
    return chunks_.size();
  }
  size_t indexed_count() const {
    return position_to_id_.size();
  }
  size_t pending_count() const {
    return chunks_.size() - position_to_id_.size();
  }
  std::uint64_t generation() const {
    return generation_;
  }

 private:
  // ids are dense from 0, so a chunk's id is also its slot in chunks_
  std::vector<Chunk> chunks_;
  std::vector<ChunkId> position_to_id_;
  std::vector<FileRecord> files_;
  ChunkId next_id_ = 0;
  std::uint64_t generation_ = 0;

  Chunk &find(ChunkId chunk_id);
  const Chunk &find(ChunkId chunk_id) const;
};

}  // namespace docqa_core
