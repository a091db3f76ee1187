#include "docqa_core/index/corpus_store.hpp"

#include <stdexcept>

namespace docqa_core {

Chunk CorpusStore::append(const std::string &file, const std::string &text) {
  Chunk chunk;
  chunk.id = next_id_++;
  chunk.file = file;
  chunk.text = text;
  chunks_.push_back(chunk);
  return chunk;
}

void CorpusStore::mark_indexed(ChunkId chunk_id, VectorPosition vector_position) {
  Chunk &chunk = find(chunk_id);
  if (chunk.vector_position.has_value()) {
    throw std::logic_error("Chunk " + std::to_string(chunk_id) + " is already indexed at position " +
                           std::to_string(*chunk.vector_position));
  }
  const auto expected = static_cast<VectorPosition>(position_to_id_.size());
  if (vector_position != expected) {
    throw std::logic_error("Chunk " + std::to_string(chunk_id) + " assigned position " +
                           std::to_string(vector_position) + " but the next free position is " +
                           std::to_string(expected));
  }
  chunk.vector_position = vector_position;
  position_to_id_.push_back(chunk_id);
}

const Chunk &CorpusStore::get(ChunkId chunk_id) const {
  return find(chunk_id);
}

const Chunk &CorpusStore::chunk_at(VectorPosition vector_position) const {
  if (vector_position < 0 || vector_position >= static_cast<VectorPosition>(position_to_id_.size())) {
    throw ChunkNotFound("No chunk is indexed at position " + std::to_string(vector_position));
  }
  return find(position_to_id_[vector_position]);
}

std::vector<Chunk> CorpusStore::all_pending() const {
  std::vector<Chunk> pending;
  pending.reserve(pending_count());
  for (const auto &chunk : chunks_) {
    if (!chunk.is_indexed()) {
      pending.push_back(chunk);
    }
  }
  return pending;
}

std::vector<Chunk> CorpusStore::all() const {
  return chunks_;
}

void CorpusStore::begin_generation(std::uint64_t generation) {
  for (auto &chunk : chunks_) {
    chunk.vector_position.reset();
  }
  position_to_id_.clear();
  generation_ = generation;
}

void CorpusStore::clear() {
  chunks_.clear();
  position_to_id_.clear();
  files_.clear();
  next_id_ = 0;
}

void CorpusStore::record_file(const FileRecord &record) {
  files_.push_back(record);
}

Chunk &CorpusStore::find(ChunkId chunk_id) {
  if (chunk_id < 0 || chunk_id >= static_cast<ChunkId>(chunks_.size())) {
    throw ChunkNotFound("Chunk with ID " + std::to_string(chunk_id) + " not found");
  }
  return chunks_[chunk_id];
}

const Chunk &CorpusStore::find(ChunkId chunk_id) const {
  if (chunk_id < 0 || chunk_id >= static_cast<ChunkId>(chunks_.size())) {
    throw ChunkNotFound("Chunk with ID " + std::to_string(chunk_id) + " not found");
  }
  return chunks_[chunk_id];
}

}  // namespace docqa_core
