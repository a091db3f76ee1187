#include "docqa_core/chunking/text_chunker.hpp"

#include <algorithm>

#include "docqa_core/text/utf8_text.hpp"

namespace docqa_core {

void validate_chunk_config(int chunk_size, int overlap, const std::string &context) {
  if (chunk_size <= 0) {
    throw InvalidChunkConfig("chunk_size must be positive (got " + std::to_string(chunk_size) +
                             ")" + context);
  }
  if (overlap < 0 || overlap >= chunk_size) {
    throw InvalidChunkConfig("overlap must be in [0, chunk_size) (got overlap=" +
                             std::to_string(overlap) + ", chunk_size=" +
                             std::to_string(chunk_size) + ")" + context);
  }
}

std::vector<std::string> chunk_text(const std::string &file_name,
                                    const std::string &text,
                                    int chunk_size,
                                    int overlap) {
  validate_chunk_config(chunk_size, overlap, " while chunking " + file_name);

  std::vector<std::string> chunks;
  if (text.empty()) {
    return chunks;
  }

  // offsets[i] is the byte where code point i starts; the last entry is text.size()
  const std::vector<size_t> offsets = text::code_point_offsets(text);
  const size_t total = offsets.size() - 1;
  const size_t window = static_cast<size_t>(chunk_size);
  const size_t step = static_cast<size_t>(chunk_size - overlap);

  for (size_t start = 0; start < total; start += step) {
    const size_t end = std::min(total, start + window);
    std::string piece =
        text::trim(std::string_view(text).substr(offsets[start], offsets[end] - offsets[start]));
    if (!piece.empty()) {
      chunks.push_back(std::move(piece));
    }
    if (end == total) {
      break;
    }
  }
  return chunks;
}

}  // namespace docqa_core
