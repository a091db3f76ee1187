#pragma once

#include <exception>
#include <string>
#include <vector>

namespace docqa_core {

class InvalidChunkConfig : public std::exception {
 public:
  explicit InvalidChunkConfig(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// @throw InvalidChunkConfig if chunk_size <= 0, overlap < 0 or overlap >= chunk_size.
// context is appended to the error message.
void validate_chunk_config(int chunk_size, int overlap, const std::string &context = "");

/**
 * @brief Splits extracted text into overlapping fixed-size windows.
 *
 * Sizes are counted in Unicode code points. Window k starts at
 * k * (chunk_size - overlap) and the sequence ends with the first window that
 * reaches the end of the text, so the final window may be shorter than chunk_size.
 * Every window is whitespace-trimmed and dropped when nothing is left.
 *
 * @param file_name Source file, only used to label configuration errors.
 * @param text Valid UTF-8 text.
 * @throw InvalidChunkConfig if chunk_size <= 0, overlap < 0 or overlap >= chunk_size.
 */
std::vector<std::string> chunk_text(const std::string &file_name,
                                    const std::string &text,
                                    int chunk_size,
                                    int overlap);

}  // namespace docqa_core
