#pragma once

#include <exception>
#include <memory>
#include <string>

#include "docqa_core/types/file.hpp"

namespace docqa_core {

class ContentExtractorError : public std::exception {
 public:
  explicit ContentExtractorError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Turns the raw bytes of an uploaded file into plain UTF-8 text. An empty result means
// the file contributes nothing to the corpus and is not an error.
class ContentExtractor {
 public:
  virtual ~ContentExtractor() = default;

  // Checks if this extractor can handle the given file name (by extension)
  virtual bool can_handle(const std::string& file_name) const = 0;

  virtual std::string extract_text(const std::string& raw_bytes) const = 0;

  virtual FileType get_file_type() const = 0;

  // Hex SHA-256 of the raw bytes
  std::string compute_content_hash(const std::string& raw_bytes) const;

 protected:
  // ".md" for "Notes.MD", "" when there is no extension
  static std::string lowercase_extension(const std::string& file_name);
};

// Define a type for our smart pointers
using ContentExtractorPtr = std::unique_ptr<ContentExtractor>;

}  // namespace docqa_core
