#pragma once

#include "content_extractor.hpp"

namespace docqa_core {

// Page text from poppler, pages joined by a blank line. Pages without a text layer
// contribute an empty string.
class PdfExtractor : public ContentExtractor {
 public:
  bool can_handle(const std::string& file_name) const override;

  // @throw ContentExtractorError when the bytes are not a readable PDF or the
  // document is password protected
  std::string extract_text(const std::string& raw_bytes) const override;

  FileType get_file_type() const override {
    return FileType::PDF;
  }
};

}  // namespace docqa_core
