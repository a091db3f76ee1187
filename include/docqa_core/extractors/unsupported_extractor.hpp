#pragma once

#include <string>
#include <vector>

#include "content_extractor.hpp"

namespace docqa_core {

/**
 * @class UnsupportedExtractor
 * @brief Accepts file types the service cannot read and yields no text for them.
 *
 * With an empty extension list it accepts every file, which makes it the fallback
 * registered last in the factory.
 */
class UnsupportedExtractor : public ContentExtractor {
 public:
  UnsupportedExtractor(FileType file_type, std::vector<std::string> extensions);

  bool can_handle(const std::string& file_name) const override;

  std::string extract_text(const std::string& raw_bytes) const override;

  FileType get_file_type() const override {
    return file_type_;
  }

 private:
  FileType file_type_;
  std::vector<std::string> extensions_;
};

}  // namespace docqa_core
