#include "docqa_core/extractors/unsupported_extractor.hpp"

#include <algorithm>

namespace docqa_core {

UnsupportedExtractor::UnsupportedExtractor(FileType file_type, std::vector<std::string> extensions)
    : file_type_(file_type), extensions_(std::move(extensions)) {}

bool UnsupportedExtractor::can_handle(const std::string& file_name) const {
  if (extensions_.empty()) {
    return true;
  }
  const std::string extension = lowercase_extension(file_name);
  return std::find(extensions_.begin(), extensions_.end(), extension) != extensions_.end();
}

std::string UnsupportedExtractor::extract_text(const std::string& /*raw_bytes*/) const {
  return "";
}

}  // namespace docqa_core
