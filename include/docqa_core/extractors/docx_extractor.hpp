#pragma once

#include <string>

#include "content_extractor.hpp"

namespace docqa_core {

/**
 * @class DocxExtractor
 * @brief Reads word/document.xml out of an Office Open XML package.
 *
 * Non-empty body paragraphs come first, one per line. Each body table follows, one
 * line per row with the non-empty cell texts joined by tabs. Runs keep their tabs and
 * line breaks.
 */
class DocxExtractor : public ContentExtractor {
 public:
  DocxExtractor();

  bool can_handle(const std::string& file_name) const override;

  // @throw ContentExtractorError when the package or its main part cannot be read
  std::string extract_text(const std::string& raw_bytes) const override;

  FileType get_file_type() const override {
    return FileType::Word;
  }

 private:
  static std::string read_document_part(const std::string& raw_bytes);
  static std::string text_from_document_xml(const std::string& xml);
};

}  // namespace docqa_core
