#include "docqa_core/extractors/content_extractor_factory.hpp"

#include "docqa_core/extractors/content_extractor.hpp"
#include "docqa_core/extractors/docx_extractor.hpp"
#include "docqa_core/extractors/markdown_extractor.hpp"
#include "docqa_core/extractors/pdf_extractor.hpp"
#include "docqa_core/extractors/plaintext_extractor.hpp"
#include "docqa_core/extractors/unsupported_extractor.hpp"

namespace docqa_core {
ContentExtractorFactory::ContentExtractorFactory() {
  extractors.push_back(std::make_unique<MarkdownExtractor>());
  extractors.push_back(std::make_unique<PlainTextExtractor>());
  extractors.push_back(std::make_unique<PdfExtractor>());
  extractors.push_back(std::make_unique<DocxExtractor>());
  // Legacy binary Word documents are recorded but not read
  extractors.push_back(
      std::make_unique<UnsupportedExtractor>(FileType::Word, std::vector<std::string>{".doc"}));
  // Fallback, must stay last
  extractors.push_back(
      std::make_unique<UnsupportedExtractor>(FileType::Unknown, std::vector<std::string>{}));
}

const ContentExtractor& ContentExtractorFactory::get_extractor_for(
    const std::string& file_name) const {
  for (const auto& extractor : extractors) {
    if (extractor->can_handle(file_name)) {
      return *extractor;
    }
  }
  throw ContentExtractorError("No suitable content extractor found for " + file_name);
}
}  // namespace docqa_core
