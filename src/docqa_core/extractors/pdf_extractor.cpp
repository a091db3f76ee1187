#include "docqa_core/extractors/pdf_extractor.hpp"

#include <poppler-document.h>
#include <poppler-page.h>

#include <climits>
#include <memory>

#include "docqa_core/text/utf8_text.hpp"

namespace docqa_core {

bool PdfExtractor::can_handle(const std::string& file_name) const {
  return lowercase_extension(file_name) == ".pdf";
}

std::string PdfExtractor::extract_text(const std::string& raw_bytes) const {
  if (raw_bytes.size() > static_cast<size_t>(INT_MAX)) {
    throw ContentExtractorError("PDF is too large to load (" + std::to_string(raw_bytes.size()) +
                                " bytes)");
  }

  std::unique_ptr<poppler::document> document(poppler::document::load_from_raw_data(
      raw_bytes.data(), static_cast<int>(raw_bytes.size())));
  if (!document) {
    throw ContentExtractorError("Failed to parse PDF document");
  }
  if (document->is_locked()) {
    throw ContentExtractorError("PDF document is password protected");
  }

  std::string text;
  const int page_count = document->pages();
  for (int i = 0; i < page_count; ++i) {
    if (i > 0) {
      text += "\n\n";
    }
    std::unique_ptr<poppler::page> page(document->create_page(i));
    if (!page) {
      continue;
    }
    const poppler::byte_array utf8 = page->text().to_utf8();
    text.append(utf8.begin(), utf8.end());
  }
  return text::sanitize_utf8(text);
}

}  // namespace docqa_core
