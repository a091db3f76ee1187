#include "docqa_core/extractors/markdown_extractor.hpp"

#include <regex>

#include "docqa_core/text/utf8_text.hpp"

namespace docqa_core {
bool MarkdownExtractor::can_handle(const std::string& file_name) const {
  const std::string extension = lowercase_extension(file_name);
  return extension == ".md" || extension == ".markdown";
}

std::string MarkdownExtractor::extract_text(const std::string& raw_bytes) const {
  return strip_front_matter(text::sanitize_utf8(raw_bytes));
}

std::string MarkdownExtractor::strip_front_matter(const std::string& content) {
  // "---" on the first line, anything, then a closing "---" line
  static const std::regex front_matter_regex(R"(---[ \t]*\r?\n[\s\S]*?\r?\n---[ \t]*(\r?\n|$))");

  std::smatch match;
  if (std::regex_search(content, match, front_matter_regex,
                        std::regex_constants::match_continuous)) {
    return content.substr(static_cast<size_t>(match.length(0)));
  }
  return content;
}
}  // namespace docqa_core
