#include "docqa_core/extractors/plaintext_extractor.hpp"

#include "docqa_core/text/utf8_text.hpp"

namespace docqa_core {

bool PlainTextExtractor::can_handle(const std::string& file_name) const {
    const std::string extension = lowercase_extension(file_name);
    return extension == ".txt" || extension == ".text" || extension == ".log" ||
           extension == ".csv";
}

// Uploads are not trusted to be valid UTF-8; undecodable bytes are dropped so the
// chunker can count code points safely.
std::string PlainTextExtractor::extract_text(const std::string& raw_bytes) const {
    return text::sanitize_utf8(raw_bytes);
}

} // namespace docqa_core
