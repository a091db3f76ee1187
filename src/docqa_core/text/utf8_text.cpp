#include "docqa_core/text/utf8_text.hpp"

#include <utf8.h>

namespace docqa_core::text {

namespace {
bool is_space(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}
}  // namespace

std::string sanitize_utf8(const std::string& raw) {
  std::string out;
  out.reserve(raw.size());

  auto it = raw.begin();
  if (utf8::starts_with_bom(it, raw.end())) {
    it += 3;
  }
  while (it != raw.end()) {
    auto invalid = utf8::find_invalid(it, raw.end());
    out.append(it, invalid);
    if (invalid == raw.end()) {
      break;
    }
    // skip one offending byte and resynchronise on the next one
    it = invalid + 1;
  }
  return out;
}

std::vector<size_t> code_point_offsets(const std::string& text) {
  std::vector<size_t> offsets;
  offsets.reserve(text.size() + 1);
  for (auto it = text.begin(); it != text.end(); utf8::next(it, text.end())) {
    offsets.push_back(static_cast<size_t>(it - text.begin()));
  }
  offsets.push_back(text.size());
  return offsets;
}

size_t count_code_points(const std::string& text) {
  return static_cast<size_t>(utf8::distance(text.begin(), text.end()));
}

std::string truncate_code_points(const std::string& text, size_t max_code_points,
                                 bool ellipsis) {
  auto it = text.begin();
  for (size_t i = 0; i < max_code_points && it != text.end(); ++i) {
    utf8::next(it, text.end());
  }
  if (it == text.end()) {
    return text;
  }
  std::string out(text.begin(), it);
  if (ellipsis) {
    out += "...";
  }
  return out;
}

std::string trim(std::string_view text) {
  size_t begin = 0;
  size_t end = text.size();
  while (begin < end && is_space(text[begin])) {
    ++begin;
  }
  while (end > begin && is_space(text[end - 1])) {
    --end;
  }
  return std::string(text.substr(begin, end - begin));
}

}  // namespace docqa_core::text
