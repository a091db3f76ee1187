#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

// Helpers for treating UTF-8 text as a sequence of Unicode code points. Chunk sizes
// and preview lengths are both measured in code points.
namespace docqa_core::text {

// Drops bytes that do not form valid UTF-8 and a leading byte order mark.
std::string sanitize_utf8(const std::string& raw);

// Byte offset of every code point in `text`, followed by text.size().
// `text` must be valid UTF-8.
std::vector<size_t> code_point_offsets(const std::string& text);

size_t count_code_points(const std::string& text);

// First `max_code_points` code points of `text`. When the text is cut and
// `ellipsis` is set, "..." is appended.
std::string truncate_code_points(const std::string& text, size_t max_code_points,
                                 bool ellipsis = false);

// Strips leading and trailing ASCII whitespace.
std::string trim(std::string_view text);

}  // namespace docqa_core::text
