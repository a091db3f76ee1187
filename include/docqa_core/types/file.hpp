#pragma once

#include <cstddef>
#include <string>

namespace docqa_core {

// Core file type enumeration
enum class FileType { Text, Markdown, PDF, Word, Unknown };

// Conversion utilities
std::string to_string(FileType type);
FileType file_type_from_string(const std::string& str);

// What the corpus remembers about each uploaded file
struct FileRecord {
  std::string file;
  FileType file_type = FileType::Unknown;
  std::string content_hash;
  size_t size_bytes = 0;
  size_t chunk_count = 0;
};

}  // namespace docqa_core
