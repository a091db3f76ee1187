#include "docqa_core/types.hpp"

namespace docqa_core {

std::string to_string(FileType type) {
  switch (type) {
    case FileType::Text:
      return "Text";
    case FileType::Markdown:
      return "Markdown";
    case FileType::PDF:
      return "PDF";
    case FileType::Word:
      return "Word";
    default:
      return "Unknown";
  }
}

FileType file_type_from_string(const std::string& str) {
  if (str == "Text")
    return FileType::Text;
  if (str == "Markdown")
    return FileType::Markdown;
  if (str == "PDF")
    return FileType::PDF;
  if (str == "Word")
    return FileType::Word;
  return FileType::Unknown;
}

}  // namespace docqa_core
