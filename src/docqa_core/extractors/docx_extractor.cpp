#include "docqa_core/extractors/docx_extractor.hpp"

#include <libxml/parser.h>
#include <libxml/tree.h>
#include <zip.h>

#include <climits>
#include <memory>
#include <vector>

#include "docqa_core/text/utf8_text.hpp"

namespace docqa_core {

namespace {
constexpr const char* kDocumentPart = "word/document.xml";
constexpr const char* kWordNamespace =
    "http://schemas.openxmlformats.org/wordprocessingml/2006/main";

struct ZipArchiveDeleter {
  void operator()(zip_t* archive) const {
    zip_discard(archive);
  }
};

struct ZipFileDeleter {
  void operator()(zip_file_t* file) const {
    zip_fclose(file);
  }
};

struct XmlDocDeleter {
  void operator()(xmlDoc* doc) const {
    xmlFreeDoc(doc);
  }
};

bool is_word_element(const xmlNode* node, const char* name) {
  return node->type == XML_ELEMENT_NODE && node->ns != nullptr && node->ns->href != nullptr &&
         xmlStrcmp(node->ns->href, reinterpret_cast<const xmlChar*>(kWordNamespace)) == 0 &&
         xmlStrcmp(node->name, reinterpret_cast<const xmlChar*>(name)) == 0;
}

const xmlNode* find_word_child(const xmlNode* parent, const char* name) {
  for (const xmlNode* child = parent->children; child != nullptr; child = child->next) {
    if (is_word_element(child, name)) {
      return child;
    }
  }
  return nullptr;
}

// Text of the runs below node. Property blocks hold tab stop definitions, not text.
void append_run_text(const xmlNode* node, std::string& out) {
  for (const xmlNode* child = node->children; child != nullptr; child = child->next) {
    if (child->type != XML_ELEMENT_NODE) {
      continue;
    }
    if (is_word_element(child, "t")) {
      xmlChar* content = xmlNodeGetContent(child);
      if (content != nullptr) {
        out += reinterpret_cast<const char*>(content);
        xmlFree(content);
      }
    } else if (is_word_element(child, "tab")) {
      out += '\t';
    } else if (is_word_element(child, "br") || is_word_element(child, "cr")) {
      out += '\n';
    } else if (!is_word_element(child, "pPr") && !is_word_element(child, "rPr") &&
               !is_word_element(child, "tbl")) {
      append_run_text(child, out);
    }
  }
}

std::string paragraph_text(const xmlNode* paragraph) {
  std::string text;
  append_run_text(paragraph, text);
  return text;
}

std::string cell_text(const xmlNode* cell) {
  std::string text;
  bool first = true;
  for (const xmlNode* child = cell->children; child != nullptr; child = child->next) {
    if (!is_word_element(child, "p")) {
      continue;
    }
    if (!first) {
      text += '\n';
    }
    text += paragraph_text(child);
    first = false;
  }
  return text;
}

std::string row_text(const xmlNode* row) {
  std::string text;
  for (const xmlNode* child = row->children; child != nullptr; child = child->next) {
    if (!is_word_element(child, "tc")) {
      continue;
    }
    const std::string cell = cell_text(child);
    if (cell.empty()) {
      continue;
    }
    if (!text.empty()) {
      text += '\t';
    }
    text += cell;
  }
  return text;
}
}  // namespace

DocxExtractor::DocxExtractor() {
  // Uploads are extracted on the request threads
  xmlInitParser();
}

bool DocxExtractor::can_handle(const std::string& file_name) const {
  return lowercase_extension(file_name) == ".docx";
}

std::string DocxExtractor::extract_text(const std::string& raw_bytes) const {
  return text_from_document_xml(read_document_part(raw_bytes));
}

std::string DocxExtractor::read_document_part(const std::string& raw_bytes) {
  zip_error_t error;
  zip_error_init(&error);

  zip_source_t* source = zip_source_buffer_create(raw_bytes.data(), raw_bytes.size(), 0, &error);
  if (!source) {
    std::string message = zip_error_strerror(&error);
    zip_error_fini(&error);
    throw ContentExtractorError("Failed to open DOCX buffer: " + message);
  }

  std::unique_ptr<zip_t, ZipArchiveDeleter> archive(zip_open_from_source(source, ZIP_RDONLY, &error));
  if (!archive) {
    // The source is only owned by the archive once it has been opened
    zip_source_free(source);
    std::string message = zip_error_strerror(&error);
    zip_error_fini(&error);
    throw ContentExtractorError("DOCX is not a valid zip package: " + message);
  }
  zip_error_fini(&error);

  zip_stat_t part_stat;
  zip_stat_init(&part_stat);
  if (zip_stat(archive.get(), kDocumentPart, 0, &part_stat) != 0 ||
      !(part_stat.valid & ZIP_STAT_SIZE)) {
    throw ContentExtractorError(std::string("DOCX package has no ") + kDocumentPart);
  }
  if (part_stat.size > static_cast<zip_uint64_t>(INT_MAX)) {
    throw ContentExtractorError(std::string(kDocumentPart) + " is too large (" +
                                std::to_string(part_stat.size) + " bytes)");
  }

  std::unique_ptr<zip_file_t, ZipFileDeleter> file(zip_fopen(archive.get(), kDocumentPart, 0));
  if (!file) {
    throw ContentExtractorError(std::string("Failed to open ") + kDocumentPart + ": " +
                                zip_strerror(archive.get()));
  }

  std::string xml(static_cast<size_t>(part_stat.size), '\0');
  size_t offset = 0;
  while (offset < xml.size()) {
    const zip_int64_t read = zip_fread(file.get(), xml.data() + offset, xml.size() - offset);
    if (read < 0) {
      throw ContentExtractorError(std::string("Failed to read ") + kDocumentPart + ": " +
                                  zip_file_strerror(file.get()));
    }
    if (read == 0) {
      break;
    }
    offset += static_cast<size_t>(read);
  }
  xml.resize(offset);
  return xml;
}

std::string DocxExtractor::text_from_document_xml(const std::string& xml) {
  std::unique_ptr<xmlDoc, XmlDocDeleter> doc(
      xmlReadMemory(xml.data(), static_cast<int>(xml.size()), kDocumentPart, nullptr,
                    XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING));
  if (!doc) {
    throw ContentExtractorError(std::string("Failed to parse ") + kDocumentPart);
  }

  const xmlNode* root = xmlDocGetRootElement(doc.get());
  const xmlNode* body = root != nullptr && is_word_element(root, "document")
                            ? find_word_child(root, "body")
                            : nullptr;
  if (!body) {
    throw ContentExtractorError(std::string(kDocumentPart) + " has no document body");
  }

  std::vector<std::string> parts;
  for (const xmlNode* child = body->children; child != nullptr; child = child->next) {
    if (is_word_element(child, "p")) {
      std::string text = paragraph_text(child);
      if (!text.empty()) {
        parts.push_back(std::move(text));
      }
    }
  }
  for (const xmlNode* child = body->children; child != nullptr; child = child->next) {
    if (!is_word_element(child, "tbl")) {
      continue;
    }
    for (const xmlNode* row = child->children; row != nullptr; row = row->next) {
      if (is_word_element(row, "tr")) {
        parts.push_back(row_text(row));
      }
    }
  }

  std::string text;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) {
      text += '\n';
    }
    text += parts[i];
  }
  return text::sanitize_utf8(text);
}

}  // namespace docqa_core
