#pragma once
#include "content_extractor.hpp"

namespace docqa_core {

class MarkdownExtractor : public ContentExtractor {
public:
    bool can_handle(const std::string& file_name) const override;

    // Plain text with a leading YAML front-matter block removed
    std::string extract_text(const std::string& raw_bytes) const override;

    FileType get_file_type() const override {
        return FileType::Markdown;
    }

private:
    static std::string strip_front_matter(const std::string& content);
};

}
