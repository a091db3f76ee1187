#pragma once

#include "content_extractor.hpp"

namespace docqa_core {

class PlainTextExtractor : public ContentExtractor {
public:
    bool can_handle(const std::string& file_name) const override;

    std::string extract_text(const std::string& raw_bytes) const override;

    FileType get_file_type() const override {
        return FileType::Text;
    }
};

}
