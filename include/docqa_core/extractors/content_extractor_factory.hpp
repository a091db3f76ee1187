#pragma once
#include <memory>
#include <string>
#include <vector>

#include "content_extractor.hpp"

/**
 * @class ContentExtractorFactory
 * @brief Manages and provides the correct ContentExtractor for a given file name.
 *
 * Extractors are consulted in registration order and the first one that accepts the
 * file's extension wins. An UnsupportedExtractor is always registered last, so every
 * file name resolves to some extractor. This class is non-copyable and non-movable.
 */
namespace docqa_core {
class ContentExtractorFactory {
 public:
  ContentExtractorFactory();
  virtual ~ContentExtractorFactory() = default;

  virtual const ContentExtractor& get_extractor_for(const std::string& file_name) const;

  ContentExtractorFactory(const ContentExtractorFactory&) = delete;
  ContentExtractorFactory& operator=(const ContentExtractorFactory&) = delete;
  ContentExtractorFactory(ContentExtractorFactory&&) = delete;
  ContentExtractorFactory& operator=(ContentExtractorFactory&&) = delete;

 private:
  std::vector<std::unique_ptr<ContentExtractor>> extractors;
};
}  // namespace docqa_core
