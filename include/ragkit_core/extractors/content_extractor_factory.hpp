#pragma once
#include <filesystem>
#include <memory>
#include <vector>

#include "content_extractor.hpp"

namespace ragkit_core {

/**
 * @class ContentExtractorFactory
 * @brief Holds the available content extractors and picks one per file.
 */
class ContentExtractorFactory {
 public:
  ContentExtractorFactory();
  virtual ~ContentExtractorFactory() = default;

  /**
   * @brief Returns the first registered extractor that can handle the file.
   * @throw ExtractionError if no extractor supports the file.
   */
  virtual const ContentExtractor& get_extractor_for(const std::filesystem::path& file_path) const;

  virtual bool can_handle(const std::filesystem::path& file_path) const;

  ContentExtractorFactory(const ContentExtractorFactory&) = delete;
  ContentExtractorFactory& operator=(const ContentExtractorFactory&) = delete;
  ContentExtractorFactory(ContentExtractorFactory&&) = delete;
  ContentExtractorFactory& operator=(ContentExtractorFactory&&) = delete;

 private:
  std::vector<ContentExtractorPtr> extractors;
};

}  // namespace ragkit_core
