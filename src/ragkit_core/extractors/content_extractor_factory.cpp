#include "ragkit_core/extractors/content_extractor_factory.hpp"

#include "ragkit_core/extractors/markdown_extractor.hpp"
#include "ragkit_core/extractors/plaintext_extractor.hpp"

namespace ragkit_core {

ContentExtractorFactory::ContentExtractorFactory() {
  extractors.push_back(std::make_unique<MarkdownExtractor>());
  extractors.push_back(std::make_unique<PlainTextExtractor>());
}

const ContentExtractor& ContentExtractorFactory::get_extractor_for(
    const std::filesystem::path& file_path) const {
  for (const auto& extractor : extractors) {
    if (extractor->can_handle(file_path)) {
      return *extractor;
    }
  }
  throw ExtractionError("No suitable content extractor found for " + file_path.string());
}

bool ContentExtractorFactory::can_handle(const std::filesystem::path& file_path) const {
  for (const auto& extractor : extractors) {
    if (extractor->can_handle(file_path)) {
      return true;
    }
  }
  return false;
}

}  // namespace ragkit_core
