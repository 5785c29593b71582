#pragma once
#include "content_extractor.hpp"

namespace ragkit_core {

// Title is the first level-one heading, falling back to the file stem.
class MarkdownExtractor : public ContentExtractor {
 public:
  bool can_handle(const fs::path& file_path) const override;

  ExtractedDocument extract(const fs::path& file_path) const override;

  FileType get_file_type() const override {
    return FileType::Markdown;
  }
};

}  // namespace ragkit_core
