#include "ragkit_core/extractors/plaintext_extractor.hpp"

#include <regex>

namespace ragkit_core {

bool PlainTextExtractor::can_handle(const fs::path& file_path) const {
  return file_type_for_path(file_path) == FileType::Text;
}

ExtractedDocument PlainTextExtractor::extract(const fs::path& file_path) const {
  ExtractedDocument document;
  document.content = get_string_content(file_path);
  document.metadata = base_metadata(file_path, document.content);
  document.title = file_path.stem().string();

  // Paragraphs are separated by one or more blank lines.
  int paragraphs = 0;
  if (document.content.find_first_not_of(" \t\r\n") != std::string::npos) {
    const std::regex paragraph_regex(R"(\n[ \t\r]*\n\s*(?=\S))");
    paragraphs = 1 + static_cast<int>(std::distance(
                         std::sregex_iterator(document.content.begin(), document.content.end(),
                                              paragraph_regex),
                         std::sregex_iterator()));
  }

  document.metadata["paragraphs"] = paragraphs;
  document.metadata["title"] = document.title;
  return document;
}

}  // namespace ragkit_core
