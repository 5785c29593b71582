#include "ragkit_core/extractors/markdown_extractor.hpp"

#include <regex>

namespace ragkit_core {

bool MarkdownExtractor::can_handle(const fs::path& file_path) const {
  return file_type_for_path(file_path) == FileType::Markdown;
}

ExtractedDocument MarkdownExtractor::extract(const fs::path& file_path) const {
  ExtractedDocument document;
  document.content = get_string_content(file_path);
  document.metadata = base_metadata(file_path, document.content);
  document.title = file_path.stem().string();

  const std::regex heading_regex(R"(^(#{1,6})[ \t]+(.*\S)[ \t]*$)",
                                 std::regex_constants::ECMAScript | std::regex_constants::multiline);

  int headings = 0;
  bool title_found = false;
  auto headings_begin =
      std::sregex_iterator(document.content.begin(), document.content.end(), heading_regex);
  for (auto i = headings_begin; i != std::sregex_iterator(); ++i) {
    ++headings;
    if (!title_found && (*i)[1].length() == 1) {
      document.title = (*i)[2].str();
      title_found = true;
    }
  }

  document.metadata["headings"] = headings;
  document.metadata["title"] = document.title;
  return document;
}

}  // namespace ragkit_core
