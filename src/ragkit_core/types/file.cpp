#include "ragkit_core/types/file.hpp"

#include <algorithm>
#include <cctype>

namespace ragkit_core {

namespace {
constexpr const char* kTextMime = "text/plain";
constexpr const char* kMarkdownMime = "text/markdown";
}  // namespace

std::string to_string(FileType type) {
  if (type == FileType::Text) {
    return kTextMime;
  }
  if (type == FileType::Markdown) {
    return kMarkdownMime;
  }
  return "application/octet-stream";
}

FileType file_type_from_string(const std::string& mime) {
  if (mime == kTextMime) {
    return FileType::Text;
  }
  if (mime == kMarkdownMime) {
    return FileType::Markdown;
  }
  return FileType::Unknown;
}

FileType file_type_for_path(const std::filesystem::path& path) {
  std::string extension = path.extension().string();
  std::transform(extension.begin(), extension.end(), extension.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (extension == ".txt") {
    return FileType::Text;
  }
  if (extension == ".md" || extension == ".markdown") {
    return FileType::Markdown;
  }
  return FileType::Unknown;
}

}  // namespace ragkit_core
