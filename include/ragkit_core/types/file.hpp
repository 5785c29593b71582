#pragma once

#include <filesystem>
#include <string>

namespace ragkit_core {

// Kinds of source file ingestion knows how to read.
enum class FileType { Text, Markdown, Unknown };

// MIME name stored under the "content_type" metadata key.
std::string to_string(FileType type);
FileType file_type_from_string(const std::string& mime);

// Classifies by extension, ignoring case: .txt, .md and .markdown.
FileType file_type_for_path(const std::filesystem::path& path);

}  // namespace ragkit_core
