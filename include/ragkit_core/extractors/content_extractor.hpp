#pragma once

#include <nlohmann/json.hpp>

#include <filesystem>
#include <memory>
#include <string>

#include "ragkit_core/types/file.hpp"

namespace fs = std::filesystem;

namespace ragkit_core {

class ExtractionError : public std::exception {
 public:
  explicit ExtractionError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

struct ExtractedDocument {
  std::string title;
  std::string content;
  nlohmann::json metadata = nlohmann::json::object();
};

class ContentExtractor {
 public:
  virtual ~ContentExtractor() = default;

  // Checks if this extractor can handle the given file extension
  virtual bool can_handle(const fs::path& file_path) const = 0;

  // Reads the file and returns its plain text plus document metadata
  virtual ExtractedDocument extract(const fs::path& file_path) const = 0;

  virtual FileType get_file_type() const;

  // Hex SHA-256 of the content.
  static std::string compute_content_hash(const std::string& content);

 protected:
  std::string get_string_content(const fs::path& file_path) const;
  nlohmann::json base_metadata(const fs::path& file_path, const std::string& content) const;
};

using ContentExtractorPtr = std::unique_ptr<ContentExtractor>;

}  // namespace ragkit_core
