#include "ragkit_core/extractors/content_extractor.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace ragkit_core {

FileType ContentExtractor::get_file_type() const {
  return FileType::Unknown;
}

std::string ContentExtractor::get_string_content(const fs::path& file_path) const {
  std::error_code ec;
  if (!fs::is_regular_file(file_path, ec)) {
    throw ExtractionError("Not a readable file: " + file_path.string());
  }
  std::ifstream file_stream(file_path, std::ios::binary);
  if (!file_stream.is_open()) {
    throw ExtractionError("Could not open file: " + file_path.string());
  }

  std::stringstream buffer;
  buffer << file_stream.rdbuf();
  if (file_stream.bad()) {
    throw ExtractionError("Failed while reading file: " + file_path.string());
  }
  return buffer.str();
}

nlohmann::json ContentExtractor::base_metadata(const fs::path& file_path,
                                               const std::string& content) const {
  nlohmann::json metadata = nlohmann::json::object();
  metadata["file_name"] = file_path.filename().string();
  metadata["content_type"] = to_string(get_file_type());
  metadata["file_size"] = content.size();
  metadata["lines"] = std::count(content.begin(), content.end(), '\n') +
                      (!content.empty() && content.back() != '\n' ? 1 : 0);
  return metadata;
}

std::string ContentExtractor::compute_content_hash(const std::string& content) {
  EVP_MD_CTX* mdctx = EVP_MD_CTX_new();
  if (!mdctx) {
    throw ExtractionError("Failed to create EVP context for hashing");
  }

  if (EVP_DigestInit_ex(mdctx, EVP_sha256(), nullptr) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw ExtractionError("Failed to initialize SHA256 digest");
  }

  if (EVP_DigestUpdate(mdctx, content.data(), content.length()) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw ExtractionError("Failed to update SHA256 digest");
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len;
  if (EVP_DigestFinal_ex(mdctx, hash, &hash_len) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw ExtractionError("Failed to finalize SHA256 digest");
  }

  EVP_MD_CTX_free(mdctx);

  std::stringstream ss;
  for (unsigned int i = 0; i < hash_len; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
  }
  return ss.str();
}

}  // namespace ragkit_core
