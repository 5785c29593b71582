#pragma once

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstddef>
#include <string>
#include <vector>

namespace ragkit_core {

// A bounded slice of a document. start_char/end_char are byte offsets into
// the owning document's content, end exclusive.
struct Chunk {
  long long id = 0;
  long long document_id = 0;
  int chunk_index = 0;
  size_t start_char = 0;
  size_t end_char = 0;
  std::string content;
  int token_count = 0;
  std::vector<float> vector_embedding;
  nlohmann::json metadata = nlohmann::json::object();

  bool has_embedding() const {
    return !vector_embedding.empty();
  }
};

// Cost-estimate proxy only (roughly four bytes per token).
inline int estimate_token_count(const std::string& content) {
  return std::max(1, static_cast<int>(content.size() / 4));
}

}  // namespace ragkit_core
