#pragma once

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cmath>
#include <string>

namespace ragkit_core {

struct SearchResult {
  long long chunk_id = 0;
  long long document_id = 0;
  int chunk_index = 0;
  std::string content;
  float score = 0.0f;
  // Component scores, filled for hybrid results.
  float vector_score = 0.0f;
  float lexical_score = 0.0f;
  nlohmann::json metadata = nlohmann::json::object();
  std::string document_title;
  std::string document_source;
};

// Scores leaving the engine are clamped into [0, 1], never rejected.
inline float clamp_score(float raw) {
  if (std::isnan(raw)) {
    return 0.0f;
  }
  return std::clamp(raw, 0.0f, 1.0f);
}

}  // namespace ragkit_core
