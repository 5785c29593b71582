#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <string>

namespace ragkit_core {

struct Document {
  long long id = 0;
  std::string title;
  std::string source;
  std::string content;
  std::string content_hash;
  nlohmann::json metadata = nlohmann::json::object();
  std::chrono::system_clock::time_point created_at;
  std::chrono::system_clock::time_point updated_at;
};

// Row of a document listing; content is not loaded.
struct DocumentSummary {
  long long id = 0;
  std::string title;
  std::string source;
  nlohmann::json metadata = nlohmann::json::object();
  int chunk_count = 0;
  std::chrono::system_clock::time_point created_at;
  std::chrono::system_clock::time_point updated_at;
};

}  // namespace ragkit_core
