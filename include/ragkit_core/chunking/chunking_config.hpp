#pragma once

#include <exception>
#include <string>

namespace ragkit_core {

class ConfigError : public std::exception {
 public:
  explicit ConfigError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

struct SemanticOptions {
  double breakpoint_percentile = 95.0;
  int window = 1;
};

/**
 * @class ChunkingConfig
 * @brief Validated chunk size parameters. Immutable once constructed.
 *
 * Sizes are byte lengths of UTF-8 text.
 */
class ChunkingConfig {
 public:
  static constexpr int DEFAULT_CHUNK_SIZE = 1000;
  static constexpr int DEFAULT_CHUNK_OVERLAP = 200;
  static constexpr int DEFAULT_MIN_CHUNK_SIZE = 100;
  static constexpr int DEFAULT_MAX_CHUNK_SIZE = 2000;
  // Widest UTF-8 code point; a smaller maximum cannot hold every character.
  static constexpr int MIN_MAX_CHUNK_SIZE = 4;

  ChunkingConfig();
  ChunkingConfig(int chunk_size,
                 int chunk_overlap,
                 int min_chunk_size = DEFAULT_MIN_CHUNK_SIZE,
                 int max_chunk_size = DEFAULT_MAX_CHUNK_SIZE,
                 bool use_semantic_splitting = true,
                 SemanticOptions semantic = {});

  int chunk_size() const {
    return chunk_size_;
  }
  int chunk_overlap() const {
    return chunk_overlap_;
  }
  int min_chunk_size() const {
    return min_chunk_size_;
  }
  int max_chunk_size() const {
    return max_chunk_size_;
  }
  bool use_semantic_splitting() const {
    return use_semantic_splitting_;
  }
  const SemanticOptions& semantic() const {
    return semantic_;
  }

 private:
  void validate() const;

  int chunk_size_;
  int chunk_overlap_;
  int min_chunk_size_;
  int max_chunk_size_;
  bool use_semantic_splitting_;
  SemanticOptions semantic_;
};

}  // namespace ragkit_core
