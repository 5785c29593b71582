#include "ragkit_core/chunking/chunking_config.hpp"

#include <string>

namespace ragkit_core {

ChunkingConfig::ChunkingConfig()
    : ChunkingConfig(DEFAULT_CHUNK_SIZE, DEFAULT_CHUNK_OVERLAP) {}

ChunkingConfig::ChunkingConfig(int chunk_size,
                               int chunk_overlap,
                               int min_chunk_size,
                               int max_chunk_size,
                               bool use_semantic_splitting,
                               SemanticOptions semantic)
    : chunk_size_(chunk_size),
      chunk_overlap_(chunk_overlap),
      min_chunk_size_(min_chunk_size),
      max_chunk_size_(max_chunk_size),
      use_semantic_splitting_(use_semantic_splitting),
      semantic_(semantic) {
  validate();
}

void ChunkingConfig::validate() const {
  if (chunk_size_ <= 0) {
    throw ConfigError("Chunk size must be positive");
  }
  if (chunk_overlap_ < 0) {
    throw ConfigError("Chunk overlap cannot be negative");
  }
  if (chunk_overlap_ >= chunk_size_) {
    throw ConfigError("Chunk overlap must be less than chunk size");
  }
  if (min_chunk_size_ <= 0) {
    throw ConfigError("Minimum chunk size must be positive");
  }
  if (max_chunk_size_ < min_chunk_size_) {
    throw ConfigError("Maximum chunk size must not be smaller than minimum chunk size");
  }
  if (max_chunk_size_ < MIN_MAX_CHUNK_SIZE) {
    throw ConfigError("Maximum chunk size must be at least " + std::to_string(MIN_MAX_CHUNK_SIZE) +
                      " bytes");
  }
  if (!(semantic_.breakpoint_percentile > 0.0 && semantic_.breakpoint_percentile <= 100.0)) {
    throw ConfigError("Semantic breakpoint percentile must be in (0, 100]");
  }
  if (semantic_.window < 0) {
    throw ConfigError("Semantic window cannot be negative");
  }
}

}  // namespace ragkit_core
