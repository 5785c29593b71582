#pragma once

#include <nlohmann/json.hpp>

#include <memory>
#include <string>
#include <vector>

#include "ragkit_core/async/cancellation_token.hpp"
#include "ragkit_core/chunking/chunking_config.hpp"
#include "ragkit_core/chunking/structural_splitter.hpp"
#include "ragkit_core/types/chunk.hpp"

namespace ragkit_core {

class EmbeddingGenerator;

enum class SplitStrategy { Structural, Semantic };

std::string to_string(SplitStrategy strategy);

/**
 * @class ChunkSplitter
 * @brief Splits document text into ordered, bounded, unembedded chunks.
 *
 * The strategy is picked from the config: semantic splitting needs an
 * embedding generator and falls back to structural splitting whenever the
 * semantic signal is unavailable. Both strategies go through the same size
 * post-processing, so every chunk respects max_chunk_size.
 */
class ChunkSplitter {
 public:
  explicit ChunkSplitter(ChunkingConfig config,
                         std::shared_ptr<const EmbeddingGenerator> embedding_generator = nullptr);

  std::vector<Chunk> split(const std::string& content,
                           const std::string& title = "",
                           const std::string& source = "",
                           const nlohmann::json& metadata = nlohmann::json::object(),
                           const async::CancellationToken& token = {}) const;

  const ChunkingConfig& config() const {
    return config_;
  }
  SplitStrategy strategy() const;

 private:
  std::vector<TextSpan> enforce_max_size(const std::string& content,
                                         const std::vector<TextSpan>& spans) const;
  std::vector<TextSpan> merge_small(const std::vector<TextSpan>& spans) const;

  ChunkingConfig config_;
  std::shared_ptr<const EmbeddingGenerator> embedding_generator_;
  StructuralSplitter structural_;
};

}  // namespace ragkit_core
