#pragma once

#include <optional>
#include <string>
#include <vector>

#include "ragkit_core/async/cancellation_token.hpp"
#include "ragkit_core/chunking/chunking_config.hpp"
#include "ragkit_core/chunking/structural_splitter.hpp"

namespace ragkit_core {

class EmbeddingGenerator;

/**
 * @class SemanticSplitter
 * @brief Places chunk boundaries where the topic of the text shifts.
 *
 * Each sentence is embedded together with its neighbours; a boundary goes
 * between two sentences when the cosine distance of their windows is above
 * the configured percentile of all such distances.
 */
class SemanticSplitter {
 public:
  SemanticSplitter(const EmbeddingGenerator& embedding_generator, SemanticOptions options);

  // std::nullopt when there is no usable signal (too few sentences or an
  // embedding failure); the caller then falls back to structural splitting.
  std::optional<std::vector<TextSpan>> split(const std::string& text,
                                             const async::CancellationToken& token = {}) const;

  static std::vector<TextSpan> detect_sentences(const std::string& text);

  static constexpr size_t MIN_SENTENCES = 3;

 private:
  const EmbeddingGenerator& embedding_generator_;
  SemanticOptions options_;
};

// Linear-interpolated percentile (0..100) of values; values must be non-empty.
double percentile(std::vector<double> values, double pct);

double cosine_distance(const std::vector<float>& a, const std::vector<float>& b);

}  // namespace ragkit_core
