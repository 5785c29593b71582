#include "ragkit_core/chunking/chunk_splitter.hpp"

#include <algorithm>
#include <optional>

#include "ragkit_core/chunking/semantic_splitter.hpp"
#include "ragkit_core/embedding/embedding_generator.hpp"

namespace ragkit_core {

namespace {

TextSpan unite(const TextSpan& a, const TextSpan& b) {
  return {std::min(a.start, b.start), std::max(a.end, b.end)};
}

}  // namespace

std::string to_string(SplitStrategy strategy) {
  switch (strategy) {
    case SplitStrategy::Semantic:
      return "semantic";
    default:
      return "structural";
  }
}

ChunkSplitter::ChunkSplitter(ChunkingConfig config,
                             std::shared_ptr<const EmbeddingGenerator> embedding_generator)
    : config_(config),
      embedding_generator_(std::move(embedding_generator)),
      structural_(static_cast<size_t>(config_.chunk_size()),
                  static_cast<size_t>(config_.chunk_overlap())) {}

SplitStrategy ChunkSplitter::strategy() const {
  if (config_.use_semantic_splitting() && embedding_generator_) {
    return SplitStrategy::Semantic;
  }
  return SplitStrategy::Structural;
}

std::vector<Chunk> ChunkSplitter::split(const std::string& content,
                                        const std::string& title,
                                        const std::string& source,
                                        const nlohmann::json& metadata,
                                        const async::CancellationToken& token) const {
  if (trim_span(content, {0, content.size()}).length() == 0) {
    return {};
  }

  SplitStrategy used = SplitStrategy::Structural;
  std::vector<TextSpan> spans;
  if (strategy() == SplitStrategy::Semantic) {
    SemanticSplitter semantic(*embedding_generator_, config_.semantic());
    std::optional<std::vector<TextSpan>> semantic_spans = semantic.split(content, token);
    if (semantic_spans) {
      spans = std::move(*semantic_spans);
      used = SplitStrategy::Semantic;
    }
  }
  if (used == SplitStrategy::Structural) {
    spans = structural_.split(content);
  }

  spans = merge_small(enforce_max_size(content, spans));

  std::vector<Chunk> chunks;
  chunks.reserve(spans.size());
  const int total_chunks = static_cast<int>(spans.size());
  for (size_t i = 0; i < spans.size(); ++i) {
    Chunk chunk;
    chunk.chunk_index = static_cast<int>(i);
    chunk.start_char = spans[i].start;
    chunk.end_char = spans[i].end;
    chunk.content = content.substr(spans[i].start, spans[i].length());
    chunk.token_count = estimate_token_count(chunk.content);
    if (metadata.is_object()) {
      chunk.metadata = metadata;
    }
    chunk.metadata["title"] = title;
    chunk.metadata["source"] = source;
    chunk.metadata["chunk_method"] = to_string(used);
    chunk.metadata["chunk_index"] = chunk.chunk_index;
    chunk.metadata["total_chunks"] = total_chunks;
    chunks.push_back(std::move(chunk));
  }
  return chunks;
}

std::vector<TextSpan> ChunkSplitter::enforce_max_size(const std::string& content,
                                                      const std::vector<TextSpan>& spans) const {
  const size_t max_size = static_cast<size_t>(config_.max_chunk_size());
  const size_t resplit_size = std::min(static_cast<size_t>(config_.chunk_size()), max_size);
  const size_t resplit_overlap =
      std::min(static_cast<size_t>(config_.chunk_overlap()), resplit_size - 1);

  std::vector<TextSpan> bounded;
  for (const TextSpan& span : spans) {
    if (span.length() <= max_size) {
      bounded.push_back(span);
      continue;
    }
    StructuralSplitter resplitter(resplit_size, resplit_overlap);
    for (const TextSpan& piece : resplitter.split(content, span)) {
      bounded.push_back(piece);
    }
  }
  return bounded;
}

// Undersized segments join a neighbour, but never past max_chunk_size; a
// segment that cannot be merged is kept as is.
std::vector<TextSpan> ChunkSplitter::merge_small(const std::vector<TextSpan>& spans) const {
  if (spans.size() < 2) {
    return spans;
  }
  const size_t min_size = static_cast<size_t>(config_.min_chunk_size());
  const size_t max_size = static_cast<size_t>(config_.max_chunk_size());

  std::vector<TextSpan> merged;
  std::optional<TextSpan> carry;
  for (size_t i = 0; i < spans.size(); ++i) {
    TextSpan span = spans[i];
    if (carry) {
      TextSpan joined = unite(*carry, span);
      if (joined.length() <= max_size) {
        span = joined;
      } else {
        merged.push_back(*carry);
      }
      carry.reset();
    }
    if (span.length() < min_size) {
      if (!merged.empty() && unite(merged.back(), span).length() <= max_size) {
        merged.back() = unite(merged.back(), span);
        continue;
      }
      if (i + 1 < spans.size()) {
        carry = span;
        continue;
      }
    }
    merged.push_back(span);
  }
  if (carry) {
    merged.push_back(*carry);
  }
  return merged;
}

}  // namespace ragkit_core
