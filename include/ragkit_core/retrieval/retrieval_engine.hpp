#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "ragkit_core/db/document_store.hpp"
#include "ragkit_core/retrieval/lexical_index.hpp"
#include "ragkit_core/retrieval/vector_index.hpp"
#include "ragkit_core/types/search_result.hpp"

namespace ragkit_core {

class RetrievalError : public std::exception {
 public:
  explicit RetrievalError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

struct RetrievalOptions {
  // Each signal contributes limit * candidate_multiplier hybrid candidates.
  size_t candidate_multiplier = 4;
  int max_limit = 1000;
};

/**
 * @class RetrievalEngine
 * @brief Vector, lexical and hybrid search over stored chunks.
 *
 * Queries run against an immutable snapshot (vector index, BM25 index and
 * chunk rows) built from the store. The snapshot is rebuilt lazily when the
 * store's generation moves; queries already running keep the snapshot they
 * started with. All scores are clamped to [0, 1]. Equal scores are ordered
 * by the unclamped signals, then by chunk id ascending, so hybrid_search at
 * text_weight 0 or 1 returns exactly what vector_search or lexical_search do.
 */
class RetrievalEngine {
 public:
  explicit RetrievalEngine(std::shared_ptr<DocumentStore> store, RetrievalOptions options = {});

  std::vector<SearchResult> vector_search(const std::vector<float>& query_embedding,
                                          int limit) const;

  std::vector<SearchResult> lexical_search(const std::string& query_text, int limit) const;

  // combined = (1 - text_weight) * vector + text_weight * lexical
  std::vector<SearchResult> hybrid_search(const std::vector<float>& query_embedding,
                                          const std::string& query_text,
                                          int limit,
                                          float text_weight) const;

  // Forces the next query to rebuild the snapshot.
  void invalidate();

 private:
  struct Snapshot {
    explicit Snapshot(size_t dimension) : vectors(dimension) {}

    uint64_t generation = 0;
    std::vector<IndexedChunk> rows;
    std::unordered_map<long long, size_t> row_by_chunk_id;
    VectorIndex vectors;
    LexicalIndex lexical;
  };

  std::shared_ptr<const Snapshot> snapshot() const;
  std::shared_ptr<const Snapshot> build_snapshot(uint64_t generation) const;
  void check_limit(int limit) const;
  void check_query_embedding(const std::vector<float>& query_embedding) const;
  static SearchResult make_result(const IndexedChunk& row, float score);

  std::shared_ptr<DocumentStore> store_;
  RetrievalOptions options_;
  mutable std::mutex snapshot_mutex_;
  mutable std::shared_ptr<const Snapshot> snapshot_;
};

}  // namespace ragkit_core
