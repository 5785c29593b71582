#pragma once

#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "ragkit_core/async/cancellation_token.hpp"
#include "ragkit_core/db/storage_error.hpp"
#include "ragkit_core/types/chunk.hpp"
#include "ragkit_core/types/document.hpp"

namespace sqlite {
class database;
}

namespace ragkit_core {

class DatabaseManager;

// Chunk row joined with its document, as loaded for indexing.
struct IndexedChunk {
  long long chunk_id = 0;
  long long document_id = 0;
  int chunk_index = 0;
  std::string content;
  std::vector<float> embedding;
  nlohmann::json metadata = nlohmann::json::object();
  std::string document_title;
  std::string document_source;
};

// Vectors are persisted as packed little-endian float32.
std::vector<char> encode_vector_blob(const std::vector<float>& vector);
std::vector<float> decode_vector_blob(const std::vector<char>& blob);

/**
 * @class DocumentStore
 * @brief Durable persistence of documents and their chunks.
 *
 * Every write runs in a single transaction; a failed write leaves no trace.
 * generation() grows after each committed write so readers holding derived
 * state (the retrieval snapshot) can tell when it is stale.
 */
class DocumentStore {
 public:
  explicit DocumentStore(DatabaseManager& db_manager, size_t vector_dimension = 1024);

  // Inserts the document and then all its chunks; returns the document id.
  long long save(const Document& document,
                 const std::vector<Chunk>& chunks,
                 const async::CancellationToken& token = {});

  // Removes old_document_id and inserts document with its chunks in one
  // transaction; on failure the old document is still there.
  long long replace(long long old_document_id,
                    const Document& document,
                    const std::vector<Chunk>& chunks,
                    const async::CancellationToken& token = {});

  std::optional<Document> get(long long document_id);
  std::optional<Document> find_by_source(const std::string& source);
  std::vector<Chunk> get_chunks(long long document_id);

  // Ordered by (created_at, id).
  std::vector<DocumentSummary> list(int limit, int offset);

  // Chunks go first, then documents, in one transaction.
  void delete_all();
  bool delete_document(long long document_id);

  std::vector<IndexedChunk> load_index_rows();

  long long document_count();
  long long chunk_count();

  uint64_t generation() const {
    return generation_.load();
  }
  size_t vector_dimension() const {
    return vector_dimension_;
  }

 private:
  void validate_chunk(const Chunk& chunk, size_t content_length) const;
  long long insert_rows(sqlite::database& db,
                        const Document& document,
                        const std::vector<Chunk>& chunks,
                        const async::CancellationToken& token) const;

  DatabaseManager& db_manager_;
  size_t vector_dimension_;
  std::atomic<uint64_t> generation_{0};
};

}  // namespace ragkit_core
