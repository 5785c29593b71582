#include "ragkit_core/db/document_store.hpp"

#include <algorithm>
#include <bit>
#include <chrono>
#include <cstring>

#include "ragkit_core/db/database_manager.hpp"
#include "ragkit_core/db/pooled_connection.hpp"
#include "ragkit_core/db/sqlite_error_utils.hpp"
#include "ragkit_core/db/transaction.hpp"
#include "ragkit_core/services/compression_service.hpp"
#include "ragkit_core/utils/time_utils.hpp"

namespace ragkit_core {

namespace {

void swap_float_bytes(char* data, size_t count) {
  for (size_t i = 0; i < count; ++i) {
    std::reverse(data + i * sizeof(float), data + (i + 1) * sizeof(float));
  }
}

nlohmann::json parse_metadata(const std::string& text) {
  try {
    return nlohmann::json::parse(text);
  } catch (const nlohmann::json::parse_error& e) {
    throw StorageError("Stored metadata is not valid JSON: " + std::string(e.what()));
  }
}

std::string unpack_content(const std::optional<std::vector<char>>& blob) {
  if (!blob) {
    return "";
  }
  try {
    return CompressionService::decompress(*blob);
  } catch (const CompressionError& e) {
    throw StorageError("Stored content is corrupt: " + std::string(e.what()));
  }
}

}  // namespace

std::vector<char> encode_vector_blob(const std::vector<float>& vector) {
  std::vector<char> blob(vector.size() * sizeof(float));
  std::memcpy(blob.data(), vector.data(), blob.size());
  if constexpr (std::endian::native == std::endian::big) {
    swap_float_bytes(blob.data(), vector.size());
  }
  return blob;
}

std::vector<float> decode_vector_blob(const std::vector<char>& blob) {
  if (blob.size() % sizeof(float) != 0) {
    throw StorageError("Vector blob of " + std::to_string(blob.size()) +
                       " bytes is not a whole number of float32 values");
  }
  std::vector<char> bytes = blob;
  if constexpr (std::endian::native == std::endian::big) {
    swap_float_bytes(bytes.data(), bytes.size() / sizeof(float));
  }
  std::vector<float> vector(bytes.size() / sizeof(float));
  std::memcpy(vector.data(), bytes.data(), bytes.size());
  return vector;
}

DocumentStore::DocumentStore(DatabaseManager& db_manager, size_t vector_dimension)
    : db_manager_(db_manager), vector_dimension_(vector_dimension) {}

void DocumentStore::validate_chunk(const Chunk& chunk, size_t content_length) const {
  if (chunk.content.empty()) {
    throw StorageError("Chunk " + std::to_string(chunk.chunk_index) + " has no content");
  }
  if (chunk.end_char > content_length) {
    throw StorageError("Chunk " + std::to_string(chunk.chunk_index) + " ends at " +
                       std::to_string(chunk.end_char) + ", past the document length " +
                       std::to_string(content_length));
  }
  if (chunk.has_embedding() && chunk.vector_embedding.size() != vector_dimension_) {
    throw StorageError("Chunk " + std::to_string(chunk.chunk_index) + " embedding has dimension " +
                       std::to_string(chunk.vector_embedding.size()) + ", store expects " +
                       std::to_string(vector_dimension_));
  }
}

long long DocumentStore::insert_rows(sqlite::database& db,
                                    const Document& document,
                                    const std::vector<Chunk>& chunks,
                                    const async::CancellationToken& token) const {
  const std::string now = time_point_to_string(std::chrono::system_clock::now());
  const std::vector<char> compressed_content = CompressionService::compress(document.content);

  db << "INSERT INTO documents (title, source, content, content_length, content_hash, "
        "metadata, created_at, updated_at) VALUES (?, ?, ?, ?, ?, ?, ?, ?)"
     << document.title << document.source << compressed_content
     << static_cast<long long>(document.content.size()) << document.content_hash
     << document.metadata.dump() << now << now;
  const long long document_id = db.last_insert_rowid();

  for (const Chunk& chunk : chunks) {
    token.throw_if_cancelled("chunk insert");
    validate_chunk(chunk, document.content.size());

    std::optional<std::vector<char>> vector_blob;
    if (chunk.has_embedding()) {
      vector_blob = encode_vector_blob(chunk.vector_embedding);
    }
    db << "INSERT INTO chunks (document_id, chunk_index, start_char, end_char, content, "
          "token_count, vector_blob, metadata, created_at) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)"
       << document_id << chunk.chunk_index << static_cast<long long>(chunk.start_char)
       << static_cast<long long>(chunk.end_char) << CompressionService::compress(chunk.content)
       << chunk.token_count << vector_blob << chunk.metadata.dump() << now;
  }
  return document_id;
}

long long DocumentStore::save(const Document& document,
                              const std::vector<Chunk>& chunks,
                              const async::CancellationToken& token) {
  long long document_id = 0;
  try {
    PooledConnection conn(db_manager_);
    Transaction tx(*conn, Transaction::Mode::Immediate);
    document_id = insert_rows(*conn, document, chunks, token);
    tx.commit();
  } catch (const sqlite::sqlite_exception& e) {
    throw make_storage_error("save", e);
  } catch (const CompressionError& e) {
    throw StorageError("save failed: " + std::string(e.what()));
  }
  generation_.fetch_add(1);
  return document_id;
}

long long DocumentStore::replace(long long old_document_id,
                                 const Document& document,
                                 const std::vector<Chunk>& chunks,
                                 const async::CancellationToken& token) {
  long long document_id = 0;
  try {
    PooledConnection conn(db_manager_);
    Transaction tx(*conn, Transaction::Mode::Immediate);
    *conn << "DELETE FROM chunks WHERE document_id = ?" << old_document_id;
    *conn << "DELETE FROM documents WHERE id = ?" << old_document_id;
    document_id = insert_rows(*conn, document, chunks, token);
    tx.commit();
  } catch (const sqlite::sqlite_exception& e) {
    throw make_storage_error("replace", e);
  } catch (const CompressionError& e) {
    throw StorageError("replace failed: " + std::string(e.what()));
  }
  generation_.fetch_add(1);
  return document_id;
}

std::optional<Document> DocumentStore::get(long long document_id) {
  try {
    PooledConnection conn(db_manager_);
    std::optional<Document> result;
    *conn << "SELECT id, title, source, content, content_hash, metadata, created_at, updated_at "
             "FROM documents WHERE id = ?"
          << document_id >>
        [&](long long id, std::string title, std::string source,
            std::optional<std::vector<char>> content, std::string content_hash,
            std::string metadata, std::string created_at, std::string updated_at) {
          Document document;
          document.id = id;
          document.title = std::move(title);
          document.source = std::move(source);
          document.content = unpack_content(content);
          document.content_hash = std::move(content_hash);
          document.metadata = parse_metadata(metadata);
          document.created_at = string_to_time_point(created_at);
          document.updated_at = string_to_time_point(updated_at);
          result = std::move(document);
        };
    return result;
  } catch (const sqlite::sqlite_exception& e) {
    throw make_storage_error("get", e);
  }
}

std::optional<Document> DocumentStore::find_by_source(const std::string& source) {
  std::optional<long long> document_id;
  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT id FROM documents WHERE source = ?" << source >>
        [&](long long id) { document_id = id; };
  } catch (const sqlite::sqlite_exception& e) {
    throw make_storage_error("find_by_source", e);
  }
  if (!document_id) {
    return std::nullopt;
  }
  return get(*document_id);
}

std::vector<Chunk> DocumentStore::get_chunks(long long document_id) {
  try {
    PooledConnection conn(db_manager_);
    std::vector<Chunk> chunks;
    *conn << "SELECT id, document_id, chunk_index, start_char, end_char, content, token_count, "
             "vector_blob, metadata FROM chunks WHERE document_id = ? ORDER BY chunk_index"
          << document_id >>
        [&](long long id, long long owner_id, int chunk_index, long long start_char,
            long long end_char, std::vector<char> content, int token_count,
            std::optional<std::vector<char>> vector_blob, std::string metadata) {
          Chunk chunk;
          chunk.id = id;
          chunk.document_id = owner_id;
          chunk.chunk_index = chunk_index;
          chunk.start_char = static_cast<size_t>(start_char);
          chunk.end_char = static_cast<size_t>(end_char);
          chunk.content = unpack_content(content);
          chunk.token_count = token_count;
          if (vector_blob) {
            chunk.vector_embedding = decode_vector_blob(*vector_blob);
          }
          chunk.metadata = parse_metadata(metadata);
          chunks.push_back(std::move(chunk));
        };
    return chunks;
  } catch (const sqlite::sqlite_exception& e) {
    throw make_storage_error("get_chunks", e);
  }
}

std::vector<DocumentSummary> DocumentStore::list(int limit, int offset) {
  if (limit < 0 || offset < 0) {
    throw StorageError("list: limit and offset must not be negative");
  }
  try {
    PooledConnection conn(db_manager_);
    std::vector<DocumentSummary> summaries;
    *conn << "SELECT d.id, d.title, d.source, d.metadata, d.created_at, d.updated_at, "
             "(SELECT COUNT(*) FROM chunks c WHERE c.document_id = d.id) "
             "FROM documents d ORDER BY d.created_at, d.id LIMIT ? OFFSET ?"
          << limit << offset >>
        [&](long long id, std::string title, std::string source, std::string metadata,
            std::string created_at, std::string updated_at, int chunk_count) {
          DocumentSummary summary;
          summary.id = id;
          summary.title = std::move(title);
          summary.source = std::move(source);
          summary.metadata = parse_metadata(metadata);
          summary.created_at = string_to_time_point(created_at);
          summary.updated_at = string_to_time_point(updated_at);
          summary.chunk_count = chunk_count;
          summaries.push_back(std::move(summary));
        };
    return summaries;
  } catch (const sqlite::sqlite_exception& e) {
    throw make_storage_error("list", e);
  }
}

void DocumentStore::delete_all() {
  try {
    PooledConnection conn(db_manager_);
    Transaction tx(*conn, Transaction::Mode::Immediate);
    *conn << "DELETE FROM chunks;";
    *conn << "DELETE FROM documents;";
    tx.commit();
  } catch (const sqlite::sqlite_exception& e) {
    throw make_storage_error("delete_all", e);
  }
  generation_.fetch_add(1);
}

bool DocumentStore::delete_document(long long document_id) {
  int removed = 0;
  try {
    PooledConnection conn(db_manager_);
    Transaction tx(*conn, Transaction::Mode::Immediate);
    *conn << "DELETE FROM chunks WHERE document_id = ?" << document_id;
    *conn << "DELETE FROM documents WHERE id = ?" << document_id;
    removed = conn->rows_modified();
    tx.commit();
  } catch (const sqlite::sqlite_exception& e) {
    throw make_storage_error("delete_document", e);
  }
  if (removed > 0) {
    generation_.fetch_add(1);
  }
  return removed > 0;
}

std::vector<IndexedChunk> DocumentStore::load_index_rows() {
  try {
    PooledConnection conn(db_manager_);
    std::vector<IndexedChunk> rows;
    *conn << "SELECT c.id, c.document_id, c.chunk_index, c.content, c.vector_blob, c.metadata, "
             "d.title, d.source FROM chunks c JOIN documents d ON d.id = c.document_id "
             "ORDER BY c.id" >>
        [&](long long id, long long document_id, int chunk_index, std::vector<char> content,
            std::optional<std::vector<char>> vector_blob, std::string metadata,
            std::string title, std::string source) {
          IndexedChunk row;
          row.chunk_id = id;
          row.document_id = document_id;
          row.chunk_index = chunk_index;
          row.content = unpack_content(content);
          if (vector_blob) {
            row.embedding = decode_vector_blob(*vector_blob);
          }
          row.metadata = parse_metadata(metadata);
          row.document_title = std::move(title);
          row.document_source = std::move(source);
          rows.push_back(std::move(row));
        };
    return rows;
  } catch (const sqlite::sqlite_exception& e) {
    throw make_storage_error("load_index_rows", e);
  }
}

long long DocumentStore::document_count() {
  try {
    PooledConnection conn(db_manager_);
    long long count = 0;
    *conn << "SELECT COUNT(*) FROM documents" >> count;
    return count;
  } catch (const sqlite::sqlite_exception& e) {
    throw make_storage_error("document_count", e);
  }
}

long long DocumentStore::chunk_count() {
  try {
    PooledConnection conn(db_manager_);
    long long count = 0;
    *conn << "SELECT COUNT(*) FROM chunks" >> count;
    return count;
  } catch (const sqlite::sqlite_exception& e) {
    throw make_storage_error("chunk_count", e);
  }
}

}  // namespace ragkit_core
