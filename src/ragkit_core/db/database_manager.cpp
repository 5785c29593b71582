#include "ragkit_core/db/database_manager.hpp"

#include <iostream>

#include "ragkit_core/db/sqlite_error_utils.hpp"
#include "ragkit_core/db/storage_error.hpp"

namespace ragkit_core {

DatabaseManager::~DatabaseManager() {
  shutdown();
}

void DatabaseManager::initialize(const std::filesystem::path& db_path,
                                 const std::string& db_key,
                                 int pool_size,
                                 std::chrono::milliseconds acquire_timeout) {
  if (pool_) {
    return;
  }

  if (db_path.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(db_path.parent_path(), ec);
    if (ec) {
      throw StorageError("Cannot create " + db_path.parent_path().string() + ": " + ec.message(),
                         DbErrorKind::CantOpen);
    }
  }

  {
    DbHandle setup = open_keyed_connection(db_path.string(), db_key);
    int version = 0;
    try {
      *setup << "PRAGMA user_version;" >> version;
    } catch (const sqlite::sqlite_exception& e) {
      throw make_storage_error("read user_version", e);
    }
    if (version > kSchemaVersion) {
      throw StorageError(db_path.string() + " has schema version " + std::to_string(version) +
                             ", this build supports up to " + std::to_string(kSchemaVersion),
                         DbErrorKind::Schema);
    }
    create_schema(*setup);
    if (version == 0) {
      std::cout << "DatabaseManager: created schema v" << kSchemaVersion << " in "
                << db_path.string() << std::endl;
    }
  }

  pool_ = std::make_unique<ConnectionPool>(db_path.string(), db_key, pool_size, acquire_timeout);
}

void DatabaseManager::shutdown() {
  if (pool_) {
    pool_->close();
  }
}

DbHandle DatabaseManager::acquire() {
  if (!pool_) {
    throw StorageError("DatabaseManager::initialize has not been called");
  }
  return pool_->acquire();
}

void DatabaseManager::release(DbHandle conn) {
  if (pool_) {
    pool_->release(std::move(conn));
  }
}

void DatabaseManager::create_schema(sqlite::database& db) {
  try {
    db << R"(
        CREATE TABLE IF NOT EXISTS documents (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            title TEXT NOT NULL,
            source TEXT NOT NULL UNIQUE,
            content BLOB,
            content_length INTEGER NOT NULL,
            content_hash TEXT NOT NULL,
            metadata TEXT NOT NULL DEFAULT '{}',
            created_at TEXT NOT NULL,
            updated_at TEXT NOT NULL
        )
      )";

    // Offsets are byte positions into the owning document's content.
    db << R"(
        CREATE TABLE IF NOT EXISTS chunks (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            document_id INTEGER NOT NULL,
            chunk_index INTEGER NOT NULL,
            start_char INTEGER NOT NULL,
            end_char INTEGER NOT NULL,
            content BLOB NOT NULL,
            token_count INTEGER NOT NULL,
            vector_blob BLOB,
            metadata TEXT NOT NULL DEFAULT '{}',
            created_at TEXT NOT NULL,
            UNIQUE (document_id, chunk_index),
            CHECK (start_char >= 0 AND end_char > start_char),
            FOREIGN KEY (document_id) REFERENCES documents(id) ON DELETE CASCADE
        )
      )";

    db << "CREATE INDEX IF NOT EXISTS idx_chunks_document ON chunks(document_id, chunk_index)";
    db << "CREATE INDEX IF NOT EXISTS idx_documents_created ON documents(created_at, id)";
    db << "PRAGMA user_version = " + std::to_string(kSchemaVersion) + ";";
  } catch (const sqlite::sqlite_exception& e) {
    throw make_storage_error("create schema", e);
  }
}

}  // namespace ragkit_core
