#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>

#include "ragkit_core/db/connection_pool.hpp"

namespace ragkit_core {

// PRAGMA user_version written into every database this build creates.
inline constexpr int kSchemaVersion = 1;

/**
 * @class DatabaseManager
 * @brief Creates the documents/chunks schema and owns the connection pool for one file.
 *
 * Built in main (or a test fixture) and passed by reference to DocumentStore.
 */
class DatabaseManager {
 public:
  DatabaseManager() = default;
  ~DatabaseManager();

  DatabaseManager(const DatabaseManager&) = delete;
  DatabaseManager& operator=(const DatabaseManager&) = delete;

  /**
   * Creates parent directories and the schema, then opens the pool.
   * A second call on an initialized manager does nothing.
   * @throw StorageError on a wrong key, an unwritable path, or a database
   *        whose user_version is newer than kSchemaVersion.
   */
  void initialize(const std::filesystem::path& db_path,
                  const std::string& db_key,
                  int pool_size,
                  std::chrono::milliseconds acquire_timeout = std::chrono::milliseconds(5000));

  // Used through PooledConnection.
  DbHandle acquire();
  void release(DbHandle conn);

  // Closes the pool but keeps it, so threads still holding or waiting for a
  // connection get StorageError instead of a dangling pool. Not reversible.
  void shutdown();

  bool is_initialized() const {
    return pool_ != nullptr && !pool_->is_closed();
  }

 private:
  static void create_schema(sqlite::database& db);

  std::unique_ptr<ConnectionPool> pool_;
};

}  // namespace ragkit_core
