#include "ragkit_core/db/connection_pool.hpp"

#include <sqlite3.h>

#include "ragkit_core/db/sqlite_error_utils.hpp"
#include "ragkit_core/db/storage_error.hpp"

namespace ragkit_core {

DbHandle open_keyed_connection(const std::string& db_path, const std::string& db_key) {
  try {
    auto db = std::make_unique<sqlite::database>(db_path);
    sqlite3* native = db->connection().get();
    if (native == nullptr) {
      throw StorageError("No native handle for " + db_path, DbErrorKind::CantOpen);
    }
    if (sqlite3_key(native, db_key.data(), static_cast<int>(db_key.size())) != SQLITE_OK) {
      throw StorageError("sqlite3_key failed for " + db_path + ": " + sqlite3_errmsg(native),
                         DbErrorKind::NotADatabase);
    }

    // The key is only checked when a page is read.
    *db << "SELECT count(*) FROM sqlite_master;";
    *db << "PRAGMA foreign_keys = ON;";
    *db << "PRAGMA journal_mode = WAL;";
    *db << "PRAGMA busy_timeout = 5000;";
    return db;
  } catch (const sqlite::sqlite_exception& e) {
    throw make_storage_error("open " + db_path, e);
  }
}

ConnectionPool::ConnectionPool(const std::string& db_path,
                               const std::string& db_key,
                               int pool_size,
                               std::chrono::milliseconds acquire_timeout)
    : db_path_(db_path), db_key_(db_key), acquire_timeout_(acquire_timeout) {
  if (pool_size <= 0) {
    throw StorageError("pool_size must be positive, got " + std::to_string(pool_size));
  }
  capacity_ = static_cast<size_t>(pool_size);
  for (size_t i = 0; i < capacity_; ++i) {
    idle_.push_back(open_keyed_connection(db_path_, db_key_));
  }
}

DbHandle ConnectionPool::acquire() {
  std::unique_lock<std::mutex> lock(mutex_);
  if (!available_cv_.wait_for(lock, acquire_timeout_,
                              [this] { return closed_ || !idle_.empty(); })) {
    throw PoolTimeoutError("No database connection free after " +
                           std::to_string(acquire_timeout_.count()) + "ms");
  }
  if (closed_) {
    throw StorageError("Connection pool for " + db_path_ + " is closed");
  }
  DbHandle conn = std::move(idle_.front());
  idle_.pop_front();
  return conn;
}

void ConnectionPool::release(DbHandle conn) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_ || !conn) {
      return;
    }
    idle_.push_back(std::move(conn));
  }
  available_cv_.notify_one();
}

void ConnectionPool::close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    idle_.clear();
  }
  available_cv_.notify_all();
}

bool ConnectionPool::is_closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

size_t ConnectionPool::idle_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return idle_.size();
}

}  // namespace ragkit_core
