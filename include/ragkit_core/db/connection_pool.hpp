#pragma once

#include <sqlite_modern_cpp.h>

#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>

namespace ragkit_core {

using DbHandle = std::unique_ptr<sqlite::database>;

/**
 * @brief Fixed set of keyed SQLCipher connections shared by the stores.
 *
 * Every connection is opened and key-checked up front, so a wrong key
 * surfaces from the constructor as StorageError(NotADatabase) rather than
 * from the first query.
 */
class ConnectionPool {
 public:
  ConnectionPool(const std::string& db_path,
                 const std::string& db_key,
                 int pool_size,
                 std::chrono::milliseconds acquire_timeout);

  // Waits up to the acquire timeout, then throws PoolTimeoutError.
  DbHandle acquire();
  void release(DbHandle conn);

  // Drops idle connections and wakes every waiter with StorageError.
  void close();
  bool is_closed() const;

  size_t idle_count() const;
  size_t capacity() const {
    return capacity_;
  }

 private:
  const std::string db_path_;
  const std::string db_key_;
  const std::chrono::milliseconds acquire_timeout_;
  size_t capacity_ = 0;
  bool closed_ = false;

  std::deque<DbHandle> idle_;
  mutable std::mutex mutex_;
  std::condition_variable available_cv_;
};

// Opens one connection, applies the key, then turns on foreign keys and WAL.
DbHandle open_keyed_connection(const std::string& db_path, const std::string& db_key);

}  // namespace ragkit_core
