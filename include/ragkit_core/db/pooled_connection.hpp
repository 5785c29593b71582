#pragma once

#include <sqlite_modern_cpp.h>

#include "ragkit_core/db/database_manager.hpp"

namespace ragkit_core {

// Holds one pooled connection for the enclosing scope.
class PooledConnection {
 public:
  explicit PooledConnection(DatabaseManager& manager)
      : manager_(manager), handle_(manager.acquire()) {}
  ~PooledConnection() {
    manager_.release(std::move(handle_));
  }

  PooledConnection(const PooledConnection&) = delete;
  PooledConnection& operator=(const PooledConnection&) = delete;

  sqlite::database& operator*() const {
    return *handle_;
  }
  sqlite::database* operator->() const {
    return handle_.get();
  }

 private:
  DatabaseManager& manager_;
  DbHandle handle_;
};

}  // namespace ragkit_core
