#pragma once

#include <sqlite_modern_cpp.h>

#include <iostream>

namespace ragkit_core {

/**
 * Scoped write transaction for DocumentStore.
 *
 * A document row and its chunk rows are written under one Transaction so a
 * failure part way through leaves neither behind. Destruction without
 * commit() rolls back.
 */
class Transaction {
 public:
  enum class Mode { Deferred, Immediate };

  explicit Transaction(sqlite::database& db, Mode mode = Mode::Deferred) : db_(db) {
    db_ << (mode == Mode::Immediate ? "BEGIN IMMEDIATE;" : "BEGIN DEFERRED;");
    open_ = true;
  }

  Transaction(const Transaction&) = delete;
  Transaction& operator=(const Transaction&) = delete;

  ~Transaction() noexcept {
    if (!open_) {
      return;
    }
    try {
      db_ << "ROLLBACK;";
    } catch (const sqlite::sqlite_exception& e) {
      std::cerr << "DocumentStore: rollback failed (code " << e.get_code() << "): " << e.what()
                << std::endl;
    }
  }

  void commit() {
    if (!open_) {
      return;
    }
    db_ << "COMMIT;";
    open_ = false;
  }

  bool is_open() const {
    return open_;
  }

 private:
  sqlite::database& db_;
  bool open_ = false;
};

}  // namespace ragkit_core
