#pragma once

#include <string>

namespace ragkit_core {

// Coarse class of the SQLite result code behind a storage failure.
enum class DbErrorKind {
  BusyOrLocked,
  Constraint,
  Readonly,
  Io,
  CantOpen,
  Full,
  Schema,
  NotADatabase,
  Generic
};

class StorageError : public std::exception {
 public:
  explicit StorageError(const std::string& message, DbErrorKind kind = DbErrorKind::Generic)
      : message_(message), kind_(kind) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }
  DbErrorKind kind() const {
    return kind_;
  }

 private:
  std::string message_;
  DbErrorKind kind_;
};

// No pooled connection became free within the acquire timeout.
class PoolTimeoutError : public StorageError {
 public:
  explicit PoolTimeoutError(const std::string& message)
      : StorageError(message, DbErrorKind::BusyOrLocked) {}
};

}  // namespace ragkit_core
