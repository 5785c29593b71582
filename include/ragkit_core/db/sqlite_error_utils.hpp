#pragma once

#include <sqlite3.h>
#include <sqlite_modern_cpp.h>

#include <string>

#include "ragkit_core/db/storage_error.hpp"

namespace ragkit_core {

inline DbErrorKind classify_sqlite_code(int primary_code) {
  switch (primary_code) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return DbErrorKind::BusyOrLocked;
    case SQLITE_CONSTRAINT:
      return DbErrorKind::Constraint;
    case SQLITE_READONLY:
      return DbErrorKind::Readonly;
    case SQLITE_IOERR:
      return DbErrorKind::Io;
    case SQLITE_CANTOPEN:
      return DbErrorKind::CantOpen;
    case SQLITE_FULL:
      return DbErrorKind::Full;
    case SQLITE_ERROR:
    case SQLITE_SCHEMA:
      return DbErrorKind::Schema;
    // SQLCipher reports a wrong key this way.
    case SQLITE_NOTADB:
      return DbErrorKind::NotADatabase;
    default:
      return DbErrorKind::Generic;
  }
}

inline std::string to_string(DbErrorKind kind) {
  switch (kind) {
    case DbErrorKind::BusyOrLocked: return "busy_or_locked";
    case DbErrorKind::Constraint: return "constraint";
    case DbErrorKind::Readonly: return "readonly";
    case DbErrorKind::Io: return "io";
    case DbErrorKind::CantOpen: return "cantopen";
    case DbErrorKind::Full: return "full";
    case DbErrorKind::Schema: return "schema";
    case DbErrorKind::NotADatabase: return "notadb";
    default: return "generic";
  }
}

/**
 * @brief Translates a sqlite_modern_cpp exception into a classified StorageError.
 *
 * Message layout: "<operation> failed: (<kind>) <sqlite message> [code=.., xcode=..]",
 * with the failing statement appended when sqlite_modern_cpp recorded one.
 */
inline StorageError make_storage_error(const std::string& operation,
                                       const sqlite::sqlite_exception& e) {
  const DbErrorKind kind = classify_sqlite_code(e.get_code());
  std::string message = operation + " failed: (" + to_string(kind) + ") " + e.what();
  if (!e.get_sql().empty()) {
    message += " while running \"" + e.get_sql() + "\"";
  }
  message += " [code=" + std::to_string(e.get_code()) +
             ", xcode=" + std::to_string(e.get_extended_code()) + "]";
  return StorageError(message, kind);
}

}  // namespace ragkit_core
