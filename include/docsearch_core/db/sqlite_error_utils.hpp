#pragma once

#include <string>
#include <sqlite3.h>
#include <sqlite_modern_cpp.h>

namespace docsearch_core {

// Short name for a primary result code, used in error messages.
inline const char* sqlite_error_kind(int primary_code) {
  switch (primary_code) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return "busy";
    case SQLITE_CONSTRAINT:
      return "constraint";
    case SQLITE_READONLY:
      return "readonly";
    case SQLITE_IOERR:
      return "io";
    case SQLITE_CANTOPEN:
      return "cantopen";
    case SQLITE_FULL:
      return "full";
    case SQLITE_NOTADB:
      return "not_a_database";
    case SQLITE_ERROR:
    case SQLITE_SCHEMA:
      return "sql";
    default:
      return "generic";
  }
}

// "<operation> failed: (<kind>) <message> [code=N, xcode=N]"
inline std::string format_db_error(const std::string& operation, const sqlite::sqlite_exception& e) {
  std::string msg = operation + " failed: (" + sqlite_error_kind(e.get_code()) + ") " + e.what();
  msg += " [code=" + std::to_string(e.get_code()) +
         ", xcode=" + std::to_string(e.get_extended_code()) + "]";
  return msg;
}

} // namespace docsearch_core
