#pragma once

#include <sqlite_modern_cpp.h>

namespace docsearch_core {

// Rolls back on destruction unless commit() was reached.
class Transaction {
 public:
  enum class Mode { Deferred, Immediate };

  // Immediate takes the write lock at BEGIN.
  explicit Transaction(sqlite::database& db, Mode mode = Mode::Deferred)
      : db_(db), open_(true) {
    db_ << (mode == Mode::Immediate ? "BEGIN IMMEDIATE;" : "BEGIN;");
  }

  Transaction(const Transaction&) = delete;
  Transaction& operator=(const Transaction&) = delete;

  void commit() {
    if (open_) {
      db_ << "COMMIT;";
      open_ = false;
    }
  }

  bool is_open() const { return open_; }

  ~Transaction() noexcept {
    if (!open_) {
      return;
    }
    try {
      db_ << "ROLLBACK;";
    } catch (const sqlite::sqlite_exception&) {
      // A failed statement may already have ended the transaction.
    }
  }

 private:
  sqlite::database& db_;
  bool open_;
};

}  // namespace docsearch_core
