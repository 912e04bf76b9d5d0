#pragma once

#include <sqlite_modern_cpp.h>

#include <iostream>

namespace ragline_core {

// Scoped write transaction. Rolls back unless commit() was reached.
class WriteTransaction {
 public:
  explicit WriteTransaction(sqlite::database& db) : db_(db) { db_ << "BEGIN IMMEDIATE;"; }

  WriteTransaction(const WriteTransaction&) = delete;
  WriteTransaction& operator=(const WriteTransaction&) = delete;

  void commit() {
    if (!committed_) {
      db_ << "COMMIT;";
      committed_ = true;
    }
  }

  ~WriteTransaction() noexcept {
    if (committed_) {
      return;
    }
    try {
      db_ << "ROLLBACK;";
    } catch (const sqlite::sqlite_exception& e) {
      std::cerr << "Warning: rollback of index write failed: " << e.what() << std::endl;
    }
  }

 private:
  sqlite::database& db_;
  bool committed_ = false;
};

}  // namespace ragline_core
