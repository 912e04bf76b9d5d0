#pragma once

#include <sqlite3.h>
#include <sqlite_modern_cpp.h>

#include <string>

namespace ragline_core {

// Coarse grouping of SQLite result codes as seen by the index store.
enum class StorageFailure { Locked, Foreign, Io, Unavailable, Other };

inline StorageFailure classify_storage_failure(int primary_code) {
  switch (primary_code) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return StorageFailure::Locked;
    case SQLITE_NOTADB:
    case SQLITE_CORRUPT:
    case SQLITE_SCHEMA:
    case SQLITE_ERROR:
      return StorageFailure::Foreign;
    case SQLITE_IOERR:
    case SQLITE_FULL:
    case SQLITE_READONLY:
      return StorageFailure::Io;
    case SQLITE_CANTOPEN:
    case SQLITE_PERM:
      return StorageFailure::Unavailable;
    default:
      return StorageFailure::Other;
  }
}

inline const char* to_string(StorageFailure failure) {
  switch (failure) {
    case StorageFailure::Locked: return "locked";
    case StorageFailure::Foreign: return "foreign";
    case StorageFailure::Io: return "io";
    case StorageFailure::Unavailable: return "unavailable";
    default: return "other";
  }
}

// True when the file exists but is not something we wrote, e.g. a missing table or a non-SQLite file.
inline bool is_foreign_file(const sqlite::sqlite_exception& e) {
  return classify_storage_failure(e.get_code()) == StorageFailure::Foreign;
}

inline std::string describe_storage_error(const std::string& operation,
                                          const sqlite::sqlite_exception& e) {
  return operation + " failed (" + to_string(classify_storage_failure(e.get_code())) +
         ", sqlite " + std::to_string(e.get_extended_code()) + "): " + e.what();
}

}  // namespace ragline_core
