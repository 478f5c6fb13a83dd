#pragma once

#include <sqlite3.h>

#include <memory>
#include <string>

namespace fieldlink::db::sqlite {

struct StatementDeleter {
  void operator()(sqlite3_stmt* stmt) const {
    sqlite3_finalize(stmt);
  }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

/*
  Thin RAII wrapper around a read-only sqlite3*.

  Opened with SQLITE_OPEN_FULLMUTEX so the handle may be shared by
  concurrent lookups. `path` may be a filename or a "file:" URI.
*/
class SqliteDB {
 public:
  explicit SqliteDB(const std::string& path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  // Execute a SQL string (used for pragmas and probes)
  void Exec(const std::string& sql);

  // Prepare a statement, finalized when the returned handle is dropped
  Statement Prepare(const std::string& sql);

  // Read-only PRAGMAs and a schema probe that fails on non-database files.
  void Configure();

 private:
  sqlite3* db_ = nullptr;
};

} // namespace fieldlink::db::sqlite
