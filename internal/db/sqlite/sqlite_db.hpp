#pragma once

#include <sqlite3.h>

#include <memory>
#include <string>

namespace tracksync::db::sqlite {

struct StatementDeleter {
  void operator()(sqlite3_stmt* stmt) const {
    sqlite3_finalize(stmt);
  }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

/*
  Thin RAII wrapper around sqlite3*.

  Every failure surfaces as util::StorageError carrying sqlite's message.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  // Prepared statement, finalized when the handle goes away
  Statement Prepare(const std::string& sql);

  // Steps a statement that returns no rows
  void Run(sqlite3_stmt* stmt, const char* what);

  // Rows touched by the last statement
  int Changes() const;

  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
};

} // namespace tracksync::db::sqlite
