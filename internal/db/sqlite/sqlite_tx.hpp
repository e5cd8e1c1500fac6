#pragma once

#include <string>

#include "sqlite_db.hpp"

namespace tracksync::db::sqlite {

/*
  Write scope for one collection operation.

  Takes the write lock up front (BEGIN IMMEDIATE). Anything not committed
  is rolled back when the scope ends; `what` names the operation in the
  log line.
*/
class SqliteTransaction final {
 public:
  SqliteTransaction(SqliteDB& db, std::string what);
  ~SqliteTransaction();

  SqliteTransaction(const SqliteTransaction&)            = delete;
  SqliteTransaction& operator=(const SqliteTransaction&) = delete;

  void Commit();

 private:
  SqliteDB&   db_;
  std::string what_;
  bool        committed_ = false;
};

} // namespace tracksync::db::sqlite
