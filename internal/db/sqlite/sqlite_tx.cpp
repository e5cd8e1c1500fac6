#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace tracksync::db::sqlite {

using observability::StringField;

SqliteTransaction::SqliteTransaction(SqliteDB& db, std::string what) : db_(db), what_(std::move(what)) {
  db_.Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (committed_) {
    return;
  }
  try {
    db_.Exec("ROLLBACK;");
    TRACKSYNC_LOG_WARN("sqlite write rolled back", {StringField("db", db_.Path()), StringField("op", what_)});
  } catch (const util::StorageError& e) {
    TRACKSYNC_LOG_ERROR("sqlite rollback failed", {StringField("op", what_), StringField("error", e.what())});
  }
}

void SqliteTransaction::Commit() {
  db_.Exec("COMMIT;");
  committed_ = true;
}

} // namespace tracksync::db::sqlite
