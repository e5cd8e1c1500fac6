#include "sqlite_collection.hpp"

#include "internal/db/sqlite/sqlite_tx.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace tracksync::collection::sqlite {

using db::sqlite::SqliteDB;
using db::sqlite::SqliteTransaction;

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static void BindOptionalText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
  if (s) {
    BindText(st, idx, *s);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

static std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

static std::optional<std::string> ColOptionalText(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) {
    return std::nullopt;
  }
  return ColText(st, col);
}

SqliteCollection::SqliteCollection(std::shared_ptr<SqliteDB> db)
    : Collection("sqlite:" + db->Path(), DeclaredCapabilities()), db_(std::move(db)) {
  Bootstrap(*db_);
}

Capabilities SqliteCollection::DeclaredCapabilities() {
  Capabilities caps;
  caps.list              = true;
  caps.read_full         = true;
  caps.write_full        = true;
  caps.remove            = true;
  caps.rename            = true;
  caps.write_title       = true;
  caps.write_description = true;
  caps.write_category    = true;
  caps.write_visibility  = true;
  caps.write_tags        = true;
  caps.write_cross_ids   = true;
  return caps;
}

void SqliteCollection::Bootstrap(SqliteDB& db) {
  db.Exec("CREATE TABLE IF NOT EXISTS tracks (id TEXT PRIMARY KEY, title TEXT NOT NULL, description TEXT NOT NULL, "
          "keywords TEXT NOT NULL, first_time TEXT, gpx TEXT NOT NULL);");
  db.Exec("SELECT id,title,description,keywords,first_time,gpx FROM tracks LIMIT 1;");
}

// ------------------------------------------------------------------
// Hooks
// ------------------------------------------------------------------

std::vector<RecordPtr> SqliteCollection::LoadHeaders() {
  auto st = db_->Prepare("SELECT id,title,description,keywords,first_time FROM tracks ORDER BY id;");

  std::vector<RecordPtr> result;
  int                    rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    record::Header header;
    header.title       = ColText(st.get(), 1);
    header.description = ColText(st.get(), 2);
    try {
      auto attributes  = codec::Decode(ColText(st.get(), 3));
      header.category  = attributes.category;
      header.is_public = attributes.is_public;
      if (auto first = ColOptionalText(st.get(), 4)) {
        header.time = util::FromRfc3339(*first);
      }
    } catch (const util::ValidationError& e) {
      throw util::StorageError(Identifier(ColText(st.get(), 0)) + ": " + e.what());
    }
    result.push_back(NewHeaderRecord(ColText(st.get(), 0), std::move(header)));
  }
  if (rc != SQLITE_DONE) {
    throw util::StorageError(std::string("list tracks: ") + sqlite3_errmsg(db_->Handle()));
  }
  return result;
}

void SqliteCollection::ReadFull(Record& record) {
  const auto identity = record.Identity().value_or("");
  auto       st       = db_->Prepare("SELECT title,description,keywords,gpx FROM tracks WHERE id=?;");
  BindText(st.get(), 1, identity);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) {
    throw util::NotFound(Identifier(identity));
  }
  if (rc != SQLITE_ROW) {
    throw util::StorageError(std::string("read track: ") + sqlite3_errmsg(db_->Handle()));
  }

  auto document        = gpx::Parse(ColText(st.get(), 3));
  document.title       = ColText(st.get(), 0);
  document.description = ColText(st.get(), 1);
  document.keywords    = ColText(st.get(), 2);
  Populate(record, document);
}

std::string SqliteCollection::WriteFull(Record& record) {
  const auto identity = record.Identity() ? *record.Identity() : util::NewIdentity();
  const auto document = Snapshot(record);

  std::optional<std::string> first_time;
  if (auto first = document.geo.FirstTime()) {
    first_time = util::ToRfc3339(*first);
  }

  SqliteTransaction tx(*db_, "write track " + identity);
  auto              st = db_->Prepare(
      "INSERT INTO tracks(id,title,description,keywords,first_time,gpx) VALUES(?,?,?,?,?,?) "
      "ON CONFLICT(id) DO UPDATE SET title=excluded.title,description=excluded.description,"
      "keywords=excluded.keywords,first_time=excluded.first_time,gpx=excluded.gpx;");
  BindText(st.get(), 1, identity);
  BindText(st.get(), 2, document.title);
  BindText(st.get(), 3, document.description);
  BindText(st.get(), 4, document.keywords);
  BindOptionalText(st.get(), 5, first_time);
  BindText(st.get(), 6, gpx::Serialize(document));
  db_->Run(st.get(), "write track");
  st.reset();
  tx.Commit();

  return identity;
}

void SqliteCollection::WriteField(Record& record, record::RecordField field) {
  const auto identity = record.Identity().value_or("");
  switch (field) {
    case record::RecordField::kTitle:
      UpdateColumn(identity, "title", record.Title());
      break;
    case record::RecordField::kDescription:
      UpdateColumn(identity, "description", record.Description());
      break;
    case record::RecordField::kCategory:
    case record::RecordField::kVisibility:
    case record::RecordField::kTags:
    case record::RecordField::kCrossIds:
      UpdateColumn(identity, "keywords", EncodedKeywords(record));
      break;
    case record::RecordField::kGpx:
      Collection::WriteField(record, field);
      break;
  }
  TRACKSYNC_LOG_DEBUG("wrote field", {observability::StringField("record", Identifier(identity)),
                                      observability::StringField("field", record::FieldName(field))});
}

void SqliteCollection::UpdateColumn(const std::string& identity, const char* column, const std::string& value) {
  auto st = db_->Prepare(std::string("UPDATE tracks SET ") + column + "=? WHERE id=?;");
  BindText(st.get(), 1, value);
  BindText(st.get(), 2, identity);
  db_->Run(st.get(), "update track");
  if (db_->Changes() == 0) {
    throw util::NotFound(Identifier(identity));
  }
}

void SqliteCollection::RemoveIdentity(const std::string& identity) {
  auto st = db_->Prepare("DELETE FROM tracks WHERE id=?;");
  BindText(st.get(), 1, identity);
  db_->Run(st.get(), "remove track");
  if (db_->Changes() == 0) {
    throw util::NotFound(Identifier(identity));
  }
}

std::string SqliteCollection::ChangeIdentity(Record& record, const std::string& new_identity) {
  auto st = db_->Prepare("UPDATE tracks SET id=? WHERE id=?;");
  BindText(st.get(), 1, new_identity);
  BindText(st.get(), 2, record.Identity().value_or(""));
  db_->Run(st.get(), "rename track");
  if (db_->Changes() == 0) {
    throw util::NotFound(Identifier(record.Identity().value_or("")));
  }
  return new_identity;
}

} // namespace tracksync::collection::sqlite
