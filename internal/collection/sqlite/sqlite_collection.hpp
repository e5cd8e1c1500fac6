#pragma once

#include <memory>
#include <string>

#include "internal/collection/collection.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"

namespace tracksync::collection::sqlite {

/*
  Records as rows of one sqlite table:

    tracks(id, title, description, keywords, first_time, gpx)

  The title, description and keywords columns win over the copies in the
  gpx column, which lets single attributes be updated without rewriting
  the geometry. Identities are random UUIDs.
*/
class SqliteCollection final : public Collection {
 public:
  explicit SqliteCollection(std::shared_ptr<db::sqlite::SqliteDB> db);

  static Capabilities DeclaredCapabilities();

  // Creates the schema if missing.
  static void Bootstrap(db::sqlite::SqliteDB& db);

 protected:
  std::vector<RecordPtr> LoadHeaders() override;
  void                   ReadFull(Record& record) override;
  std::string            WriteFull(Record& record) override;
  void                   WriteField(Record& record, record::RecordField field) override;
  void                   RemoveIdentity(const std::string& identity) override;
  std::string            ChangeIdentity(Record& record, const std::string& new_identity) override;

 private:
  void UpdateColumn(const std::string& identity, const char* column, const std::string& value);

  std::shared_ptr<db::sqlite::SqliteDB> db_;
};

} // namespace tracksync::collection::sqlite
