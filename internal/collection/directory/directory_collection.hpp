#pragma once

#include <filesystem>
#include <string>

#include "internal/collection/collection.hpp"

namespace tracksync::collection::directory {

/*
  One GPX file per record: <path>/<identity>.gpx

  New identities derive from the title ('/' becomes '_'), falling back
  to the start time. Names already taken get a ".N" suffix. Listing only
  parses the metadata header of each file.
*/
class DirectoryCollection final : public Collection {
 public:
  explicit DirectoryCollection(const std::filesystem::path& path);

  static Capabilities DeclaredCapabilities();

  const std::filesystem::path& Path() const {
    return path_;
  }

  std::filesystem::path FileFor(const std::string& identity) const;

 protected:
  std::vector<RecordPtr> LoadHeaders() override;
  void                   ReadFull(Record& record) override;
  std::string            WriteFull(Record& record) override;
  void                   RemoveIdentity(const std::string& identity) override;
  std::string            ChangeIdentity(Record& record, const std::string& new_identity) override;

 private:
  std::string Unique(const std::string& wanted) const;
  std::string NameFor(const gpx::GpxDocument& document) const;
  std::string ReadFile(const std::string& identity) const;
  void        WriteFile(const std::string& identity, const std::string& content) const;

  std::filesystem::path path_;
};

} // namespace tracksync::collection::directory
