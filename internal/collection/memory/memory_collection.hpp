#pragma once

#include <cstdint>
#include <map>
#include <string>

#include "internal/collection/collection.hpp"

namespace tracksync::collection::memory {

/*
  In-process collection.

  Keeps a GPX snapshot per identity; records never share state with the
  snapshots. Identities are a running counter, renames that collide get
  a ".N" suffix.
*/
class MemoryCollection final : public Collection {
 public:
  explicit MemoryCollection(const std::string& name = "default");

  static Capabilities DeclaredCapabilities();

 protected:
  std::vector<RecordPtr> LoadHeaders() override;
  void                   ReadFull(Record& record) override;
  std::string            WriteFull(Record& record) override;
  void                   RemoveIdentity(const std::string& identity) override;
  std::string            ChangeIdentity(Record& record, const std::string& new_identity) override;

 private:
  std::string Unique(const std::string& wanted) const;

  std::map<std::string, gpx::GpxDocument> snapshots_;
  std::uint64_t                           next_id_ = 1;
};

} // namespace tracksync::collection::memory
