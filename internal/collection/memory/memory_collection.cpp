#include "memory_collection.hpp"

#include "internal/util/errors.hpp"

namespace tracksync::collection::memory {

MemoryCollection::MemoryCollection(const std::string& name)
    : Collection("memory:" + name, DeclaredCapabilities()) {
}

Capabilities MemoryCollection::DeclaredCapabilities() {
  Capabilities caps;
  caps.list       = true;
  caps.read_full  = true;
  caps.write_full = true;
  caps.remove     = true;
  caps.rename     = true;
  return caps;
}

std::string MemoryCollection::Unique(const std::string& wanted) const {
  if (!snapshots_.contains(wanted)) {
    return wanted;
  }
  for (int n = 1;; ++n) {
    auto candidate = wanted + "." + std::to_string(n);
    if (!snapshots_.contains(candidate)) {
      return candidate;
    }
  }
}

std::vector<RecordPtr> MemoryCollection::LoadHeaders() {
  std::vector<RecordPtr> result;
  for (const auto& [identity, snapshot] : snapshots_) {
    record::Header header;
    header.title = snapshot.title;
    header.time  = snapshot.geo.FirstTime();
    result.push_back(NewHeaderRecord(identity, std::move(header)));
  }
  return result;
}

void MemoryCollection::ReadFull(Record& record) {
  auto it = snapshots_.find(record.Identity().value_or(""));
  if (it == snapshots_.end()) {
    throw util::NotFound(Identifier(record.Identity().value_or("")));
  }
  Populate(record, it->second);
}

std::string MemoryCollection::WriteFull(Record& record) {
  std::string identity;
  if (record.Identity() && snapshots_.contains(*record.Identity())) {
    identity = *record.Identity();
  } else {
    identity = Unique(std::to_string(next_id_++));
  }
  snapshots_[identity] = Snapshot(record);
  return identity;
}

void MemoryCollection::RemoveIdentity(const std::string& identity) {
  if (snapshots_.erase(identity) == 0) {
    throw util::NotFound(Identifier(identity));
  }
}

std::string MemoryCollection::ChangeIdentity(Record& record, const std::string& new_identity) {
  auto it = snapshots_.find(record.Identity().value_or(""));
  if (it == snapshots_.end()) {
    throw util::NotFound(Identifier(record.Identity().value_or("")));
  }
  auto unique = Unique(new_identity);
  auto node   = snapshots_.extract(it);
  node.key()  = unique;
  snapshots_.insert(std::move(node));
  return unique;
}

} // namespace tracksync::collection::memory
