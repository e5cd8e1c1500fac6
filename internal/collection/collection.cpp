#include "collection.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace tracksync::collection {

using observability::StringField;

Collection::Collection(std::string url, Capabilities capabilities)
    : url_(std::move(url)), capabilities_(capabilities) {
}

Collection::~Collection() {
  for (auto& record : records_) {
    record->Detach();
  }
}

std::string Collection::Identifier(const std::string& identity) const {
  return url_ + "/" + identity;
}

record::DecoupleScope Collection::Decouple() {
  return record::DecoupleScope(decoupled_, true);
}

// ------------------------------------------------------------------
// Records
// ------------------------------------------------------------------

void Collection::EnsureListed() {
  if (!listed_) {
    Scan();
  }
}

const std::vector<RecordPtr>& Collection::Records() {
  EnsureListed();
  return records_;
}

std::size_t Collection::Size() {
  return Records().size();
}

void Collection::Scan() {
  if (!capabilities_.list) {
    throw util::UnsupportedOperation(url_ + ": listing is not supported");
  }

  std::vector<RecordPtr> listed;
  {
    auto scope = Decouple();
    listed     = LoadHeaders();
  }

  std::vector<RecordPtr> merged;
  merged.reserve(listed.size());
  for (auto& fresh : listed) {
    auto existing = std::find_if(records_.begin(), records_.end(),
                                 [&](const RecordPtr& r) { return r->Identity() == fresh->Identity(); });
    if (existing != records_.end()) {
      merged.push_back(*existing);
      records_.erase(existing);
    } else {
      merged.push_back(std::move(fresh));
    }
  }

  // whatever is left vanished from storage
  for (auto& gone : records_) {
    gone->Detach();
    gone->identity_.reset();
  }

  records_ = std::move(merged);
  listed_  = true;

  if (match_) {
    std::vector<RecordPtr> kept;
    for (auto& record : records_) {
      if (Matches(*record)) {
        kept.push_back(record);
      } else {
        record->Detach();
        record->identity_.reset();
      }
    }
    records_ = std::move(kept);
  }
  TRACKSYNC_LOG_DEBUG("scanned collection", {StringField("collection", url_),
                                             observability::IntField("records", static_cast<std::int64_t>(records_.size()))});
}

RecordPtr Collection::Find(const std::string& identity) {
  for (const auto& record : Records()) {
    if (record->Identity() == identity) {
      return record;
    }
  }
  throw util::NotFound(Identifier(identity));
}

RecordPtr Collection::Add(const RecordPtr& record) {
  if (!capabilities_.write_full) {
    throw util::UnsupportedOperation(url_ + ": writing is not supported");
  }
  if (record->host_ == this) {
    throw util::ValidationError(record->Identifier() + " is already in " + url_);
  }
  // the first save must happen now, an open batch would postpone it
  if (record->InBatch()) {
    throw util::ValidationError("cannot add " + record->Identifier() + " from inside its own batch");
  }
  EnsureListed();
  CheckMatch(*record, "add");

  RecordPtr target = record->host_ ? record->Clone() : record;
  target->host_    = this;
  target->identity_.reset();
  target->loaded_  = true;
  target->dirty_   = {record::RecordField::kGpx};
  records_.push_back(target);

  try {
    target->Flush();
  } catch (const std::exception&) {
    records_.pop_back();
    target->Detach();
    target->identity_.reset();
    throw;
  }

  TRACKSYNC_LOG_INFO("added record", {StringField("record", Identifier(*target->identity_))});
  return target;
}

void Collection::Remove(Record& record) {
  if (record.host_ != this) {
    throw util::ValidationError("record is not in " + url_);
  }
  if (!capabilities_.remove) {
    throw util::UnsupportedOperation(url_ + ": removing is not supported");
  }
  if (record.identity_) {
    auto scope = Decouple();
    RemoveIdentity(*record.identity_);
    TRACKSYNC_LOG_INFO("removed record", {StringField("record", Identifier(*record.identity_))});
  }
  // keeps the record alive while it is detached
  RecordPtr hosted;
  auto      it = std::find_if(records_.begin(), records_.end(), [&](const RecordPtr& r) { return r.get() == &record; });
  if (it != records_.end()) {
    hosted = *it;
    records_.erase(it);
  }
  record.Detach();
  record.identity_.reset();
}

std::vector<RecordPtr> Collection::Split(const RecordPtr& hosted) {
  // own copy: hosted may refer into records_, which Remove edits
  const RecordPtr record = hosted;
  if (record->host_ != this) {
    throw util::ValidationError("record is not in " + url_);
  }
  const auto segments = record->Geo().Segments();
  if (segments.size() < 2) {
    return {record};
  }

  std::vector<RecordPtr> parts;
  for (const auto& segment : segments) {
    auto part = record->Clone();
    part->ChangeGeo([&](geo::GeoSequence& geo) { geo.MutableSegments() = std::vector<geo::Segment>{segment}; });
    parts.push_back(std::move(part));
  }

  const auto name = record->Identifier();
  Remove(*record);

  std::vector<RecordPtr> added;
  try {
    for (const auto& part : parts) {
      added.push_back(Add(part));
    }
  } catch (const std::exception& e) {
    TRACKSYNC_LOG_ERROR("split failed, restoring record", {StringField("record", name), StringField("error", e.what())});
    for (const auto& part : added) {
      Remove(*part);
    }
    Add(record);
    throw;
  }

  TRACKSYNC_LOG_INFO("split record", {StringField("record", name),
                                      observability::IntField("parts", static_cast<std::int64_t>(added.size()))});
  return added;
}

void Collection::RemoveAll() {
  auto records = Records();
  for (auto& record : records) {
    Remove(*record);
  }
}

// ------------------------------------------------------------------
// Match filter
// ------------------------------------------------------------------

void Collection::SetMatch(MatchFilter match) {
  match_ = std::move(match);
  if (capabilities_.list) {
    Scan();
  }
}

bool Collection::Matches(Record& record) const {
  return !match_ || !match_(record).has_value();
}

void Collection::CheckMatch(Record& record, std::string_view operation) const {
  if (!match_) {
    return;
  }
  if (auto reason = match_(record)) {
    throw util::NoMatch(std::string(operation) + ": " + record.Identifier() + " does not match: " + *reason);
  }
}

// ------------------------------------------------------------------
// Calls from Record
// ------------------------------------------------------------------

void Collection::Load(Record& record) {
  if (!capabilities_.read_full) {
    throw util::UnsupportedOperation(url_ + ": reading is not supported");
  }
  auto scope = Decouple();
  ReadFull(record);
}

void Collection::Save(Record& record) {
  if (!capabilities_.write_full) {
    throw util::UnsupportedOperation(url_ + ": writing is not supported");
  }
  CheckMatch(record, "write");
  auto scope       = Decouple();
  auto identity    = WriteFull(record);
  record.identity_ = std::move(identity);
}

void Collection::SaveField(Record& record, record::RecordField field) {
  CheckMatch(record, "write");
  auto scope = Decouple();
  WriteField(record, field);
}

void Collection::Rename(Record& record, const std::string& new_identity) {
  if (!capabilities_.rename) {
    throw util::UnsupportedOperation(url_ + ": renaming is not supported");
  }
  const auto old_identity = *record.identity_;
  auto       scope        = Decouple();
  record.identity_        = ChangeIdentity(record, new_identity);
  TRACKSYNC_LOG_INFO("renamed record", {StringField("collection", url_), StringField("from", old_identity),
                                        StringField("to", *record.identity_)});
}

// ------------------------------------------------------------------
// Default hooks
// ------------------------------------------------------------------

void Collection::WriteField(Record&, record::RecordField field) {
  throw util::UnsupportedOperation(url_ + ": no writer for " + std::string(record::FieldName(field)));
}

void Collection::RemoveIdentity(const std::string&) {
  throw util::UnsupportedOperation(url_ + ": removing is not supported");
}

std::string Collection::ChangeIdentity(Record&, const std::string&) {
  throw util::UnsupportedOperation(url_ + ": renaming is not supported");
}

// ------------------------------------------------------------------
// Helpers
// ------------------------------------------------------------------

RecordPtr Collection::NewHeaderRecord(const std::string& identity, record::Header header) {
  auto record       = std::make_shared<Record>();
  record->host_     = this;
  record->identity_ = identity;
  record->header_   = std::move(header);
  record->loaded_   = false;
  return record;
}

void Collection::Populate(Record& record, const gpx::GpxDocument& document) {
  record.SetTitle(document.title);
  record.SetDescription(document.description);
  record.SetRawKeywords(document.keywords);
  record.SetGeo(document.geo);
}

gpx::GpxDocument Collection::Snapshot(const Record& record) {
  gpx::GpxDocument document;
  document.title       = record.title_;
  document.description = record.description_;
  document.keywords    = record.raw_keywords_;
  document.geo         = record.geo_;
  return document;
}

std::string Collection::EncodedKeywords(const Record& record) {
  return codec::Encode(record.attributes_);
}

} // namespace tracksync::collection
