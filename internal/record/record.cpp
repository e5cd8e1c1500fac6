#include "record.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <set>
#include <utility>

#include "internal/collection/collection.hpp"
#include "internal/observability/logging.hpp"
#include "internal/record/scoped_value.hpp"
#include "internal/util/errors.hpp"

namespace tracksync::record {

using observability::IntField;
using observability::StringField;

namespace {

std::string Lower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return std::tolower(c); });
  return text;
}

std::string FormatSpeed(double value) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.3f", value);
  return buf;
}

void CheckRange(std::vector<std::string>& warnings, const char* what, double value, double low, double high) {
  if (value < low || value > high) {
    warnings.push_back(std::string(what) + " " + FormatSpeed(value) + " is out of expected range " +
                       std::to_string(static_cast<int>(low)) + ".." + std::to_string(static_cast<int>(high)));
  }
}

} // namespace

Record::Record() = default;

Record::Record(geo::GeoSequence geo) : geo_(std::move(geo)) {
  geo_.RoundPoints();
}

Record::~Record() {
  InvalidateSimilarities();
}

bool Record::Decoupled() const {
  return host_ != nullptr && host_->Decoupled();
}

// ------------------------------------------------------------------
// Hosting
// ------------------------------------------------------------------

void Record::SetIdentity(const std::optional<std::string>& identity) {
  if (!host_ && identity) {
    throw util::IllegalIdentityChange("cannot give identity " + *identity + " to a record without collection");
  }
  if (identity == identity_) {
    return;
  }
  if (!identity) {
    throw util::IllegalIdentityChange("cannot clear identity " + *identity_ + " of a hosted record");
  }
  if (identity->empty() || identity->find('/') != std::string::npos) {
    throw util::ValidationError("illegal identity: \"" + *identity + "\"");
  }
  if (Decoupled() || !identity_) {
    identity_ = identity;
    return;
  }
  host_->Rename(*this, *identity);
}

std::string Record::Identifier() {
  if (host_ && identity_) {
    return host_->Identifier(*identity_);
  }
  return "unsaved: \"" + Title() + "\"";
}

void Record::LoadFull() {
  if (loaded_ || !host_ || !identity_ || Decoupled()) {
    return;
  }
  host_->Load(*this);
  loaded_ = true;
  header_ = Header{};
  TRACKSYNC_LOG_DEBUG("loaded record", {StringField("record", host_->Identifier(*identity_))});
}

void Record::Remove() {
  if (!host_) {
    throw util::UnsupportedOperation("record is not in a collection");
  }
  host_->Remove(*this);
}

RecordPtr Record::Clone() {
  LoadFull();
  auto copy          = std::make_shared<Record>();
  copy->title_       = title_;
  copy->description_ = description_;
  copy->attributes_  = attributes_;
  copy->geo_         = geo_;
  if (host_ && identity_) {
    std::vector<std::string> ids{host_->Identifier(*identity_)};
    ids.insert(ids.end(), attributes_.cross_ids.begin(), attributes_.cross_ids.end());
    copy->attributes_.cross_ids = codec::CleanCrossIds(ids);
  }
  copy->raw_keywords_ = codec::Encode(copy->attributes_);
  return copy;
}

void Record::Detach() {
  host_ = nullptr;
  dirty_.clear();
}

// ------------------------------------------------------------------
// Metadata
// ------------------------------------------------------------------

std::string Record::Title() {
  if (!loaded_ && header_.title) {
    return *header_.title;
  }
  LoadFull();
  return title_;
}

std::string Record::Description() {
  if (!loaded_ && header_.description) {
    return *header_.description;
  }
  LoadFull();
  return description_;
}

std::string Record::Category() {
  if (!loaded_ && header_.category) {
    return *header_.category;
  }
  LoadFull();
  return attributes_.category;
}

bool Record::IsPublic() {
  if (!loaded_ && header_.is_public) {
    return *header_.is_public;
  }
  LoadFull();
  return attributes_.is_public;
}

const std::vector<std::string>& Record::Tags() {
  LoadFull();
  return attributes_.tags;
}

const std::vector<std::string>& Record::CrossIds() {
  LoadFull();
  return attributes_.cross_ids;
}

void Record::SetTitle(const std::string& title) {
  PrepareChange();
  if (title == title_) {
    return;
  }
  title_ = title;
  Changed(RecordField::kTitle);
}

void Record::SetDescription(const std::string& description) {
  PrepareChange();
  if (description == description_) {
    return;
  }
  description_ = description;
  Changed(RecordField::kDescription);
}

void Record::SetCategory(const std::string& category) {
  if (!codec::IsCategory(category)) {
    throw util::ValidationError("illegal category: " + category);
  }
  PrepareChange();
  if (category == attributes_.category) {
    return;
  }
  attributes_.category = category;
  Changed(RecordField::kCategory);
}

void Record::SetPublic(bool is_public) {
  PrepareChange();
  if (is_public == attributes_.is_public) {
    return;
  }
  attributes_.is_public = is_public;
  Changed(RecordField::kVisibility);
}

void Record::SetTags(const std::vector<std::string>& tags) {
  auto normalized = codec::NormalizeTags(tags);
  PrepareChange();
  if (normalized == attributes_.tags) {
    return;
  }
  attributes_.tags = std::move(normalized);
  Changed(RecordField::kTags);
}

void Record::AddTags(const std::vector<std::string>& tags) {
  std::vector<std::string> checked;
  for (const auto& tag : tags) {
    checked.push_back(codec::CheckTag(tag));
  }
  PrepareChange();

  std::set<std::string> merged(attributes_.tags.begin(), attributes_.tags.end());
  merged.insert(checked.begin(), checked.end());
  if (merged.size() == attributes_.tags.size()) {
    return;
  }
  attributes_.tags.assign(merged.begin(), merged.end());
  Changed(RecordField::kTags);
}

void Record::RemoveTags(const std::vector<std::string>& tags) {
  PrepareChange();
  auto& current = attributes_.tags;
  auto  before  = current.size();
  for (const auto& tag : tags) {
    current.erase(std::remove(current.begin(), current.end(), codec::Trim(tag)), current.end());
  }
  if (current.size() != before) {
    Changed(RecordField::kTags);
  }
}

void Record::SetCrossIds(const std::vector<std::string>& cross_ids) {
  codec::CheckCrossIds(cross_ids);
  PrepareChange();
  if (cross_ids == attributes_.cross_ids) {
    return;
  }
  attributes_.cross_ids = cross_ids;
  Changed(RecordField::kCrossIds);
}

void Record::SetRawKeywords(const std::string& raw) {
  auto decoded = codec::Decode(raw);
  PrepareChange();
  raw_keywords_ = raw;

  BatchChanges([&] {
    if (decoded.category != attributes_.category) {
      attributes_.category = decoded.category;
      Changed(RecordField::kCategory);
    }
    if (decoded.is_public != attributes_.is_public) {
      attributes_.is_public = decoded.is_public;
      Changed(RecordField::kVisibility);
    }
    if (decoded.tags != attributes_.tags) {
      attributes_.tags = decoded.tags;
      Changed(RecordField::kTags);
    }
    if (decoded.cross_ids != attributes_.cross_ids) {
      attributes_.cross_ids = decoded.cross_ids;
      Changed(RecordField::kCrossIds);
    }
  });
}

// ------------------------------------------------------------------
// Geometry
// ------------------------------------------------------------------

const geo::GeoSequence& Record::Geo() {
  LoadFull();
  return geo_;
}

void Record::SetGeo(geo::GeoSequence geo) {
  PrepareChange();
  geo_ = std::move(geo);
  geo_.RoundPoints();
  GeometryChanged();
}

void Record::AddPoints(const std::vector<geo::Point>& points) {
  if (points.empty()) {
    return;
  }
  PrepareChange();
  geo_.AddPoints(points);
  GeometryChanged();
}

void Record::AddWaypoint(geo::Waypoint waypoint) {
  PrepareChange();
  geo_.AddWaypoint(std::move(waypoint));
  GeometryChanged();
}

void Record::AdjustTime(util::Duration delta) {
  PrepareChange();
  geo_.AdjustTime(delta);
  GeometryChanged();
}

std::optional<util::TimePoint> Record::FirstTime() {
  if (!loaded_ && header_.time) {
    return header_.time;
  }
  LoadFull();
  return geo_.FirstTime();
}

std::optional<util::TimePoint> Record::LastTime() {
  LoadFull();
  return geo_.LastTime();
}

double Record::Distance() {
  if (!loaded_ && header_.distance) {
    return *header_.distance;
  }
  LoadFull();
  return geo_.Distance();
}

std::optional<double> Record::Speed() {
  LoadFull();
  return geo_.Speed();
}

std::optional<double> Record::MovingSpeed() {
  LoadFull();
  return geo_.MovingSpeed();
}

std::size_t Record::PointCount() {
  LoadFull();
  return geo_.PointCount();
}

std::uint64_t Record::PointsHash() {
  LoadFull();
  return geo_.PointsHash();
}

RecordKey Record::Key() {
  LoadFull();
  RecordKey key;
  key.title       = title_;
  key.description = description_;
  for (const auto& tag : attributes_.tags) {
    key.tags.push_back(Lower(tag));
  }
  std::sort(key.tags.begin(), key.tags.end());
  key.category    = attributes_.category;
  key.is_public   = attributes_.is_public;
  key.last_time   = geo_.LastTime();
  key.angle       = geo_.Angle();
  key.point_count = geo_.PointCount();
  key.points_hash = geo_.PointsHash();
  return key;
}

std::vector<std::string> Record::Warnings() {
  std::vector<std::string> result;
  auto                     speed  = Speed();
  auto                     moving = MovingSpeed();
  if (!speed || !moving) {
    return result;
  }
  if (*speed > *moving) {
    result.push_back("Speed " + FormatSpeed(*speed) + " must not be above Moving speed " + FormatSpeed(*moving));
  }
  if (attributes_.category == "Cycling") {
    CheckRange(result, "Speed", *speed, 3, 60);
    CheckRange(result, "Moving speed", *moving, 10, 50);
  } else if (attributes_.category == "Mountain biking") {
    CheckRange(result, "Speed", *speed, 3, 50);
    CheckRange(result, "Moving speed", *moving, 10, 40);
  }
  return result;
}

// ------------------------------------------------------------------
// Write-back
// ------------------------------------------------------------------

void Record::PrepareChange() {
  if (!Decoupled()) {
    LoadFull();
  }
}

void Record::Changed(RecordField field) {
  switch (field) {
    case RecordField::kTitle:
      header_.title.reset();
      break;
    case RecordField::kDescription:
      header_.description.reset();
      break;
    case RecordField::kCategory:
      header_.category.reset();
      break;
    case RecordField::kVisibility:
      header_.is_public.reset();
      break;
    default:
      break;
  }

  if (!host_ || Decoupled()) {
    return;
  }
  if (std::find(dirty_.begin(), dirty_.end(), field) == dirty_.end()) {
    dirty_.push_back(field);
  }
  if (batch_depth_ == 0) {
    Flush();
  }
}

void Record::GeometryChanged() {
  header_.time.reset();
  header_.distance.reset();
  InvalidateSimilarities();
  Changed(RecordField::kGpx);
}

bool Record::NeedsFullWrite() const {
  return std::any_of(dirty_.begin(), dirty_.end(),
                     [this](RecordField field) { return !host_->Supported().WritesField(field); });
}

void Record::Flush() {
  if (!host_) {
    dirty_.clear();
    return;
  }
  if (dirty_.empty() || batch_depth_ > 0 || Decoupled()) {
    return;
  }

  auto* host  = host_;
  auto  scope = host->Decouple();

  if (NeedsFullWrite()) {
    TRACKSYNC_LOG_DEBUG("full write-back", {StringField("collection", host->Url()),
                                            IntField("dirty", static_cast<std::int64_t>(dirty_.size()))});
    {
      ScopedValue<std::string> encoded(raw_keywords_, codec::Encode(attributes_));
      host->Save(*this);
    }
    dirty_.clear();
    return;
  }

  while (!dirty_.empty()) {
    host->SaveField(*this, dirty_.front());
    dirty_.erase(dirty_.begin());
  }
}

void Record::FlushAfterFailure() {
  try {
    Flush();
  } catch (const std::exception& e) {
    TRACKSYNC_LOG_ERROR("write-back after failed batch failed",
                        {StringField("error", e.what()), IntField("dirty", static_cast<std::int64_t>(dirty_.size()))});
  }
}

// ------------------------------------------------------------------
// Similarity cache
// ------------------------------------------------------------------

std::optional<double> Record::CachedSimilarity(const Record& other) const {
  auto it = similarities_.find(const_cast<Record*>(&other));
  if (it == similarities_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void Record::CacheSimilarity(Record& other, double value) {
  similarities_[&other] = value;
  other.similarities_[this] = value;
}

void Record::InvalidateSimilarities() {
  for (auto& [other, value] : similarities_) {
    if (other != this) {
      other->similarities_.erase(this);
    }
  }
  similarities_.clear();
}

// ------------------------------------------------------------------
// Groups
// ------------------------------------------------------------------

std::vector<std::vector<RecordPtr>> OverlappingTimes(const std::vector<RecordPtr>& records) {
  std::vector<std::pair<util::TimePoint, RecordPtr>> timed;
  for (const auto& record : records) {
    if (auto first = record->FirstTime()) {
      timed.emplace_back(*first, record);
    }
  }
  std::stable_sort(timed.begin(), timed.end(), [](const auto& a, const auto& b) { return a.first < b.first; });

  std::vector<std::vector<RecordPtr>> groups;
  std::vector<RecordPtr>              group;
  for (std::size_t i = 0; i < timed.size(); ++i) {
    const auto& current = timed[i].second;
    std::optional<util::TimePoint> previous_end;
    if (i > 0) {
      previous_end = timed[i - 1].second->LastTime();
    }
    if (previous_end && timed[i].first <= *previous_end) {
      const auto& previous = timed[i - 1].second;
      if (std::find(group.begin(), group.end(), previous) == group.end()) {
        group.push_back(previous);
      }
      group.push_back(current);
    } else if (!group.empty()) {
      groups.push_back(std::move(group));
      group.clear();
    }
  }
  if (!group.empty()) {
    groups.push_back(std::move(group));
  }

  TRACKSYNC_LOG_DEBUG("grouped overlapping records", {IntField("records", static_cast<std::int64_t>(records.size())),
                                                      IntField("groups", static_cast<std::int64_t>(groups.size()))});
  return groups;
}

} // namespace tracksync::record
