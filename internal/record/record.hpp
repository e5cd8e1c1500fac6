#pragma once

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/codec/attribute_codec.hpp"
#include "internal/geo/geo_sequence.hpp"
#include "internal/record/record_field.hpp"

namespace tracksync::collection {
class Collection;
}

namespace tracksync::record {

/*
  Values a listing can deliver without reading the whole record.
  Cleared by the first full load.
*/
struct Header {
  std::optional<std::string>     title;
  std::optional<std::string>     description;
  std::optional<std::string>     category;
  std::optional<bool>            is_public;
  std::optional<util::TimePoint> time;
  std::optional<double>          distance;
};

// What the diff engine compares to call two records identical.
struct RecordKey {
  std::string                    title;
  std::string                    description;
  std::vector<std::string>       tags;
  std::string                    category;
  bool                           is_public = false;
  std::optional<util::TimePoint> last_time;
  double                         angle       = 0.0;
  std::size_t                    point_count = 0;
  std::uint64_t                  points_hash = 0;

  bool operator==(const RecordKey&) const = default;
};

class Record;
using RecordPtr = std::shared_ptr<Record>;

/*
  Record

  One track: geometry plus metadata, optionally hosted by a Collection.

  States:
    unattached   no host, everything lives in memory
    header-only  hosted, only listing values known
    full         hosted, everything loaded

  Reading a value that is not in the header cache loads the record from
  its host; those getters are not const and may perform I/O.

  Every setter on a hosted record writes back before it returns, unless
  a BatchChanges scope is open. While the host is decoupled (it is
  populating or writing this record) setters only touch memory.

  Records are shared through RecordPtr and never copied; Clone() gives
  an independent unattached copy.
*/
class Record {
 public:
  Record();
  explicit Record(geo::GeoSequence geo);
  ~Record();

  Record(const Record&)            = delete;
  Record& operator=(const Record&) = delete;

  // ------------------------------------------------------------------
  // Hosting
  // ------------------------------------------------------------------
  collection::Collection* Host() const {
    return host_;
  }

  const std::optional<std::string>& Identity() const {
    return identity_;
  }

  /*
    On a hosted record with an identity this renames it in the host.
    On first save or while decoupled it only assigns.
    Throws IllegalIdentityChange for unattached records and for clearing.
  */
  void SetIdentity(const std::optional<std::string>& identity);

  // "<collection url>/<identity>" or unsaved: "<title>"
  std::string Identifier();

  bool IsLoaded() const {
    return loaded_;
  }

  bool Decoupled() const;

  const std::vector<RecordField>& Dirty() const {
    return dirty_;
  }

  bool InBatch() const {
    return batch_depth_ > 0;
  }

  const Header& CachedHeader() const {
    return header_;
  }

  // No-op when loaded, unattached, unidentified or decoupled.
  void LoadFull();

  // Removes the record from its host. Throws UnsupportedOperation when unattached.
  void Remove();

  RecordPtr Clone();

  // ------------------------------------------------------------------
  // Metadata (getters may load)
  // ------------------------------------------------------------------
  // By value: they may answer from the header cache, which a load discards.
  std::string                     Title();
  std::string                     Description();
  std::string                     Category();
  bool                            IsPublic();
  const std::vector<std::string>& Tags();
  const std::vector<std::string>& CrossIds();

  void SetTitle(const std::string& title);
  void SetDescription(const std::string& description);
  void SetCategory(const std::string& category);
  void SetPublic(bool is_public);
  void SetTags(const std::vector<std::string>& tags);
  void AddTags(const std::vector<std::string>& tags);
  void RemoveTags(const std::vector<std::string>& tags);
  void SetCrossIds(const std::vector<std::string>& cross_ids);

  /*
    Keyword string as last read from the host. A full write encodes the
    current attributes into it for the duration of the write only.
  */
  const std::string& RawKeywords() const {
    return raw_keywords_;
  }

  // Replaces category, visibility, cross ids and tags from an encoded string.
  void SetRawKeywords(const std::string& raw);

  // ------------------------------------------------------------------
  // Geometry (getters may load)
  // ------------------------------------------------------------------
  const geo::GeoSequence& Geo();

  void SetGeo(geo::GeoSequence geo);
  void AddPoints(const std::vector<geo::Point>& points);
  void AddWaypoint(geo::Waypoint waypoint);
  void AdjustTime(util::Duration delta);

  // In-place geometry edit; positions are rounded and the geometry marked dirty afterwards.
  template <typename Fn>
  void ChangeGeo(Fn&& fn) {
    PrepareChange();
    fn(geo_);
    geo_.RoundPoints();
    GeometryChanged();
  }

  std::optional<util::TimePoint> FirstTime();
  std::optional<util::TimePoint> LastTime();
  double                         Distance();
  std::optional<double>          Speed();
  std::optional<double>          MovingSpeed();
  std::size_t                    PointCount();
  std::uint64_t                  PointsHash();
  RecordKey                      Key();

  // Implausible speed values for the category.
  std::vector<std::string> Warnings();

  // ------------------------------------------------------------------
  // Batch
  // ------------------------------------------------------------------
  /*
    Runs fn with write-back deferred and flushes once afterwards.
    Nested scopes flush only when the outermost one ends. If fn throws,
    the flush is still attempted; a flush failure at that point is
    logged and the exception from fn is rethrown.
  */
  template <typename Fn>
  void BatchChanges(Fn&& fn) {
    ++batch_depth_;
    try {
      fn();
    } catch (...) {
      --batch_depth_;
      if (batch_depth_ == 0) {
        FlushAfterFailure();
      }
      throw;
    }
    --batch_depth_;
    if (batch_depth_ == 0) {
      Flush();
    }
  }

  // Writes pending changes. Called automatically; public for retries.
  void Flush();

  // ------------------------------------------------------------------
  // Similarity cache, maintained by similarity::Similarity
  // ------------------------------------------------------------------
  std::optional<double> CachedSimilarity(const Record& other) const;
  void                  CacheSimilarity(Record& other, double value);

 private:
  friend class collection::Collection;

  void PrepareChange();
  void Changed(RecordField field);
  void GeometryChanged();
  void InvalidateSimilarities();
  bool NeedsFullWrite() const;
  void FlushAfterFailure();
  void Detach();

  collection::Collection*    host_ = nullptr;
  std::optional<std::string> identity_;
  Header                     header_;
  bool                       loaded_      = true;
  int                        batch_depth_ = 0;
  std::vector<RecordField>   dirty_;

  std::string       title_;
  std::string       description_;
  codec::Attributes attributes_;
  std::string       raw_keywords_;
  geo::GeoSequence  geo_;

  std::unordered_map<Record*, double> similarities_;
};

/*
  Groups of records whose time spans overlap, ordered by start time.
  A record joins the current group when it starts no later than the
  previous record ends. Records without times are left out.
*/
std::vector<std::vector<RecordPtr>> OverlappingTimes(const std::vector<RecordPtr>& records);

} // namespace tracksync::record
