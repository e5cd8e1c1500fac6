#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/collection/capabilities.hpp"
#include "internal/gpx/gpx_document.hpp"
#include "internal/record/record.hpp"
#include "internal/record/scoped_value.hpp"

namespace tracksync::collection {

using record::Record;
using record::RecordPtr;

// nullopt when the record is acceptable, otherwise the reason it is not
using MatchFilter = std::function<std::optional<std::string>(Record&)>;

/*
  Storage abstraction for records.

  The public operations are fixed here: they check the declared
  capabilities, keep the list of hosted records and the decoupled flag,
  and call the protected hooks below. Implementations only move data
  between a Record and their storage.

  Implementations:
    memory     → snapshots in process memory
    directory  → one .gpx file per record
    sqlite     → one row per record, field level writers
*/
class Collection {
 public:
  Collection(std::string url, Capabilities capabilities);
  virtual ~Collection();

  Collection(const Collection&)            = delete;
  Collection& operator=(const Collection&) = delete;

  // e.g. "memory:scratch" or "directory:/data/tracks"
  const std::string& Url() const {
    return url_;
  }

  // Full identifier of a record in this collection.
  std::string Identifier(const std::string& identity) const;

  const Capabilities& Supported() const {
    return capabilities_;
  }

  bool Decoupled() const {
    return decoupled_;
  }

  // While alive, record setters and loads do not reach the storage.
  record::DecoupleScope Decouple();

  // ------------------------------------------------------------------
  // Records
  // ------------------------------------------------------------------
  /*
    Hosted records, listed from storage on first use. Listing yields
    header-only records.
  */
  const std::vector<RecordPtr>& Records();
  std::size_t                   Size();

  // Re-lists storage. Records still present keep their objects.
  void Scan();

  // Throws NotFound.
  RecordPtr Find(const std::string& identity);

  /*
    Saves a record here. An unattached record becomes hosted by this
    collection; a record hosted elsewhere is cloned first. Returns the
    hosted record.
  */
  RecordPtr Add(const RecordPtr& record);

  // Removes from storage and detaches; the record loses its identity.
  void Remove(Record& record);

  // Records and storage both go away.
  void RemoveAll();

  /*
    Replaces record by one record per segment, each carrying all
    waypoints. A record with fewer than two segments is returned as is.
    If a part cannot be saved, the parts saved so far are removed, the
    original record is added back and the error is rethrown.
  */
  std::vector<RecordPtr> Split(const RecordPtr& record);

  // ------------------------------------------------------------------
  // Match filter
  // ------------------------------------------------------------------
  /*
    Records the filter rejects are left out of listings, and adding or
    writing a record the filter rejects throws NoMatch. A rejected
    write leaves the change in memory and the record dirty. Setting a
    filter re-lists storage; an empty filter accepts everything.
  */
  void SetMatch(MatchFilter match);

  bool Matches(Record& record) const;

 protected:
  // ------------------------------------------------------------------
  // Hooks
  // ------------------------------------------------------------------

  // Attached, header-only records for everything in storage.
  virtual std::vector<RecordPtr> LoadHeaders() = 0;

  // Fills every field of record. Called decoupled.
  virtual void ReadFull(Record& record) = 0;

  // Stores the whole record and returns its identity. Called decoupled.
  virtual std::string WriteFull(Record& record) = 0;

  // Stores one attribute. Only called for declared field writers.
  virtual void WriteField(Record& record, record::RecordField field);

  virtual void RemoveIdentity(const std::string& identity);

  // Moves record to new_identity and returns the identity it really got.
  virtual std::string ChangeIdentity(Record& record, const std::string& new_identity);

  // ------------------------------------------------------------------
  // Helpers for implementations
  // ------------------------------------------------------------------
  RecordPtr NewHeaderRecord(const std::string& identity, record::Header header);

  // Decoupled population of record from a parsed document.
  static void Populate(Record& record, const gpx::GpxDocument& document);

  // The document to persist. Keywords are the record's raw keyword string.
  static gpx::GpxDocument Snapshot(const Record& record);

  // Current typed attributes encoded, for field writers.
  static std::string EncodedKeywords(const Record& record);

 private:
  friend class record::Record;

  void Rename(Record& record, const std::string& new_identity);
  void Load(Record& record);
  void Save(Record& record);
  void SaveField(Record& record, record::RecordField field);
  void EnsureListed();
  void CheckMatch(Record& record, std::string_view operation) const;

  std::string            url_;
  Capabilities           capabilities_;
  bool                   decoupled_ = false;
  bool                   listed_    = false;
  std::vector<RecordPtr> records_;
  MatchFilter            match_;
};

using CollectionPtr = std::shared_ptr<Collection>;

} // namespace tracksync::collection
