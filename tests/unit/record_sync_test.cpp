#include <algorithm>
#include <cassert>
#include <chrono>
#include <iostream>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/collection/collection.hpp"
#include "internal/record/record.hpp"
#include "internal/util/errors.hpp"

namespace {

using tracksync::collection::Capabilities;
using tracksync::collection::Collection;
using tracksync::gpx::GpxDocument;
using tracksync::record::Record;
using tracksync::record::RecordField;
using tracksync::record::RecordPtr;

/*
  Keeps documents in a map and counts every call the records make.
*/
class CountingCollection final : public Collection {
 public:
  explicit CountingCollection(Capabilities capabilities = FullOnly())
      : Collection("counting:test", capabilities) {
  }

  static Capabilities FullOnly() {
    Capabilities caps;
    caps.list       = true;
    caps.read_full  = true;
    caps.write_full = true;
    caps.remove     = true;
    return caps;
  }

  static Capabilities WithTitleWriter() {
    auto caps              = FullOnly();
    caps.write_title       = true;
    caps.write_description = true;
    return caps;
  }

  void Seed(const std::string& identity, GpxDocument document) {
    stored_[identity] = std::move(document);
  }

  const GpxDocument& Stored(const std::string& identity) const {
    return stored_.at(identity);
  }

  int                      reads       = 0;
  int                      full_writes = 0;
  std::vector<RecordField> field_writes;
  bool                     fail_writes = false;

  // full writes to let through before exactly one fails, -1 for never
  int fail_full_after = -1;

 protected:
  std::vector<RecordPtr> LoadHeaders() override {
    std::vector<RecordPtr> result;
    for (const auto& [identity, document] : stored_) {
      tracksync::record::Header header;
      header.title = document.title;
      result.push_back(NewHeaderRecord(identity, std::move(header)));
    }
    return result;
  }

  void ReadFull(Record& record) override {
    ++reads;
    Populate(record, stored_.at(*record.Identity()));
  }

  std::string WriteFull(Record& record) override {
    if (fail_full_after == 0) {
      fail_full_after = -1;
      throw tracksync::util::StorageError("counting collection is full");
    }
    if (fail_full_after > 0) {
      --fail_full_after;
    }
    if (fail_writes) {
      throw tracksync::util::StorageError("counting collection refuses to write");
    }
    ++full_writes;
    auto identity     = record.Identity() ? *record.Identity() : "r" + std::to_string(next_++);
    stored_[identity] = Snapshot(record);
    return identity;
  }

  void WriteField(Record& record, RecordField field) override {
    if (fail_writes) {
      throw tracksync::util::StorageError("counting collection refuses to write");
    }
    field_writes.push_back(field);
    stored_[*record.Identity()] = Snapshot(record);
  }

  void RemoveIdentity(const std::string& identity) override {
    stored_.erase(identity);
  }

 private:
  std::map<std::string, GpxDocument> stored_;
  int                                next_ = 1;
};

GpxDocument MakeDocument(const std::string& title) {
  GpxDocument document;
  document.title    = title;
  document.keywords = "river, Category:Hiking, Status:private";
  tracksync::geo::Point point;
  point.latitude  = 52.5;
  point.longitude = 13.4;
  document.geo.AddPoints({point});
  return document;
}

RecordPtr AddedRecord(CountingCollection& collection) {
  auto record = std::make_shared<Record>();
  record->SetTitle("first");
  return collection.Add(record);
}

void TestLoadFullIsIdempotent() {
  CountingCollection collection;
  collection.Seed("a", MakeDocument("seeded"));

  auto record = collection.Find("a");
  assert(!record->IsLoaded());

  record->LoadFull();
  record->LoadFull();
  assert(collection.reads == 1);
  assert(record->IsLoaded());
  assert(record->Category() == "Hiking");
  assert(collection.reads == 1);
}

void TestHeaderValuesNeedNoLoad() {
  CountingCollection collection;
  collection.Seed("a", MakeDocument("seeded"));

  auto record = collection.Find("a");
  assert(record->Title() == "seeded");
  assert(collection.reads == 0);

  assert(record->Tags() == std::vector<std::string>{"river"});
  assert(collection.reads == 1);
}

void TestSetterWritesBeforeReturning() {
  CountingCollection collection;
  auto               record = AddedRecord(collection);
  assert(collection.full_writes == 1);
  assert(record->Identity() == std::string("r1"));

  record->SetTitle("second");
  assert(collection.full_writes == 2);
  assert(record->Dirty().empty());
  assert(collection.Stored("r1").title == "second");

  // unchanged value, nothing to write
  record->SetTitle("second");
  assert(collection.full_writes == 2);
}

void TestBatchWritesOnce() {
  CountingCollection collection;
  auto               record = AddedRecord(collection);

  record->BatchChanges([&] {
    record->SetTitle("batched");
    record->SetDescription("one write");
    record->SetCategory("Running");
    record->SetPublic(true);
    record->SetTags({"park"});
    record->BatchChanges([&] { record->AddTags({"loop"}); });
    assert(collection.full_writes == 1);
    assert(!record->Dirty().empty());
  });

  assert(collection.full_writes == 2);
  assert(record->Dirty().empty());
  assert(collection.Stored("r1").keywords == "loop, park, Category:Running, Status:public");
}

void TestFieldWritersAvoidFullWrites() {
  CountingCollection collection(CountingCollection::WithTitleWriter());
  auto               record = AddedRecord(collection);

  record->SetTitle("by field");
  assert(collection.full_writes == 1);
  assert(collection.field_writes == std::vector<RecordField>{RecordField::kTitle});

  // a field without writer forces one full write for the whole batch
  record->BatchChanges([&] {
    record->SetDescription("by field too");
    record->SetCategory("Running");
  });
  assert(collection.full_writes == 2);
  assert(collection.field_writes.size() == 1);
}

void TestFailedWriteStaysDirtyAndRetries() {
  CountingCollection collection;
  auto               record = AddedRecord(collection);

  collection.fail_writes = true;
  bool threw             = false;
  try {
    record->SetTitle("lost?");
  } catch (const tracksync::util::StorageError&) {
    threw = true;
  }
  assert(threw);
  assert(!record->Dirty().empty());
  assert(collection.Stored("r1").title == "first");

  collection.fail_writes = false;
  record->SetDescription("retry");
  assert(record->Dirty().empty());
  assert(collection.Stored("r1").title == "lost?");
  assert(collection.Stored("r1").description == "retry");
}

void TestBatchFailureStillFlushes() {
  CountingCollection collection;
  auto               record = AddedRecord(collection);

  bool threw = false;
  try {
    record->BatchChanges([&] {
      record->SetTitle("kept");
      throw std::runtime_error("caller gave up");
    });
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()) == "caller gave up";
  }
  assert(threw);
  assert(!record->InBatch());
  assert(collection.Stored("r1").title == "kept");
}

void TestDecoupledSettersStayInMemory() {
  CountingCollection collection;
  auto               record = AddedRecord(collection);
  {
    auto scope = collection.Decouple();
    record->SetTitle("quiet");
    assert(record->Dirty().empty());
  }
  assert(!collection.Decoupled());
  assert(collection.full_writes == 1);
  assert(collection.Stored("r1").title == "first");
}

void TestValidationLeavesStateUntouched() {
  CountingCollection collection;
  auto               record = AddedRecord(collection);

  bool threw = false;
  try {
    record->SetCategory("Teleporting");
  } catch (const tracksync::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
  assert(record->Category() == tracksync::codec::DefaultCategory());

  threw = false;
  try {
    record->SetTags({"ok", "not,ok"});
  } catch (const tracksync::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
  assert(record->Tags().empty());
  assert(collection.full_writes == 1);
}

void TestUnattachedRecordNeverTurnsDirty() {
  Record record;
  record.SetTitle("alone");
  record.SetPublic(true);
  assert(record.Dirty().empty());
  assert(record.Identifier() == "unsaved: \"alone\"");
}

void TestRemoveTagsTrims() {
  Record record;
  record.SetTags({"coast", "windy"});
  record.RemoveTags({" coast ", "unknown"});
  assert((record.Tags() == std::vector<std::string>{"windy"}));
}

void TestImplausibleCyclingSpeed() {
  Record record;
  record.SetCategory("Cycling");

  // 0.02 degrees of latitude in one minute, about 133 km/h
  tracksync::geo::Point start;
  start.latitude  = 47.0;
  start.longitude = 8.0;
  start.time      = tracksync::util::FromRfc3339("2024-05-01T10:00:00Z");
  auto finish     = start;
  finish.latitude = 47.02;
  finish.time     = *start.time + std::chrono::minutes(1);
  record.AddPoints({start, finish});

  const auto warnings = record.Warnings();
  auto       mentions = [&](const std::string& text) {
    return std::any_of(warnings.begin(), warnings.end(),
                       [&](const std::string& w) { return w.find(text) != std::string::npos; });
  };
  assert(mentions("out of expected range 3..60"));
  assert(mentions("Moving speed"));
  assert(mentions("out of expected range 10..50"));

  Record slow;
  slow.SetCategory("Cycling");
  assert(slow.Warnings().empty());
}

void TestHeaderAnswersOutliveTheLoad() {
  CountingCollection collection;
  collection.Seed("h1", MakeDocument("served from the listing header"));
  auto record = collection.Records().front();

  const auto& title    = record->Title();
  const auto& category = record->Category();
  assert(collection.reads == 1);
  assert(title == "served from the listing header");
  assert(category == "Hiking");

  record->SetTitle(record->Title());
  assert(record->Dirty().empty());
  assert(collection.full_writes == 0);
}

void TestAddInsideOwnBatchIsRejected() {
  CountingCollection collection;
  auto               record = std::make_shared<Record>();

  bool threw = false;
  record->BatchChanges([&] {
    record->SetTitle("pending");
    try {
      collection.Add(record);
    } catch (const tracksync::util::ValidationError&) {
      threw = true;
    }
  });
  assert(threw);
  assert(record->Host() == nullptr);
  assert(collection.Size() == 0);
  assert(collection.full_writes == 0);
}

void TestFullWriteKeepsRawKeywords() {
  CountingCollection collection;
  collection.Seed("k1", MakeDocument("keywords"));
  auto record = collection.Records().front();
  record->LoadFull();
  assert(record->RawKeywords() == "river, Category:Hiking, Status:private");

  record->AddTags({"lake"});
  assert(collection.full_writes == 1);
  assert(collection.Stored("k1").keywords == "lake, river, Category:Hiking, Status:private");
  assert(record->RawKeywords() == "river, Category:Hiking, Status:private");
}

void TestChangeGeoRounds() {
  Record record;
  record.ChangeGeo([](tracksync::geo::GeoSequence& geo) {
    tracksync::geo::Point point;
    point.latitude  = 52.12345678;
    point.longitude = 13.98765432;
    geo.MutableSegments().push_back({point});
  });
  const auto points = record.Geo().Points();
  assert(points.size() == 1);
  assert(points[0].latitude == tracksync::geo::RoundTo(52.12345678, tracksync::geo::kPositionDigits));
  assert(points[0].longitude == tracksync::geo::RoundTo(13.98765432, tracksync::geo::kPositionDigits));
}

void TestFailedSplitRestoresRecord() {
  CountingCollection collection;
  auto               record = AddedRecord(collection);

  tracksync::geo::Point a;
  a.latitude  = 52.0;
  a.longitude = 13.0;
  auto b      = a;
  b.latitude  = 52.1;
  auto c      = b;
  c.latitude  = 52.2;
  record->ChangeGeo([&](tracksync::geo::GeoSequence& geo) {
    geo.MutableSegments() = {{a}, {b, c}};
  });

  collection.fail_full_after = 1;
  bool threw                 = false;
  try {
    collection.Split(record);
  } catch (const tracksync::util::StorageError&) {
    threw = true;
  }
  assert(threw);
  assert(collection.Size() == 1);
  assert(collection.Records().front() == record);
  assert(record->Host() == &collection);
  assert(record->Geo().Segments().size() == 2);
  assert(record->PointCount() == 3);
}

} // namespace

int main() {
  TestLoadFullIsIdempotent();
  TestHeaderValuesNeedNoLoad();
  TestSetterWritesBeforeReturning();
  TestBatchWritesOnce();
  TestFieldWritersAvoidFullWrites();
  TestFailedWriteStaysDirtyAndRetries();
  TestBatchFailureStillFlushes();
  TestDecoupledSettersStayInMemory();
  TestValidationLeavesStateUntouched();
  TestUnattachedRecordNeverTurnsDirty();
  TestRemoveTagsTrims();
  TestImplausibleCyclingSpeed();
  TestHeaderAnswersOutliveTheLoad();
  TestAddInsideOwnBatchIsRejected();
  TestFullWriteKeepsRawKeywords();
  TestChangeGeoRounds();
  TestFailedSplitRestoresRecord();

  std::cout << "tracksync_unit_record_sync: pass\n";
  return 0;
}
