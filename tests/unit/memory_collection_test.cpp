#include "internal/collection/memory/memory_collection.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using tracksync::collection::memory::MemoryCollection;
using tracksync::record::Record;
using tracksync::record::RecordPtr;

const tracksync::util::TimePoint kStart = tracksync::util::FromRfc3339("2024-05-01T06:00:00Z");

RecordPtr MakeRecord(const std::string& title) {
  auto record = std::make_shared<Record>();
  record->BatchChanges([&] {
    record->SetTitle(title);
    record->SetCategory("Running");
    record->SetTags({"morning"});
    tracksync::geo::Point point;
    point.latitude  = 51.0;
    point.longitude = 7.0;
    point.time      = kStart;
    record->AddPoints({point});
  });
  return record;
}

void TestIdentitiesComeFromCounter() {
  MemoryCollection collection("counter");
  auto             a = collection.Add(MakeRecord("a"));
  auto             b = collection.Add(MakeRecord("b"));

  assert(a->Identity() == std::string("1"));
  assert(b->Identity() == std::string("2"));
  assert(collection.Url() == "memory:counter");
  assert(collection.Size() == 2);
}

void TestScanKeepsObjectsAndListsHeaders() {
  MemoryCollection collection("scan");
  auto             added = collection.Add(MakeRecord("kept"));

  collection.Scan();
  auto listed = collection.Find(*added->Identity());
  assert(listed == added);
  assert(listed->IsLoaded());
}

void TestCopiesAreIndependent() {
  MemoryCollection first("first");
  MemoryCollection second("second");

  auto original = first.Add(MakeRecord("shared"));
  auto copy     = second.Add(original);

  copy->SetTitle("changed copy");
  copy->AddTags({"evening"});
  assert(original->Title() == "shared");
  assert(original->Tags() == std::vector<std::string>{"morning"});
  assert(copy->Category() == "Running");
  assert(copy->FirstTime() == kStart);
}

void TestRenameAndRemove() {
  MemoryCollection collection("rename");
  auto             record = collection.Add(MakeRecord("ride"));

  record->SetIdentity(std::string("sunday"));
  assert(collection.Find("sunday") == record);

  collection.RemoveAll();
  assert(collection.Size() == 0);
  assert(record->Host() == nullptr);
}

void TestSupportedCapabilities() {
  const auto caps = MemoryCollection::DeclaredCapabilities();
  assert(caps.list && caps.read_full && caps.write_full && caps.remove && caps.rename);
  assert(!caps.write_title);
}

RecordPtr MakeRecordAt(const std::string& title, tracksync::util::TimePoint time) {
  auto record = MakeRecord(title);
  record->AdjustTime(time - kStart);
  return record;
}

void TestMatchFilterHidesAndRejects() {
  using namespace std::chrono_literals;
  MemoryCollection collection("match");
  collection.Add(MakeRecordAt("early", kStart));
  auto later = collection.Add(MakeRecordAt("later", kStart + 48h));
  collection.Add(MakeRecordAt("latest", kStart + 72h));
  assert(collection.Size() == 3);

  const auto cutoff = kStart + 24h;
  collection.SetMatch([cutoff](Record& record) -> std::optional<std::string> {
    const auto first = record.FirstTime();
    if (!first || *first < cutoff) {
      return std::string("starts before the cutoff");
    }
    return std::nullopt;
  });
  assert(collection.Size() == 2);
  bool hidden = false;
  try {
    collection.Find("1");
  } catch (const tracksync::util::NotFound&) {
    hidden = true;
  }
  assert(hidden);
  assert(collection.Find("2") == later);

  bool threw = false;
  try {
    collection.Add(MakeRecordAt("too early", kStart));
  } catch (const tracksync::util::NoMatch&) {
    threw = true;
  }
  assert(threw);
  assert(collection.Size() == 2);

  threw = false;
  try {
    later->AdjustTime(-48h);
  } catch (const tracksync::util::NoMatch&) {
    threw = true;
  }
  assert(threw);
  assert(later->FirstTime() == kStart);
  assert(!later->Dirty().empty());
  assert(!collection.Matches(*later));

  collection.SetMatch(nullptr);
  assert(collection.Size() == 3);
}

void TestSplitBySegment() {
  MemoryCollection collection("split");
  auto             record = collection.Add(MakeRecord("two parts"));

  tracksync::geo::Point second;
  second.latitude  = 51.5;
  second.longitude = 7.5;
  second.time      = kStart + std::chrono::hours(1);
  auto third       = second;
  third.latitude   = 51.6;
  third.time       = kStart + std::chrono::hours(2);
  record->ChangeGeo([&](tracksync::geo::GeoSequence& geo) { geo.MutableSegments().push_back({second, third}); });
  assert(record->Geo().Segments().size() == 2);

  auto parts = collection.Split(record);
  assert(parts.size() == 2);
  assert(record->Host() == nullptr);
  assert(collection.Size() == 2);
  assert(parts[0]->PointCount() == 1);
  assert(parts[1]->PointCount() == 2);
  assert(parts[0]->Title() == "two parts");
  assert(parts[1]->Tags() == std::vector<std::string>{"morning"});
  assert(parts[1]->FirstTime() == second.time);

  auto whole = collection.Split(parts[0]);
  assert(whole.size() == 1);
  assert(whole[0] == parts[0]);
  assert(collection.Size() == 2);
}

} // namespace

int main() {
  TestIdentitiesComeFromCounter();
  TestScanKeepsObjectsAndListsHeaders();
  TestCopiesAreIndependent();
  TestRenameAndRemove();
  TestSupportedCapabilities();
  TestMatchFilterHidesAndRejects();
  TestSplitBySegment();

  std::cout << "tracksync_unit_memory_collection: pass\n";
  return 0;
}
