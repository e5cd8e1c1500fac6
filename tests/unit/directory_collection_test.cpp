#include "internal/collection/directory/directory_collection.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using namespace std::chrono_literals;
using tracksync::collection::directory::DirectoryCollection;
using tracksync::record::Record;
using tracksync::record::RecordPtr;

namespace fs = std::filesystem;

const tracksync::util::TimePoint kStart = tracksync::util::FromRfc3339("2024-01-01T07:56:00Z");

fs::path FreshDirectory(const std::string& test_name) {
  const auto dir = fs::temp_directory_path() / "tracksync_directory_collection_tests" / test_name;
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

RecordPtr MakeRecord(const std::string& title) {
  auto record = std::make_shared<Record>();
  record->BatchChanges([&] {
    record->SetTitle(title);
    record->SetDescription("by the lake");
    record->SetPublic(true);
    for (int i = 0; i < 3; ++i) {
      tracksync::geo::Point point;
      point.latitude  = 47.0 + 0.001 * i;
      point.longitude = 8.0;
      point.time      = kStart + std::chrono::minutes(i);
      record->AddPoints({point});
    }
  });
  return record;
}

void TestIdentityFollowsTitle() {
  const auto          dir = FreshDirectory("identity");
  DirectoryCollection collection(dir);

  auto first  = collection.Add(MakeRecord("Lake loop"));
  auto second = collection.Add(MakeRecord("Lake loop"));
  auto slash  = collection.Add(MakeRecord("up/down"));
  auto blank  = collection.Add(MakeRecord(""));

  assert(first->Identity() == std::string("Lake loop"));
  assert(second->Identity() == std::string("Lake loop.1"));
  assert(slash->Identity() == std::string("up_down"));
  assert(blank->Identity() == std::string("2024-01-01 07:56:00"));
  assert(fs::exists(dir / "Lake loop.gpx"));
  assert(first->Identifier() == collection.Url() + "/Lake loop");
}

void TestReopenListsHeaderOnlyRecords() {
  const auto dir = FreshDirectory("reopen");
  {
    DirectoryCollection collection(dir);
    auto                record = collection.Add(MakeRecord("Persisted"));
    record->SetTags({"swiss"});
  }

  DirectoryCollection reopened(dir);
  assert(reopened.Size() == 1);
  auto record = reopened.Find("Persisted");
  assert(!record->IsLoaded());
  assert(record->Title() == "Persisted");
  assert(record->IsPublic());
  assert(record->FirstTime() == kStart);
  assert(!record->IsLoaded());

  assert(record->PointCount() == 3);
  assert(record->IsLoaded());
  assert(record->Description() == "by the lake");
  assert(record->Tags() == std::vector<std::string>{"swiss"});
  assert(record->LastTime() == kStart + 2min);
}

void TestRenameMovesFile() {
  const auto          dir = FreshDirectory("rename");
  DirectoryCollection collection(dir);
  auto                record = collection.Add(MakeRecord("old name"));

  record->SetIdentity(std::string("new name"));
  assert(!fs::exists(dir / "old name.gpx"));
  assert(fs::exists(dir / "new name.gpx"));

  // the title is independent of the file name
  record->SetTitle("retitled");
  assert(record->Identity() == std::string("new name"));
}

void TestRemoveDeletesFile() {
  const auto          dir = FreshDirectory("remove");
  DirectoryCollection collection(dir);
  auto                record = collection.Add(MakeRecord("short lived"));

  record->Remove();
  assert(!fs::exists(dir / "short lived.gpx"));
  assert(collection.Size() == 0);
}

void TestScanDropsVanishedFiles() {
  const auto          dir = FreshDirectory("vanished");
  DirectoryCollection collection(dir);
  auto                record = collection.Add(MakeRecord("deleted outside"));

  fs::remove(dir / "deleted outside.gpx");
  collection.Scan();
  assert(collection.Size() == 0);
  assert(record->Host() == nullptr);
  assert(!record->Identity());
}

void TestBrokenFileIsStorageError() {
  const auto dir = FreshDirectory("broken");
  {
    std::ofstream out(dir / "broken.gpx");
    out << "<gpx><metadata>";
  }

  DirectoryCollection collection(dir);
  bool                threw = false;
  try {
    (void)collection.Size();
  } catch (const tracksync::util::StorageError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestIdentityFollowsTitle();
  TestReopenListsHeaderOnlyRecords();
  TestRenameMovesFile();
  TestRemoveDeletesFile();
  TestScanDropsVanishedFiles();
  TestBrokenFileIsStorageError();

  std::cout << "tracksync_unit_directory_collection: pass\n";
  return 0;
}
