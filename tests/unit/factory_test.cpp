#include "internal/factory.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using tracksync::runtime::config::RuntimeConfig;

std::filesystem::path TempDir(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / "tracksync_factory_tests" / name;
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

void TestBuildsEveryBackend() {
  const auto dir = TempDir("every_backend");

  RuntimeConfig config;
  config.mutable_logging()->set_level("warn");

  auto* scratch = config.add_collections();
  scratch->set_name("scratch");
  scratch->mutable_memory();

  auto* archive = config.add_collections();
  archive->set_name("archive");
  archive->mutable_directory()->set_path((dir / "archive").string());

  auto* db = config.add_collections();
  db->set_name("db");
  db->mutable_sqlite()->set_path((dir / "tracks.db").string());

  config.mutable_diff()->set_verbose(true);
  config.mutable_merge()->set_partial_tracks(true);

  auto deps = tracksync::factory::BuildRuntime(config);
  assert(deps.collections.size() == 3);
  assert(deps.collection_names.size() == 3);
  assert(deps.FindCollection("scratch")->Url() == "memory:scratch");
  assert(deps.FindCollection("archive")->Url().rfind("directory:", 0) == 0);
  assert(deps.FindCollection("db")->Url().rfind("sqlite:", 0) == 0);

  // zero means default
  assert(deps.diff_options.similar_min_positions == 100);
  assert(deps.diff_options.verbose);
  assert(deps.merge_options.partial_tracks);
  assert(deps.merge_options.position_digits == 4);

  bool not_found = false;
  try {
    (void)deps.FindCollection("nope");
  } catch (const tracksync::util::NotFound&) {
    not_found = true;
  }
  assert(not_found);
}

void TestDuplicateNamesAreRejected() {
  RuntimeConfig config;
  for (int i = 0; i < 2; ++i) {
    auto* entry = config.add_collections();
    entry->set_name("twice");
    entry->mutable_memory();
  }

  bool threw = false;
  try {
    (void)tracksync::factory::BuildRuntime(config);
  } catch (const tracksync::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
}

void TestMissingBackendOrPathIsRejected() {
  const auto registry = tracksync::collection::RegisterBuiltinCollections();

  RuntimeConfig no_backend;
  no_backend.add_collections()->set_name("bare");

  bool threw = false;
  try {
    (void)tracksync::factory::BuildCollections(no_backend, registry);
  } catch (const tracksync::util::ValidationError&) {
    threw = true;
  }
  assert(threw);

  RuntimeConfig no_path;
  auto*         entry = no_path.add_collections();
  entry->set_name("archive");
  entry->mutable_directory();

  threw = false;
  try {
    (void)tracksync::factory::BuildCollections(no_path, registry);
  } catch (const tracksync::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
}

void TestUnknownLogLevelIsRejected() {
  RuntimeConfig config;
  config.mutable_logging()->set_level("loud");

  bool threw = false;
  try {
    (void)tracksync::factory::BuildRuntime(config);
  } catch (const tracksync::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
}

void TestRegistryDescribesTypes() {
  const auto registry = tracksync::collection::RegisterBuiltinCollections();
  assert(registry.Types().size() == 3);

  const auto& memory = registry.Find("memory");
  assert(memory.capabilities.list);
  assert(memory.capabilities.remove);

  const auto& sqlite = registry.Find("sqlite");
  assert(sqlite.capabilities.write_title);

  bool threw = false;
  try {
    (void)registry.Find("ftp");
  } catch (const tracksync::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestBuildsEveryBackend();
  TestDuplicateNamesAreRejected();
  TestMissingBackendOrPathIsRejected();
  TestUnknownLogLevelIsRejected();
  TestRegistryDescribesTypes();

  std::cout << "tracksync_unit_factory: pass\n";
  return 0;
}
