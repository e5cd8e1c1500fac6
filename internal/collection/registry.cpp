#include "registry.hpp"

#include "internal/collection/directory/directory_collection.hpp"
#include "internal/collection/memory/memory_collection.hpp"
#include "internal/collection/sqlite/sqlite_collection.hpp"
#include "internal/util/errors.hpp"

namespace tracksync::collection {

using runtime::config::CollectionConfig;

namespace {

std::string BackendName(const CollectionConfig& config) {
  switch (config.backend_case()) {
    case CollectionConfig::kMemory:
      return "memory";
    case CollectionConfig::kDirectory:
      return "directory";
    case CollectionConfig::kSqlite:
      return "sqlite";
    case CollectionConfig::BACKEND_NOT_SET:
      break;
  }
  throw util::ValidationError("collection " + config.name() + " names no backend");
}

} // namespace

CollectionRegistry::CollectionRegistry(std::vector<CollectionType> types) : types_(std::move(types)) {
}

const CollectionType& CollectionRegistry::Find(const std::string& name) const {
  for (const auto& type : types_) {
    if (type.name == name) {
      return type;
    }
  }
  throw util::NotFound("unknown collection type: " + name);
}

CollectionPtr CollectionRegistry::Build(const CollectionConfig& config) const {
  return Find(BackendName(config)).factory(config);
}

CollectionRegistry RegisterBuiltinCollections() {
  std::vector<CollectionType> types;

  types.push_back({"memory", memory::MemoryCollection::DeclaredCapabilities(), [](const CollectionConfig& config) {
                     return std::make_shared<memory::MemoryCollection>(config.name().empty() ? "default" : config.name());
                   }});

  types.push_back({"directory", directory::DirectoryCollection::DeclaredCapabilities(),
                   [](const CollectionConfig& config) -> CollectionPtr {
                     if (config.directory().path().empty()) {
                       throw util::ValidationError("directory collection " + config.name() + " needs a path");
                     }
                     return std::make_shared<directory::DirectoryCollection>(config.directory().path());
                   }});

  types.push_back({"sqlite", sqlite::SqliteCollection::DeclaredCapabilities(),
                   [](const CollectionConfig& config) -> CollectionPtr {
                     if (config.sqlite().path().empty()) {
                       throw util::ValidationError("sqlite collection " + config.name() + " needs a path");
                     }
                     auto database = std::make_shared<db::sqlite::SqliteDB>(config.sqlite().path());
                     return std::make_shared<sqlite::SqliteCollection>(std::move(database));
                   }});

  return CollectionRegistry(std::move(types));
}

} // namespace tracksync::collection
