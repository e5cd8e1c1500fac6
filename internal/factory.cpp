#include "factory.hpp"

#include <set>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace tracksync::factory {

using observability::IntField;
using observability::StringField;

collection::CollectionPtr RuntimeDependencies::FindCollection(const std::string& name) const {
  for (std::size_t i = 0; i < collection_names.size(); ++i) {
    if (collection_names[i] == name) {
      return collections[i];
    }
  }
  throw util::NotFound("no collection named " + name);
}

std::vector<collection::CollectionPtr> BuildCollections(const runtime::config::RuntimeConfig& config,
                                                        const collection::CollectionRegistry& registry) {
  std::vector<collection::CollectionPtr> collections;
  std::set<std::string>                  names;
  for (const auto& entry : config.collections()) {
    if (entry.name().empty()) {
      throw util::ValidationError("collection without name");
    }
    if (!names.insert(entry.name()).second) {
      throw util::ValidationError("duplicate collection name: " + entry.name());
    }
    auto built = registry.Build(entry);
    TRACKSYNC_LOG_INFO("collection ready", {StringField("name", entry.name()), StringField("url", built->Url())});
    collections.push_back(std::move(built));
  }
  return collections;
}

/*
    Build full runtime from config
*/
RuntimeDependencies BuildRuntime(const runtime::config::RuntimeConfig& config) {
  observability::InitializeLogging(config);

  RuntimeDependencies deps;

  // ------------------------------------------------------------------
  // Collections
  // ------------------------------------------------------------------
  const auto registry = collection::RegisterBuiltinCollections();
  deps.collections    = BuildCollections(config, registry);
  for (const auto& entry : config.collections()) {
    deps.collection_names.push_back(entry.name());
  }

  // ------------------------------------------------------------------
  // Engines
  // ------------------------------------------------------------------
  if (config.diff().similar_min_positions() != 0) {
    deps.diff_options.similar_min_positions = config.diff().similar_min_positions();
  }
  deps.diff_options.verbose = config.diff().verbose();

  deps.merge_options.partial_tracks = config.merge().partial_tracks();
  if (config.merge().position_digits() != 0) {
    deps.merge_options.position_digits = static_cast<int>(config.merge().position_digits());
  }

  TRACKSYNC_LOG_INFO("runtime ready", {IntField("collections", static_cast<std::int64_t>(deps.collections.size()))});
  return deps;
}

} // namespace tracksync::factory
