#pragma once

#include <string>
#include <vector>

#include "config/config.pb.h"

#include "internal/collection/registry.hpp"
#include "internal/diff/collection_diff.hpp"
#include "internal/merge/merge_engine.hpp"

namespace tracksync::factory {

/*
  RuntimeDependencies

  Everything a caller needs after reading the runtime config: the
  configured collections in config order and the engine options.
*/
struct RuntimeDependencies {
  std::vector<std::string>              collection_names;
  std::vector<collection::CollectionPtr> collections;

  diff::DiffOptions   diff_options;
  merge::MergeOptions merge_options;

  // Throws NotFound.
  collection::CollectionPtr FindCollection(const std::string& name) const;
};

std::vector<collection::CollectionPtr> BuildCollections(const runtime::config::RuntimeConfig& config,
                                                        const collection::CollectionRegistry& registry);

/*
  BuildRuntime

  Composition root: the only place that turns config sections into
  concrete collection types. Logging is initialized first.
*/
RuntimeDependencies BuildRuntime(const runtime::config::RuntimeConfig& config);

} // namespace tracksync::factory
