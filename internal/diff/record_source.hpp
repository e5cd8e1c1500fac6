#pragma once

#include <concepts>
#include <memory>
#include <variant>
#include <vector>

#include "internal/collection/collection.hpp"

namespace tracksync::diff {

using collection::CollectionPtr;
using record::RecordPtr;

/*
  One side of a comparison: a record, everything a collection hosts, or
  any nesting of those.
*/
struct RecordSource {
  std::variant<RecordPtr, CollectionPtr, std::vector<RecordSource>> value;

  RecordSource(RecordPtr record) : value(std::move(record)) {
  }

  template <typename C>
    requires std::derived_from<C, collection::Collection>
  RecordSource(std::shared_ptr<C> collection) : value(CollectionPtr(std::move(collection))) {
  }

  RecordSource(std::vector<RecordSource> sources) : value(std::move(sources)) {
  }

  RecordSource(const std::vector<RecordPtr>& records);
};

// Depth first; collections contribute their records in listing order.
std::vector<RecordPtr> Flatten(const RecordSource& source);

} // namespace tracksync::diff
