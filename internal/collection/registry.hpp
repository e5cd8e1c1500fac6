#pragma once

#include <functional>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/collection/collection.hpp"

namespace tracksync::collection {

/*
  A collection type that can be named in the runtime config.
*/
struct CollectionType {
  // matches the backend field of CollectionConfig
  std::string  name;
  Capabilities capabilities;

  std::function<CollectionPtr(const runtime::config::CollectionConfig&)> factory;
};

/*
  Immutable list of collection types, built once by
  RegisterBuiltinCollections() at startup.
*/
class CollectionRegistry {
 public:
  explicit CollectionRegistry(std::vector<CollectionType> types);

  const std::vector<CollectionType>& Types() const {
    return types_;
  }

  // Throws NotFound.
  const CollectionType& Find(const std::string& name) const;

  // Instantiates the type selected by config's backend. Throws ValidationError without one.
  CollectionPtr Build(const runtime::config::CollectionConfig& config) const;

 private:
  std::vector<CollectionType> types_;
};

CollectionRegistry RegisterBuiltinCollections();

} // namespace tracksync::collection
