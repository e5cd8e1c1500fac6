#pragma once

#include <string>

#include "internal/geo/geo_sequence.hpp"

namespace tracksync::gpx {

/*
  GpxDocument

  In-memory form of a GPX 1.1 file as the collections persist it:

    metadata/name      <-> title
    metadata/desc      <-> description
    metadata/keywords  <-> encoded attribute string
    metadata/time      <-> fallback time of the sequence
    wpt / trk/trkseg   <-> geo
*/
struct GpxDocument {
  std::string      title;
  std::string      description;
  std::string      keywords;
  geo::GeoSequence geo;
};

// Throws util::StorageError when the text is not a usable GPX document.
GpxDocument Parse(const std::string& xml);

// Only name, desc, keywords and metadata time; segments stay empty.
GpxDocument ParseHeader(const std::string& xml);

std::string Serialize(const GpxDocument& document);

} // namespace tracksync::gpx
