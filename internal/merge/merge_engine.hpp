#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/collection/collection.hpp"
#include "internal/diff/record_source.hpp"

namespace tracksync::merge {

using record::Record;

struct MergeOptions {
  // delete the merged record afterwards
  bool remove = false;

  // only report, change nothing
  bool dry_run = false;

  // accept one point list being a contiguous part of the other
  bool partial_tracks = false;

  // decimal digits used when comparing positions
  int position_digits = 4;
};

/*
  Returns why other cannot be merged into self, or nullopt if it can.

  Mergeable are: equal point lists, an other with waypoints but no
  track points and, with partial_tracks, one point list appearing
  contiguously inside the other.
*/
std::optional<std::string> MergeBlocker(Record& self, Record& other, const MergeOptions& options = {});

bool CanMerge(Record& self, Record& other, const MergeOptions& options = {});

/*
  Merges other into self inside one batch: geometry, missing point
  times, waypoints, title, description, visibility, tags and cross ids.
  A category mismatch is only reported.

  Returns the report lines; dry_run yields the same lines without
  changing anything. Throws CannotMerge.
*/
std::vector<std::string> Merge(Record& self, Record& other, const MergeOptions& options = {});

/*
  Merges source into target. Records whose points hash is unknown in
  target are copied (moved with remove), the others merged into the
  target record with that hash. Duplicates already inside target are
  merged into their first occurrence. With copy every source record is
  copied without looking for a match.
*/
std::vector<std::string> MergeCollection(collection::Collection& target, const diff::RecordSource& source,
                                         const MergeOptions& options = {}, bool copy = false);

} // namespace tracksync::merge
