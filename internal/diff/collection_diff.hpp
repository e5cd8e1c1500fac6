#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "internal/diff/record_source.hpp"
#include "internal/diff/sequence_matcher.hpp"
#include "internal/util/time.hpp"

namespace tracksync::diff {

// T title, D description, C category, S status, K keywords, P positions, Z time
inline constexpr std::string_view kDiffFlags = "TDCSKPZ";

struct DiffOptions {
  // shared positions needed to call two records similar
  std::size_t similar_min_positions = 100;

  // list every differing point pair
  bool verbose = false;
};

/*
  Detailed comparison of two records that look like the same track.
  Everything is computed on construction; the records may be loaded.
*/
class Pair {
 public:
  Pair(RecordPtr left, RecordPtr right, bool verbose = false);

  const RecordPtr& Left() const {
    return left_;
  }

  const RecordPtr& Right() const {
    return right_;
  }

  // flag -> human readable lines
  const std::map<char, std::vector<std::string>>& Differences() const {
    return differences_;
  }

  bool Has(char flag) const {
    return differences_.contains(flag);
  }

  // Flags present, in kDiffFlags order.
  std::string Flags() const;

  // Alignment of the (latitude, longitude, elevation) lists.
  const std::vector<Opcode>& Opcodes() const {
    return opcodes_;
  }

  // Whole track clock skew, if any.
  const std::optional<util::Duration>& TimeShift() const {
    return time_shift_;
  }

 private:
  void CompareMetadata();
  void ComparePoints(bool verbose);

  void Add(char flag, std::string line);

  RecordPtr                                left_;
  RecordPtr                                right_;
  std::map<char, std::vector<std::string>> differences_;
  std::vector<Opcode>                      opcodes_;
  std::optional<util::Duration>            time_shift_;
};

using Position = std::pair<double, double>;

struct DiffSide {
  std::vector<RecordPtr> records;

  // records matching nothing on the other side
  std::vector<RecordPtr> exclusive;

  // per record: distinct (longitude, latitude) pairs
  std::vector<std::set<Position>> positions;
};

/*
  CollectionDiff

  Sorts the records of two sides into identical, similar and exclusive.

  Matching, in two passes so that the outcome does not depend on how
  early a weak candidate shows up:
    1. each left record takes the first unmatched right record with an
       equal Key → identical
    2. each remaining left record takes the unmatched right record with
       the largest positional intersection, if that reaches
       similar_min_positions; ties go to the earliest right record
       → similar, with a Pair
  Every record matches at most once.
*/
class CollectionDiff {
 public:
  CollectionDiff(const RecordSource& left, const RecordSource& right, DiffOptions options = {});

  const DiffSide& Left() const {
    return left_;
  }

  const DiffSide& Right() const {
    return right_;
  }

  const std::vector<std::pair<RecordPtr, RecordPtr>>& Identical() const {
    return identical_;
  }

  const std::vector<Pair>& Similar() const {
    return similar_;
  }

 private:
  static DiffSide BuildSide(const RecordSource& source);

  DiffSide                                     left_;
  DiffSide                                     right_;
  std::vector<std::pair<RecordPtr, RecordPtr>> identical_;
  std::vector<Pair>                            similar_;
};

std::size_t IntersectionSize(const std::set<Position>& a, const std::set<Position>& b);

} // namespace tracksync::diff
