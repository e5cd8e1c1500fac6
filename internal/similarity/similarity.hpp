#pragma once

#include <vector>

#include "internal/record/record.hpp"

namespace tracksync::similarity {

// positions closer than this to the simplified line are dropped, metres
inline constexpr double kSimplifyDistance = 50.0;

// decimal digits kept of the simplified positions
inline constexpr int kSimilarityDigits = 3;

/*
  0..1, 1 meaning the same path.

  Both point lists are simplified and rounded; the score multiplies how
  close their lengths are with how many positions the smaller one
  shares with the other. Cached on both records until either changes
  its geometry.
*/
double Similarity(record::Record& a, record::Record& b);

// Best score against several records; 0 for none.
double Similarity(record::Record& record, const std::vector<record::RecordPtr>& others);

} // namespace tracksync::similarity
