#include "similarity.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <set>
#include <utility>

#include "internal/observability/logging.hpp"

namespace tracksync::similarity {

namespace {

using Position = std::pair<double, double>;

std::vector<Position> Simple(record::Record& record) {
  std::vector<Position> out;
  for (const auto& point : geo::Simplify(record.Geo().Points(), kSimplifyDistance)) {
    out.emplace_back(geo::RoundTo(point.latitude, kSimilarityDigits), geo::RoundTo(point.longitude, kSimilarityDigits));
  }
  return out;
}

double Score(record::Record& a, record::Record& b) {
  const auto simple_a = Simple(a);
  const auto simple_b = Simple(b);

  const auto max_len = std::max(simple_a.size(), simple_b.size());
  if (max_len == 0) {
    return 0.0;
  }
  const double similar_length =
      1.0 - std::abs(static_cast<double>(simple_a.size()) - static_cast<double>(simple_b.size())) / max_len;

  const std::set<Position> set_a(simple_a.begin(), simple_a.end());
  const std::set<Position> set_b(simple_b.begin(), simple_b.end());
  const auto               min_len = std::min(set_a.size(), set_b.size());
  if (min_len == 0) {
    return 0.0;
  }
  std::size_t shared = 0;
  for (const auto& position : set_a) {
    shared += set_b.count(position);
  }
  return similar_length * static_cast<double>(shared) / static_cast<double>(min_len);
}

} // namespace

double Similarity(record::Record& a, record::Record& b) {
  if (auto cached = a.CachedSimilarity(b)) {
    return *cached;
  }
  const double result = Score(a, b);
  a.CacheSimilarity(b, result);
  if (observability::ShouldLog(spdlog::level::debug)) {
    TRACKSYNC_LOG_DEBUG("similarity", {observability::StringField("a", a.Identifier()),
                                       observability::StringField("b", b.Identifier()),
                                       observability::DoubleField("score", result)});
  }
  return result;
}

double Similarity(record::Record& record, const std::vector<record::RecordPtr>& others) {
  double best = 0.0;
  for (const auto& other : others) {
    best = std::max(best, Similarity(record, *other));
  }
  return best;
}

} // namespace tracksync::similarity
