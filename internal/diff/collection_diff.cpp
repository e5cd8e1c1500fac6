#include "collection_diff.hpp"

#include <algorithm>
#include <cstdio>
#include <tuple>

#include "internal/observability/logging.hpp"

namespace tracksync::diff {

using observability::IntField;

namespace {

using Time = std::optional<util::TimePoint>;

std::string Join(const std::vector<std::string>& items) {
  std::string out;
  for (const auto& item : items) {
    if (!out.empty()) {
      out += ", ";
    }
    out += item;
  }
  return out;
}

std::string Quoted(const std::string& left, const std::string& right) {
  return "\"" + left + "\" <> \"" + right + "\"";
}

std::string FormatTime(const Time& time) {
  return time ? util::FormatDateTime(*time) : "unknown time";
}

// The second time drops its date when it falls on the first one's.
std::string Between(const Time& first, const Time& second) {
  std::string tail = FormatTime(second);
  if (first && second && util::SameDate(*first, *second)) {
    tail = util::FormatTimeOfDay(*second);
  }
  return "between " + FormatTime(first) + " and " + tail;
}

Time EarlierOf(const Time& a, const Time& b) {
  if (!a) return b;
  if (!b) return a;
  return std::min(*a, *b);
}

Time LaterOf(const Time& a, const Time& b) {
  if (!a) return b;
  if (!b) return a;
  return std::max(*a, *b);
}

std::string PointLine(char sign, const geo::Point& point) {
  char buf[96];
  std::snprintf(buf, sizeof(buf), "  %c %8.6f %8.6f %5.2f ", sign, point.latitude, point.longitude,
                point.elevation.value_or(0.0));
  return buf + FormatTime(point.time);
}

using PositionKey = std::tuple<double, double, double>;

PositionKey KeyOf(const geo::Point& point) {
  return {point.latitude, point.longitude, point.elevation.value_or(0.0)};
}

// Equal positions map to equal symbols across both lists.
std::pair<std::vector<std::size_t>, std::vector<std::size_t>> Symbols(const std::vector<geo::Point>& left,
                                                                      const std::vector<geo::Point>& right) {
  std::map<PositionKey, std::size_t> ids;
  auto                               symbolize = [&](const std::vector<geo::Point>& points) {
    std::vector<std::size_t> out;
    out.reserve(points.size());
    for (const auto& point : points) {
      auto [it, inserted] = ids.emplace(KeyOf(point), ids.size());
      out.push_back(it->second);
    }
    return out;
  };
  auto a = symbolize(left);
  auto b = symbolize(right);
  return {std::move(a), std::move(b)};
}

} // namespace

// ------------------------------------------------------------------
// Pair
// ------------------------------------------------------------------

Pair::Pair(RecordPtr left, RecordPtr right, bool verbose) : left_(std::move(left)), right_(std::move(right)) {
  CompareMetadata();
  ComparePoints(verbose);
}

void Pair::Add(char flag, std::string line) {
  differences_[flag].push_back(std::move(line));
}

std::string Pair::Flags() const {
  std::string out;
  for (char flag : kDiffFlags) {
    if (Has(flag)) {
      out += flag;
    }
  }
  return out;
}

void Pair::CompareMetadata() {
  auto compare = [this](char flag, const std::string& l, const std::string& r) {
    if (l != r) {
      Add(flag, Quoted(l, r));
    }
  };
  auto status = [](bool is_public) { return std::string(is_public ? "public" : "private"); };

  compare('T', left_->Title(), right_->Title());
  compare('D', left_->Description(), right_->Description());
  compare('C', left_->Category(), right_->Category());
  compare('K', Join(left_->Tags()), Join(right_->Tags()));
  compare('S', status(left_->IsPublic()), status(right_->IsPublic()));
}

void Pair::ComparePoints(bool verbose) {
  const auto left_points  = left_->Geo().Points();
  const auto right_points = right_->Geo().Points();

  auto [a, b] = Symbols(left_points, right_points);
  opcodes_    = SequenceMatcher(std::move(a), std::move(b)).Opcodes();

  for (const auto& op : opcodes_) {
    switch (op.tag) {
      case OpTag::kEqual:
        break;
      case OpTag::kDelete:
        Add('P', "points " + Between(left_points[op.a_begin].time, left_points[op.a_end - 1].time) +
                     " are missing on the right");
        break;
      case OpTag::kInsert:
        Add('P', "points " + Between(right_points[op.b_begin].time, right_points[op.b_end - 1].time) +
                     " are missing on the left");
        break;
      case OpTag::kReplace: {
        const std::size_t count = op.a_end - op.a_begin;
        bool              same  = count == op.b_end - op.b_begin;
        for (std::size_t i = 0; same && i < count; ++i) {
          const auto& l = left_points[op.a_begin + i];
          const auto& r = right_points[op.b_begin + i];
          same          = l.latitude == r.latitude && l.longitude == r.longitude;
        }

        if (same) {
          std::set<std::optional<util::Duration>> deltas;
          for (std::size_t i = 0; i < count; ++i) {
            const auto& l = left_points[op.a_begin + i].time;
            const auto& r = right_points[op.b_begin + i].time;
            deltas.insert(l && r ? std::optional<util::Duration>(*r - *l) : std::nullopt);
          }
          if (deltas.size() > 1) {
            Add('Z', "Points have different times");
          } else if (auto delta = *deltas.begin(); delta && delta->count() != 0) {
            Add('Z', std::to_string(count) + " points " +
                         Between(left_points[op.a_begin].time, left_points[op.a_end - 1].time) + " on the left are " +
                         util::FormatDuration(*delta) + " later on the right");
          }
          // same positions and times: only the elevation differs, not worth a line
          break;
        }

        Add('P', "points " +
                     Between(EarlierOf(left_points[op.a_begin].time, right_points[op.b_begin].time),
                             LaterOf(left_points[op.a_end - 1].time, right_points[op.b_end - 1].time)) +
                     " are different");
        if (verbose) {
          const std::size_t shared = std::min(count, op.b_end - op.b_begin);
          for (std::size_t i = 0; i < shared; ++i) {
            Add('P', PointLine('<', left_points[op.a_begin + i]));
            Add('P', PointLine('>', right_points[op.b_begin + i]));
          }
        }
        break;
      }
    }
  }

  auto offset = geo::TimeOffset(left_->Geo(), right_->Geo());
  if (offset && offset->count() != 0) {
    time_shift_ = offset;
    Add('Z', "Time offset: " + util::FormatDuration(*offset));
  }
}

// ------------------------------------------------------------------
// CollectionDiff
// ------------------------------------------------------------------

std::size_t IntersectionSize(const std::set<Position>& a, const std::set<Position>& b) {
  const auto& smaller = a.size() <= b.size() ? a : b;
  const auto& larger  = a.size() <= b.size() ? b : a;
  return static_cast<std::size_t>(
      std::count_if(smaller.begin(), smaller.end(), [&](const Position& p) { return larger.contains(p); }));
}

DiffSide CollectionDiff::BuildSide(const RecordSource& source) {
  DiffSide side;
  side.records = Flatten(source);
  side.positions.reserve(side.records.size());
  for (const auto& record : side.records) {
    std::set<Position> positions;
    for (const auto& segment : record->Geo().Segments()) {
      for (const auto& point : segment) {
        positions.emplace(point.longitude, point.latitude);
      }
    }
    side.positions.push_back(std::move(positions));
  }
  return side;
}

CollectionDiff::CollectionDiff(const RecordSource& left, const RecordSource& right, DiffOptions options)
    : left_(BuildSide(left)), right_(BuildSide(right)) {
  const std::size_t threshold = std::max<std::size_t>(options.similar_min_positions, 1);

  std::vector<bool> left_matched(left_.records.size(), false);
  std::vector<bool> right_matched(right_.records.size(), false);

  std::vector<record::RecordKey> right_keys;
  right_keys.reserve(right_.records.size());
  for (const auto& record : right_.records) {
    right_keys.push_back(record->Key());
  }

  for (std::size_t l = 0; l < left_.records.size(); ++l) {
    const auto key = left_.records[l]->Key();
    for (std::size_t r = 0; r < right_.records.size(); ++r) {
      if (!right_matched[r] && right_keys[r] == key) {
        left_matched[l]  = true;
        right_matched[r] = true;
        identical_.emplace_back(left_.records[l], right_.records[r]);
        break;
      }
    }
  }

  for (std::size_t l = 0; l < left_.records.size(); ++l) {
    if (left_matched[l]) {
      continue;
    }
    std::optional<std::size_t> best;
    std::size_t                best_size = 0;
    for (std::size_t r = 0; r < right_.records.size(); ++r) {
      if (right_matched[r]) {
        continue;
      }
      const auto size = IntersectionSize(left_.positions[l], right_.positions[r]);
      if (size >= threshold && size > best_size) {
        best      = r;
        best_size = size;
      }
    }
    if (best) {
      left_matched[l]      = true;
      right_matched[*best] = true;
      similar_.emplace_back(left_.records[l], right_.records[*best], options.verbose);
    }
  }

  for (std::size_t l = 0; l < left_.records.size(); ++l) {
    if (!left_matched[l]) {
      left_.exclusive.push_back(left_.records[l]);
    }
  }
  for (std::size_t r = 0; r < right_.records.size(); ++r) {
    if (!right_matched[r]) {
      right_.exclusive.push_back(right_.records[r]);
    }
  }

  TRACKSYNC_LOG_DEBUG("compared records", {IntField("left", static_cast<std::int64_t>(left_.records.size())),
                                           IntField("right", static_cast<std::int64_t>(right_.records.size())),
                                           IntField("identical", static_cast<std::int64_t>(identical_.size())),
                                           IntField("similar", static_cast<std::int64_t>(similar_.size()))});
}

} // namespace tracksync::diff
