#include "merge_engine.hpp"

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <map>
#include <string_view>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace tracksync::merge {

using observability::BoolField;
using observability::StringField;

namespace {

constexpr std::string_view kIndent     = "     ";
constexpr std::string_view kAndRemove  = " and remove";
constexpr std::string_view kTitleChars = "0123456789 :-_";

// 0 empty, 1 looks like a generated default, 2 chosen by someone
int TitleRank(const std::string& title, const std::string& category) {
  if (title.empty()) {
    return 0;
  }
  if (title == category + " track") {
    return 1;
  }
  if (title.find_first_not_of(kTitleChars) == std::string::npos) {
    return 1;
  }
  return 2;
}

// self point index = other point index + shift
struct Alignment {
  std::ptrdiff_t shift = 0;
};

bool SameRecord(Record& self, Record& other) {
  if (&self == &other) {
    return true;
  }
  return self.Host() != nullptr && self.Host() == other.Host() && self.Identity() && self.Identity() == other.Identity();
}

std::optional<Alignment> Align(Record& self, Record& other, const MergeOptions& options) {
  const auto& mine   = self.Geo();
  const auto& theirs = other.Geo();

  if (geo::PointsEqual(mine, theirs, options.position_digits)) {
    return Alignment{};
  }
  if (theirs.PointCount() == 0 && !theirs.Waypoints().empty()) {
    return Alignment{};
  }
  if (options.partial_tracks) {
    if (auto at = geo::Index(mine, theirs, options.position_digits)) {
      return Alignment{static_cast<std::ptrdiff_t>(*at)};
    }
    if (auto at = geo::Index(theirs, mine, options.position_digits)) {
      return Alignment{-static_cast<std::ptrdiff_t>(*at)};
    }
  }
  return std::nullopt;
}

// Fills point times self lacks from the aligned points of other.
std::size_t CopyTimes(std::vector<geo::Point>& mine, const std::vector<geo::Point>& theirs, Alignment alignment) {
  std::size_t copied = 0;
  for (std::size_t i = 0; i < theirs.size(); ++i) {
    const auto target = static_cast<std::ptrdiff_t>(i) + alignment.shift;
    if (target < 0 || target >= static_cast<std::ptrdiff_t>(mine.size())) {
      continue;
    }
    auto& point = mine[static_cast<std::size_t>(target)];
    if (!point.time && theirs[i].time) {
      point.time = theirs[i].time;
      ++copied;
    }
  }
  return copied;
}

std::size_t CountMissingTimes(const std::vector<geo::Point>& mine, const std::vector<geo::Point>& theirs,
                              Alignment alignment) {
  auto copy = mine;
  return CopyTimes(copy, theirs, alignment);
}

// Writes flat points back into the segment layout of geo.
void ReplacePoints(geo::GeoSequence& geo, const std::vector<geo::Point>& points) {
  std::size_t next = 0;
  for (auto& segment : geo.MutableSegments()) {
    for (auto& point : segment) {
      point = points[next++];
    }
  }
}

std::string Join(const std::vector<std::string>& items, std::string_view separator) {
  std::string out;
  for (const auto& item : items) {
    if (!out.empty()) {
      out += separator;
    }
    out += item;
  }
  return out;
}

} // namespace

std::optional<std::string> MergeBlocker(Record& self, Record& other, const MergeOptions& options) {
  if (SameRecord(self, other)) {
    return "Cannot merge identical records " + self.Identifier();
  }
  if (Align(self, other, options)) {
    return std::nullopt;
  }
  return "Cannot merge " + other.Identifier() + " with " + std::to_string(other.PointCount()) + " points into " +
         self.Identifier() + " with " + std::to_string(self.PointCount()) + " points";
}

bool CanMerge(Record& self, Record& other, const MergeOptions& options) {
  return !MergeBlocker(self, other, options).has_value();
}

std::vector<std::string> Merge(Record& self, Record& other, const MergeOptions& options) {
  if (auto reason = MergeBlocker(self, other, options)) {
    throw util::CannotMerge(*reason);
  }
  const auto alignment = *Align(self, other, options);
  const bool apply     = !options.dry_run;

  const auto self_name  = self.Identifier();
  const auto other_name = other.Identifier();

  std::vector<std::string> changes;

  self.BatchChanges([&] {
    // geometry
    const bool take_geometry = other.PointCount() > self.PointCount();
    if (take_geometry) {
      if (apply) {
        auto geometry = other.Geo();
        self.ChangeGeo([&](geo::GeoSequence& geo) {
          geometry.MutableWaypoints() = geo.Waypoints();
          geo                         = std::move(geometry);
        });
      }
      changes.push_back(self_name + " got entire geometry from " + other_name);
    } else {
      const auto  theirs = other.Geo().Points();
      const auto  copied = CountMissingTimes(self.Geo().Points(), theirs, alignment);
      if (copied && apply) {
        self.ChangeGeo([&](geo::GeoSequence& geo) {
          auto mine = geo.Points();
          CopyTimes(mine, theirs, alignment);
          ReplacePoints(geo, mine);
        });
      }
      if (copied) {
        changes.push_back("Copied times for " + std::to_string(copied) + " out of " +
                          std::to_string(self.PointCount()) + " points");
      }
    }

    // waypoints
    std::vector<geo::Waypoint> added;
    for (const auto& theirs : other.Geo().Waypoints()) {
      const auto& mine  = self.Geo().Waypoints();
      const bool  known = std::any_of(mine.begin(), mine.end(), [&](const geo::Waypoint& w) {
        return geo::SamePosition(w, theirs, options.position_digits);
      }) || std::any_of(added.begin(), added.end(), [&](const geo::Waypoint& w) {
        return geo::SamePosition(w, theirs, options.position_digits);
      });
      if (!known) {
        added.push_back(theirs);
      }
    }
    if (!added.empty()) {
      if (apply) {
        for (auto& waypoint : added) {
          self.AddWaypoint(waypoint);
        }
      }
      changes.push_back("Added " + std::to_string(added.size()) + " waypoints");
    }

    // title
    if (TitleRank(other.Title(), other.Category()) > TitleRank(self.Title(), self.Category())) {
      changes.push_back("Title: " + self.Title() + " -> " + other.Title());
      if (apply) {
        self.SetTitle(other.Title());
      }
    }

    // description
    const auto& theirs_description = other.Description();
    if (!theirs_description.empty() && theirs_description != self.Description()) {
      changes.push_back("Additional description: " + theirs_description);
      if (apply) {
        self.SetDescription(self.Description().empty() ? theirs_description
                                                       : self.Description() + "\n" + theirs_description);
      }
    }

    // visibility
    if (other.IsPublic() && !self.IsPublic()) {
      changes.push_back("Visibility: private -> public");
      if (apply) {
        self.SetPublic(true);
      }
    }

    // category
    if (other.Category() != self.Category()) {
      changes.push_back("Category: " + other_name + "=" + other.Category() + " differs from " + self_name + "=" +
                        self.Category() + ", keeping " + self.Category());
    }

    // tags
    const auto&              mine_tags = self.Tags();
    std::vector<std::string> new_tags;
    for (const auto& tag : other.Tags()) {
      if (std::find(mine_tags.begin(), mine_tags.end(), tag) == mine_tags.end()) {
        new_tags.push_back(tag);
      }
    }
    if (!new_tags.empty()) {
      changes.push_back("New keywords: " + Join(new_tags, ","));
      if (apply) {
        self.AddTags(new_tags);
      }
    }

    // cross ids
    auto ids = self.CrossIds();
    ids.insert(ids.end(), other.CrossIds().begin(), other.CrossIds().end());
    ids = codec::CleanCrossIds(ids);
    if (ids != self.CrossIds()) {
      changes.push_back("Ids: " + Join(ids, ", "));
      if (apply) {
        self.SetCrossIds(ids);
      }
    }
  });

  std::vector<std::string> messages;
  if (!changes.empty()) {
    messages.push_back("merge" + std::string(options.remove ? kAndRemove : "") + " " + other_name);
    messages.push_back(std::string(options.remove ? kAndRemove.size() : 0, ' ') + "  into " + self_name);
    for (const auto& change : changes) {
      messages.push_back(std::string(kIndent) + change);
    }
  }

  if (options.remove) {
    if (changes.empty()) {
      messages.push_back("removed exact duplicate " + other_name + ": it was identical with " + self_name);
    }
    if (apply && other.Host()) {
      other.Remove();
    }
  }

  TRACKSYNC_LOG_INFO("merged record", {StringField("from", other_name), StringField("into", self_name),
                                       BoolField("dry_run", options.dry_run), BoolField("remove", options.remove)});
  return messages;
}

// ------------------------------------------------------------------
// Collections
// ------------------------------------------------------------------

namespace {

std::vector<std::string> CopyInto(collection::Collection& target, const record::RecordPtr& record,
                                  const MergeOptions& options) {
  const auto from = record->Identifier();
  std::string to  = target.Url();
  if (!options.dry_run) {
    to = target.Add(record)->Identifier();
    if (options.remove && record->Host()) {
      record->Remove();
    }
  }
  return {std::string(options.remove ? "move " : "copy ") + from + " -> " + to};
}

} // namespace

std::vector<std::string> MergeCollection(collection::Collection& target, const diff::RecordSource& source,
                                         const MergeOptions& options, bool copy) {
  std::vector<record::RecordPtr> incoming;
  for (auto& record : diff::Flatten(source)) {
    if (record->Host() != &target) {
      incoming.push_back(std::move(record));
    }
  }

  std::vector<std::string> result;
  auto                     append = [&result](std::vector<std::string> lines) {
    result.insert(result.end(), std::make_move_iterator(lines.begin()), std::make_move_iterator(lines.end()));
  };

  if (copy) {
    for (const auto& record : incoming) {
      append(CopyInto(target, record, options));
    }
    return result;
  }

  std::map<std::uint64_t, record::RecordPtr>              targets;
  std::map<std::uint64_t, std::vector<record::RecordPtr>> sources;

  const auto existing = target.Records();
  for (const auto& record : existing) {
    const auto hash = record->PointsHash();
    if (!targets.contains(hash)) {
      targets.emplace(hash, record);
    } else {
      sources[hash].push_back(record);
    }
  }
  for (const auto& record : incoming) {
    sources[record->PointsHash()].push_back(record);
  }

  for (const auto& [hash, records] : sources) {
    auto match = targets.find(hash);
    for (const auto& record : records) {
      if (match != targets.end()) {
        append(Merge(*match->second, *record, options));
        continue;
      }

      record::RecordPtr partner;
      if (options.partial_tracks) {
        for (const auto& candidate : existing) {
          if (candidate->Host() == &target && CanMerge(*candidate, *record, options)) {
            partner = candidate;
            break;
          }
        }
      }
      if (partner) {
        append(Merge(*partner, *record, options));
      } else {
        append(CopyInto(target, record, options));
      }
    }
  }
  return result;
}

} // namespace tracksync::merge
