#include "attribute_codec.hpp"

#include <algorithm>
#include <set>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace tracksync::codec {

namespace {

bool StartsWith(std::string_view text, std::string_view prefix) {
  return text.substr(0, prefix.size()) == prefix;
}

bool HasReservedPrefix(std::string_view tag) {
  return StartsWith(tag, kCategoryPrefix) || StartsWith(tag, kStatusPrefix) || StartsWith(tag, kIdPrefix);
}

std::vector<std::string> Split(const std::string& raw) {
  std::vector<std::string> parts;
  std::size_t              start = 0;
  while (start <= raw.size()) {
    auto end = raw.find(',', start);
    if (end == std::string::npos) {
      end = raw.size();
    }
    auto part = Trim(std::string_view(raw).substr(start, end - start));
    if (!part.empty()) {
      parts.push_back(std::move(part));
    }
    start = end + 1;
  }
  return parts;
}

} // namespace

const std::vector<std::string>& Categories() {
  static const std::vector<std::string> kCategories = {
      "Cycling", "Running", "Mountain biking", "Indoor cycling", "Sailing", "Walking", "Hiking",
      "Swimming", "Driving", "Off road driving", "Motor racing", "Motorcycling", "Enduro",
      "Skiing", "Cross country skiing", "Canoeing", "Kayaking", "Sea kayaking", "Stand up paddle boarding",
      "Rowing", "Windsurfing", "Kiteboarding", "Orienteering", "Mountaineering", "Skating",
      "Skateboarding", "Horse riding", "Hang gliding", "Gliding", "Flying", "Snowboarding",
      "Paragliding", "Hot air ballooning", "Nordic walking", "Snowshoeing", "Jet skiing", "Powerboating",
      "Pedelec", "Crossskating", "Handcycle", "Motorhome", "Cabriolet", "Coach",
      "Pack animal trekking", "Train", "Miscellaneous"};
  return kCategories;
}

const std::string& DefaultCategory() {
  return Categories().front();
}

bool IsCategory(const std::string& category) {
  const auto& all = Categories();
  return std::find(all.begin(), all.end(), category) != all.end();
}

std::string Trim(std::string_view text) {
  const auto first = text.find_first_not_of(" \t\r\n");
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = text.find_last_not_of(" \t\r\n");
  return std::string(text.substr(first, last - first + 1));
}

// ------------------------------------------------------------------
// Encode / Decode
// ------------------------------------------------------------------

std::string Encode(const Attributes& attributes) {
  std::vector<std::string> parts = attributes.tags;
  parts.push_back(std::string(kCategoryPrefix) + attributes.category);
  parts.push_back(std::string(kStatusPrefix) + (attributes.is_public ? "public" : "private"));
  for (const auto& id : attributes.cross_ids) {
    parts.push_back(std::string(kIdPrefix) + id);
  }

  std::string result;
  for (const auto& part : parts) {
    if (!result.empty()) {
      result += ", ";
    }
    result += part;
  }
  return result;
}

Attributes Decode(const std::string& raw) {
  Attributes result;
  bool       seen_category = false;
  bool       seen_status   = false;

  std::vector<std::string> ids;
  std::set<std::string>    tags;

  for (const auto& entry : Split(raw)) {
    if (StartsWith(entry, kCategoryPrefix)) {
      if (seen_category) {
        throw util::DuplicateKeyword("duplicate category entry in \"" + raw + "\"");
      }
      seen_category = true;
      auto category = Trim(std::string_view(entry).substr(kCategoryPrefix.size()));
      if (!IsCategory(category)) {
        throw util::ValidationError("unknown category: " + category);
      }
      result.category = std::move(category);
    } else if (StartsWith(entry, kStatusPrefix)) {
      if (seen_status) {
        throw util::DuplicateKeyword("duplicate status entry in \"" + raw + "\"");
      }
      seen_status = true;
      auto status = Trim(std::string_view(entry).substr(kStatusPrefix.size()));
      if (status != "public" && status != "private") {
        throw util::ValidationError("unknown status: " + status);
      }
      result.is_public = status == "public";
    } else if (StartsWith(entry, kIdPrefix)) {
      ids.push_back(Trim(std::string_view(entry).substr(kIdPrefix.size())));
    } else {
      tags.insert(entry);
    }
  }

  result.tags.assign(tags.begin(), tags.end());
  result.cross_ids = CleanCrossIds(ids);
  return result;
}

// ------------------------------------------------------------------
// Validation
// ------------------------------------------------------------------

std::string CheckTag(std::string_view tag) {
  auto trimmed = Trim(tag);
  if (trimmed.empty()) {
    throw util::ValidationError("empty tag");
  }
  if (trimmed.find(',') != std::string::npos) {
    throw util::ValidationError("tag must not contain a comma: " + trimmed);
  }
  if (HasReservedPrefix(trimmed)) {
    throw util::ReservedKeyword("reserved tag prefix, use the typed setter: " + trimmed);
  }
  return trimmed;
}

std::vector<std::string> NormalizeTags(const std::vector<std::string>& tags) {
  std::vector<std::string> result;
  result.reserve(tags.size());
  for (const auto& tag : tags) {
    auto checked = CheckTag(tag);
    if (std::find(result.begin(), result.end(), checked) != result.end()) {
      throw util::ValidationError("duplicate tag: " + checked);
    }
    result.push_back(std::move(checked));
  }
  std::sort(result.begin(), result.end());
  return result;
}

void CheckCrossIds(const std::vector<std::string>& cross_ids) {
  if (cross_ids.size() > kMaxCrossIds) {
    throw util::ValidationError("too many cross ids: " + std::to_string(cross_ids.size()));
  }
  for (std::size_t i = 0; i < cross_ids.size(); ++i) {
    const auto& id = cross_ids[i];
    if (id.empty() || id.find(',') != std::string::npos || Trim(id) != id) {
      throw util::ValidationError("illegal cross id: \"" + id + "\"");
    }
    const auto earlier = cross_ids.begin() + static_cast<std::ptrdiff_t>(i);
    if (std::find(cross_ids.begin(), earlier, id) != earlier) {
      throw util::ValidationError("duplicate cross id: " + id);
    }
    // decoding keeps only the first id per directory origin
    if (IsDirectoryLike(id) && std::any_of(cross_ids.begin(), earlier, [&](const std::string& other) {
          return IsDirectoryLike(other) && CrossIdOrigin(other) == CrossIdOrigin(id);
        })) {
      throw util::ValidationError("second cross id for directory " + CrossIdOrigin(id) + ": " + id);
    }
  }
}

std::string CrossIdOrigin(const std::string& cross_id) {
  const auto slash = cross_id.rfind('/');
  if (slash == std::string::npos) {
    return {};
  }
  return cross_id.substr(0, slash);
}

bool IsDirectoryLike(const std::string& cross_id) {
  if (StartsWith(cross_id, "directory:")) {
    return true;
  }
  const auto colon = cross_id.find(':');
  const auto slash = cross_id.find('/');
  return colon == std::string::npos || (slash != std::string::npos && slash < colon);
}

std::vector<std::string> CleanCrossIds(const std::vector<std::string>& cross_ids) {
  std::vector<std::string> result;
  std::set<std::string>    seen_origins;

  for (const auto& id : cross_ids) {
    if (result.size() == kMaxCrossIds) {
      break;
    }
    if (id.empty() || std::find(result.begin(), result.end(), id) != result.end()) {
      continue;
    }
    if (IsDirectoryLike(id) && !seen_origins.insert(CrossIdOrigin(id)).second) {
      continue;
    }
    result.push_back(id);
  }

  if (result.size() != cross_ids.size()) {
    TRACKSYNC_LOG_DEBUG("cleaned cross ids", {observability::IntField("before", static_cast<std::int64_t>(cross_ids.size())),
                                              observability::IntField("after", static_cast<std::int64_t>(result.size()))});
  }
  return result;
}

} // namespace tracksync::codec
