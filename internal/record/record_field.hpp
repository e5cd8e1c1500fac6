#pragma once

#include <cstdint>
#include <string_view>

namespace tracksync::record {

// Dirty markers. kGpx stands for the whole geometry and always needs a full write.
enum class RecordField : std::uint8_t {
  kTitle,
  kDescription,
  kCategory,
  kVisibility,
  kTags,
  kCrossIds,
  kGpx,
};

constexpr std::string_view FieldName(RecordField field) {
  switch (field) {
    case RecordField::kTitle:
      return "title";
    case RecordField::kDescription:
      return "description";
    case RecordField::kCategory:
      return "category";
    case RecordField::kVisibility:
      return "public";
    case RecordField::kTags:
      return "keywords";
    case RecordField::kCrossIds:
      return "ids";
    case RecordField::kGpx:
      return "gpx";
  }
  return "unknown";
}

} // namespace tracksync::record
