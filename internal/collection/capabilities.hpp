#pragma once

#include "internal/record/record_field.hpp"

namespace tracksync::collection {

/*
  What a collection type can do, stated by the type itself.

  A field writer lets a record push a single changed attribute instead of
  rewriting everything. Geometry has no field writer.
*/
struct Capabilities {
  bool list       = false;
  bool read_full  = false;
  bool write_full = false;
  bool remove     = false;
  bool rename     = false;

  bool write_title       = false;
  bool write_description = false;
  bool write_category    = false;
  bool write_visibility  = false;
  bool write_tags        = false;
  bool write_cross_ids   = false;

  bool WritesField(record::RecordField field) const {
    switch (field) {
      case record::RecordField::kTitle:
        return write_title;
      case record::RecordField::kDescription:
        return write_description;
      case record::RecordField::kCategory:
        return write_category;
      case record::RecordField::kVisibility:
        return write_visibility;
      case record::RecordField::kTags:
        return write_tags;
      case record::RecordField::kCrossIds:
        return write_cross_ids;
      case record::RecordField::kGpx:
        return false;
    }
    return false;
  }
};

} // namespace tracksync::collection
