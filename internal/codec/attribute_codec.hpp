#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace tracksync::codec {

/*
  Attribute codec.

  Storage formats carry a single free text keyword field. Category,
  visibility and cross ids are multiplexed into it as reserved entries:

    berlin, Category:Cycling, Status:public, Id:directory:/tracks/a

  Plain tags come first (sorted), then Category, then Status, then Ids
  in their stored order.
*/

constexpr std::string_view kCategoryPrefix = "Category:";
constexpr std::string_view kStatusPrefix   = "Status:";
constexpr std::string_view kIdPrefix       = "Id:";

// Highest number of cross ids a record remembers.
constexpr std::size_t kMaxCrossIds = 5;

// Legal categories. The first one is the default.
const std::vector<std::string>& Categories();
const std::string&              DefaultCategory();
bool                            IsCategory(const std::string& category);

struct Attributes {
  std::string              category = DefaultCategory();
  bool                     is_public = false;
  std::vector<std::string> cross_ids;
  std::vector<std::string> tags;

  bool operator==(const Attributes&) const = default;
};

std::string Encode(const Attributes& attributes);

// Throws DuplicateKeyword for a repeated Category or Status entry and
// ValidationError for unknown categories or status values.
Attributes Decode(const std::string& raw);

// ------------------------------------------------------------------
// Validation helpers shared with Record setters
// ------------------------------------------------------------------

// Returns the trimmed tag. Throws ReservedKeyword or ValidationError.
std::string CheckTag(std::string_view tag);

// CheckTag on each, rejects duplicates, returns them sorted.
std::vector<std::string> NormalizeTags(const std::vector<std::string>& tags);

/*
  Throws ValidationError unless Decode(Encode()) would give the list back
  unchanged: at most kMaxCrossIds, no duplicates, no empty or padded ids,
  no commas and at most one id per directory-like origin.
*/
void CheckCrossIds(const std::vector<std::string>& cross_ids);

// Part of a cross id before the last '/'.
std::string CrossIdOrigin(const std::string& cross_id);

// True for ids of directory collections: "directory:" scheme or a bare path.
bool IsDirectoryLike(const std::string& cross_id);

/*
  Drops exact duplicates, keeps only the first (newest) id per
  directory-like origin and caps the list at kMaxCrossIds.
*/
std::vector<std::string> CleanCrossIds(const std::vector<std::string>& cross_ids);

std::string Trim(std::string_view text);

} // namespace tracksync::codec
