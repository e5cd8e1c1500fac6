#include "internal/codec/attribute_codec.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using tracksync::codec::Attributes;
using tracksync::codec::Decode;
using tracksync::codec::Encode;

Attributes MakeAttributes(const std::string& category, bool is_public, std::vector<std::string> tags,
                          std::vector<std::string> cross_ids = {}) {
  Attributes attributes;
  attributes.category  = category;
  attributes.is_public = is_public;
  attributes.tags      = std::move(tags);
  attributes.cross_ids = std::move(cross_ids);
  return attributes;
}

void TestEncodeOrdersTagsCategoryStatus() {
  auto attributes = MakeAttributes("Cycling", true, {"berlin"});

  const auto encoded = Encode(attributes);
  assert(encoded == "berlin, Category:Cycling, Status:public");
  assert(Decode(encoded) == attributes);
}

void TestRoundTripKeepsEveryField() {
  const std::vector<Attributes> samples = {
      MakeAttributes("Hiking", false, {}),
      MakeAttributes("Mountain biking", true, {"alps", "gravel", "summer"}),
      MakeAttributes("Sailing", false, {"lake"}, {"mmt:alice/123", "directory:/tracks/a/x"}),
  };
  for (const auto& sample : samples) {
    assert(Decode(Encode(sample)) == sample);
  }
}

void TestIdsComeLastInStoredOrder() {
  auto attributes = MakeAttributes("Walking", false, {"dog"}, {"mmt:bob/7", "gpsies:bob/9"});
  assert(Encode(attributes) == "dog, Category:Walking, Status:private, Id:mmt:bob/7, Id:gpsies:bob/9");
}

void TestDecodeDefaultsWhenReservedEntriesMissing() {
  auto decoded = Decode("  forest ,  ,river");
  assert(decoded.category == tracksync::codec::DefaultCategory());
  assert(!decoded.is_public);
  assert((decoded.tags == std::vector<std::string>{"forest", "river"}));
  assert(decoded.cross_ids.empty());
}

void TestDuplicateReservedEntriesAreRejected() {
  bool threw = false;
  try {
    (void)Decode("Category:Cycling, Category:Hiking");
  } catch (const tracksync::util::DuplicateKeyword&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)Decode("Status:public, Status:private");
  } catch (const tracksync::util::DuplicateKeyword&) {
    threw = true;
  }
  assert(threw);
}

void TestUnknownCategoryAndStatusAreRejected() {
  bool threw = false;
  try {
    (void)Decode("Category:Teleporting");
  } catch (const tracksync::util::ValidationError&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)Decode("Status:secret");
  } catch (const tracksync::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
}

void TestReservedPrefixIsNotATag() {
  bool threw = false;
  try {
    (void)tracksync::codec::CheckTag("Status:public");
  } catch (const tracksync::util::ReservedKeyword&) {
    threw = true;
  }
  assert(threw);
}

void TestNormalizeTags() {
  auto tags = tracksync::codec::NormalizeTags({" zebra", "apple "});
  assert((tags == std::vector<std::string>{"apple", "zebra"}));

  bool threw = false;
  try {
    (void)tracksync::codec::NormalizeTags({"a", " a"});
  } catch (const tracksync::util::ValidationError&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)tracksync::codec::NormalizeTags({"a,b"});
  } catch (const tracksync::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
}

void TestCleanCrossIdsCollapsesAndCaps() {
  const std::vector<std::string> ids = {
      "/tracks/a/1",      // newest
      "/tracks/a/2",      // same origin as the first
      "mmt:alice/5",
      "mmt:alice/5",      // exact duplicate
      "gpsies:alice/7",
      "directory:/b/3",
      "openrunner:alice/9",
  };

  auto cleaned = tracksync::codec::CleanCrossIds(ids);
  assert(cleaned.size() <= tracksync::codec::kMaxCrossIds);
  assert((cleaned == std::vector<std::string>{"/tracks/a/1", "mmt:alice/5", "gpsies:alice/7", "directory:/b/3",
                                              "openrunner:alice/9"}));
}

void TestCheckCrossIds() {
  bool threw = false;
  try {
    tracksync::codec::CheckCrossIds({"a", "b", "c", "d", "e", "f"});
  } catch (const tracksync::util::ValidationError&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    tracksync::codec::CheckCrossIds({"a", "a"});
  } catch (const tracksync::util::ValidationError&) {
    threw = true;
  }
  assert(threw);

  tracksync::codec::CheckCrossIds({"mmt:alice/1", "/tracks/b"});
}

bool Rejected(const std::vector<std::string>& cross_ids) {
  try {
    tracksync::codec::CheckCrossIds(cross_ids);
  } catch (const tracksync::util::ValidationError&) {
    return true;
  }
  return false;
}

// whatever the check lets through must survive a store and reload unchanged
void TestAcceptedCrossIdsSurviveReload() {
  const std::vector<std::vector<std::string>> accepted = {
      {},
      {"mmt:alice/1"},
      {"/tracks/a/1", "mmt:alice/1", "/tracks/b/2"},
      {"directory:/tracks/a/1", "mmt:alice/1", "mmt:alice/2", "gpsies:bob/7", "openrunner:carl/9"},
      {"mmt:alice/my track"},
  };
  for (const auto& cross_ids : accepted) {
    assert(!Rejected(cross_ids));
    auto attributes = MakeAttributes("Cycling", false, {"loop"}, cross_ids);
    assert(Decode(Encode(attributes)) == attributes);
  }

  assert(Rejected({"/tracks/a/1", "/tracks/a/2"}));
  assert(Rejected({"directory:/tracks/a/1", "mmt:x/1", "directory:/tracks/a/3"}));
  assert(Rejected({" mmt:x/1"}));
  assert(Rejected({"mmt:x/1 "}));
  assert(Rejected({""}));
  assert(Rejected({"mmt:x/1,2"}));
}

void TestDirectoryLikeIds() {
  assert(tracksync::codec::IsDirectoryLike("directory:/tracks/x"));
  assert(tracksync::codec::IsDirectoryLike("/tracks/x"));
  assert(!tracksync::codec::IsDirectoryLike("mmt:alice/1"));
  assert(tracksync::codec::CrossIdOrigin("/tracks/a/1") == "/tracks/a");
}

} // namespace

int main() {
  TestEncodeOrdersTagsCategoryStatus();
  TestRoundTripKeepsEveryField();
  TestIdsComeLastInStoredOrder();
  TestDecodeDefaultsWhenReservedEntriesMissing();
  TestDuplicateReservedEntriesAreRejected();
  TestUnknownCategoryAndStatusAreRejected();
  TestReservedPrefixIsNotATag();
  TestNormalizeTags();
  TestCleanCrossIdsCollapsesAndCaps();
  TestCheckCrossIds();
  TestAcceptedCrossIdsSurviveReload();
  TestDirectoryLikeIds();

  std::cout << "tracksync_unit_attribute_codec: pass\n";
  return 0;
}
