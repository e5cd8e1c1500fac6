#include "record_source.hpp"

namespace tracksync::diff {

namespace {

void FlattenInto(const RecordSource& source, std::vector<RecordPtr>& out) {
  if (const auto* record = std::get_if<RecordPtr>(&source.value)) {
    if (*record) {
      out.push_back(*record);
    }
  } else if (const auto* collection = std::get_if<CollectionPtr>(&source.value)) {
    if (*collection) {
      const auto& records = (*collection)->Records();
      out.insert(out.end(), records.begin(), records.end());
    }
  } else {
    for (const auto& nested : std::get<std::vector<RecordSource>>(source.value)) {
      FlattenInto(nested, out);
    }
  }
}

} // namespace

RecordSource::RecordSource(const std::vector<RecordPtr>& records) : value(std::vector<RecordSource>{}) {
  auto& nested = std::get<std::vector<RecordSource>>(value);
  nested.reserve(records.size());
  for (const auto& record : records) {
    nested.emplace_back(record);
  }
}

std::vector<RecordPtr> Flatten(const RecordSource& source) {
  std::vector<RecordPtr> out;
  FlattenInto(source, out);
  return out;
}

} // namespace tracksync::diff
