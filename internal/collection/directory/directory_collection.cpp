#include "directory_collection.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace tracksync::collection::directory {

namespace fs = std::filesystem;

namespace {

constexpr const char* kSuffix = ".gpx";

fs::path Prepare(const fs::path& path) {
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) {
    throw util::StorageError("cannot create " + path.string() + ": " + ec.message());
  }
  return fs::absolute(path).lexically_normal();
}

} // namespace

DirectoryCollection::DirectoryCollection(const fs::path& path)
    : Collection("directory:" + Prepare(path).string(), DeclaredCapabilities()), path_(Prepare(path)) {
}

Capabilities DirectoryCollection::DeclaredCapabilities() {
  Capabilities caps;
  caps.list       = true;
  caps.read_full  = true;
  caps.write_full = true;
  caps.remove     = true;
  caps.rename     = true;
  return caps;
}

fs::path DirectoryCollection::FileFor(const std::string& identity) const {
  return path_ / (identity + kSuffix);
}

std::string DirectoryCollection::Unique(const std::string& wanted) const {
  if (!fs::exists(FileFor(wanted))) {
    return wanted;
  }
  for (int n = 1;; ++n) {
    auto candidate = wanted + "." + std::to_string(n);
    if (!fs::exists(FileFor(candidate))) {
      return candidate;
    }
  }
}

std::string DirectoryCollection::NameFor(const gpx::GpxDocument& document) const {
  std::string name = document.title;
  if (name.empty()) {
    auto first = document.geo.FirstTime();
    name       = first ? util::FormatDateTime(*first) : "track";
  }
  std::replace(name.begin(), name.end(), '/', '_');
  return name;
}

std::string DirectoryCollection::ReadFile(const std::string& identity) const {
  std::ifstream in(FileFor(identity), std::ios::binary);
  if (!in) {
    throw util::NotFound(Identifier(identity));
  }
  std::ostringstream content;
  content << in.rdbuf();
  if (in.bad()) {
    throw util::StorageError("cannot read " + FileFor(identity).string());
  }
  return content.str();
}

void DirectoryCollection::WriteFile(const std::string& identity, const std::string& content) const {
  const auto target = FileFor(identity);
  auto       temp   = target;
  temp += ".tmp";

  {
    std::ofstream out(temp, std::ios::binary | std::ios::trunc);
    out << content;
    out.close();
    if (!out) {
      throw util::StorageError("cannot write " + temp.string());
    }
  }

  std::error_code ec;
  fs::rename(temp, target, ec);
  if (ec) {
    throw util::StorageError("cannot move " + temp.string() + " to " + target.string() + ": " + ec.message());
  }
}

// ------------------------------------------------------------------
// Hooks
// ------------------------------------------------------------------

std::vector<RecordPtr> DirectoryCollection::LoadHeaders() {
  std::vector<fs::path> files;
  std::error_code       ec;
  for (const auto& entry : fs::directory_iterator(path_, ec)) {
    if (entry.is_regular_file() && entry.path().extension() == kSuffix) {
      files.push_back(entry.path());
    }
  }
  if (ec) {
    throw util::StorageError("cannot list " + path_.string() + ": " + ec.message());
  }
  std::sort(files.begin(), files.end());

  std::vector<RecordPtr> result;
  for (const auto& file : files) {
    const auto identity = file.stem().string();
    auto       document = gpx::ParseHeader(ReadFile(identity));

    record::Header header;
    header.title       = document.title;
    header.description = document.description;
    header.time        = document.geo.FirstTime();
    try {
      auto attributes  = codec::Decode(document.keywords);
      header.category  = attributes.category;
      header.is_public = attributes.is_public;
    } catch (const util::ValidationError& e) {
      throw util::StorageError(file.string() + ": " + e.what());
    }
    result.push_back(NewHeaderRecord(identity, std::move(header)));
  }
  return result;
}

void DirectoryCollection::ReadFull(Record& record) {
  Populate(record, gpx::Parse(ReadFile(record.Identity().value_or(""))));
}

std::string DirectoryCollection::WriteFull(Record& record) {
  auto document = Snapshot(record);
  auto identity = record.Identity() ? *record.Identity() : Unique(NameFor(document));
  WriteFile(identity, gpx::Serialize(document));
  return identity;
}

void DirectoryCollection::RemoveIdentity(const std::string& identity) {
  std::error_code ec;
  if (!fs::remove(FileFor(identity), ec)) {
    if (ec) {
      throw util::StorageError("cannot remove " + FileFor(identity).string() + ": " + ec.message());
    }
    throw util::NotFound(Identifier(identity));
  }
}

std::string DirectoryCollection::ChangeIdentity(Record& record, const std::string& new_identity) {
  auto unique = Unique(new_identity);

  std::error_code ec;
  fs::rename(FileFor(*record.Identity()), FileFor(unique), ec);
  if (ec) {
    throw util::StorageError("cannot rename " + *record.Identity() + " to " + unique + ": " + ec.message());
  }
  return unique;
}

} // namespace tracksync::collection::directory
