#include "gpx_document.hpp"

#include <pugixml.hpp>

#include <charconv>
#include <cstdlib>
#include <sstream>

#include "internal/util/errors.hpp"

namespace tracksync::gpx {

namespace {

constexpr const char* kNamespace = "http://www.topografix.com/GPX/1/1";

std::string FormatNumber(double value) {
  char buf[32];
  auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), value);
  if (ec != std::errc()) {
    throw util::StorageError("cannot format number");
  }
  return std::string(buf, end);
}

std::optional<util::TimePoint> ReadTime(const pugi::xml_node& node) {
  auto time = node.child("time");
  if (!time) {
    return std::nullopt;
  }
  try {
    return util::FromRfc3339(time.child_value());
  } catch (const util::ValidationError& e) {
    throw util::StorageError(std::string("bad GPX time: ") + e.what());
  }
}

void ReadPoint(const pugi::xml_node& node, geo::Point& point) {
  if (!node.attribute("lat") || !node.attribute("lon")) {
    throw util::StorageError(std::string("GPX ") + node.name() + " without lat/lon");
  }
  point.latitude  = node.attribute("lat").as_double();
  point.longitude = node.attribute("lon").as_double();
  if (auto ele = node.child("ele")) {
    point.elevation = std::strtod(ele.child_value(), nullptr);
  }
  point.time = ReadTime(node);
}

void WritePoint(pugi::xml_node node, const geo::Point& point) {
  node.append_attribute("lat") = FormatNumber(point.latitude).c_str();
  node.append_attribute("lon") = FormatNumber(point.longitude).c_str();
  if (point.elevation) {
    node.append_child("ele").text() = FormatNumber(*point.elevation).c_str();
  }
  if (point.time) {
    node.append_child("time").text() = util::ToRfc3339(*point.time).c_str();
  }
}

pugi::xml_node LoadRoot(pugi::xml_document& doc, const std::string& xml) {
  auto result = doc.load_string(xml.c_str());
  if (!result) {
    throw util::StorageError(std::string("cannot parse GPX: ") + result.description() + " at offset " +
                             std::to_string(result.offset));
  }
  auto root = doc.child("gpx");
  if (!root) {
    throw util::StorageError("not a GPX document");
  }
  return root;
}

void ReadHeader(const pugi::xml_node& root, GpxDocument& document) {
  auto metadata        = root.child("metadata");
  document.title       = metadata.child("name").child_value();
  document.description = metadata.child("desc").child_value();
  document.keywords    = metadata.child("keywords").child_value();
  if (document.title.empty()) {
    document.title = root.child("trk").child("name").child_value();
  }
  document.geo.SetFallbackTime(ReadTime(metadata));
}

} // namespace

GpxDocument ParseHeader(const std::string& xml) {
  pugi::xml_document doc;
  auto               root = LoadRoot(doc, xml);

  GpxDocument document;
  ReadHeader(root, document);
  return document;
}

GpxDocument Parse(const std::string& xml) {
  pugi::xml_document doc;
  auto               root = LoadRoot(doc, xml);

  GpxDocument document;
  ReadHeader(root, document);

  for (auto node : root.children("wpt")) {
    geo::Waypoint waypoint;
    ReadPoint(node, waypoint);
    waypoint.name = node.child("name").child_value();
    document.geo.AddWaypoint(std::move(waypoint));
  }

  auto& segments = document.geo.MutableSegments();
  for (auto track : root.children("trk")) {
    for (auto segment_node : track.children("trkseg")) {
      geo::Segment segment;
      for (auto node : segment_node.children("trkpt")) {
        geo::Point point;
        ReadPoint(node, point);
        geo::RoundPosition(point);
        segment.push_back(std::move(point));
      }
      segments.push_back(std::move(segment));
    }
  }
  return document;
}

std::string Serialize(const GpxDocument& document) {
  pugi::xml_document doc;

  auto decl                         = doc.append_child(pugi::node_declaration);
  decl.append_attribute("version")  = "1.0";
  decl.append_attribute("encoding") = "UTF-8";

  auto root                        = doc.append_child("gpx");
  root.append_attribute("version") = "1.1";
  root.append_attribute("creator") = "tracksync";
  root.append_attribute("xmlns")   = kNamespace;

  auto metadata = root.append_child("metadata");
  if (!document.title.empty()) {
    metadata.append_child("name").text() = document.title.c_str();
  }
  if (!document.description.empty()) {
    metadata.append_child("desc").text() = document.description.c_str();
  }
  if (auto first = document.geo.FirstTime()) {
    metadata.append_child("time").text() = util::ToRfc3339(*first).c_str();
  }
  if (!document.keywords.empty()) {
    metadata.append_child("keywords").text() = document.keywords.c_str();
  }

  for (const auto& waypoint : document.geo.Waypoints()) {
    auto node = root.append_child("wpt");
    WritePoint(node, waypoint);
    if (!waypoint.name.empty()) {
      node.append_child("name").text() = waypoint.name.c_str();
    }
  }

  if (!document.geo.Segments().empty()) {
    auto track = root.append_child("trk");
    if (!document.title.empty()) {
      track.append_child("name").text() = document.title.c_str();
    }
    for (const auto& segment : document.geo.Segments()) {
      auto segment_node = track.append_child("trkseg");
      for (const auto& point : segment) {
        WritePoint(segment_node.append_child("trkpt"), point);
      }
    }
  }

  std::ostringstream out;
  doc.save(out, "  ", pugi::format_default, pugi::encoding_utf8);
  return out.str();
}

} // namespace tracksync::gpx
