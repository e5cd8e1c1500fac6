#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <set>

#include "internal/geo/point.hpp"
#include "internal/util/errors.hpp"

namespace tracksync::config {

using tracksync::runtime::config::RuntimeConfig;

namespace {

constexpr uint32_t kDefaultSimilarMinPositions = 100;
constexpr uint32_t kDefaultPositionDigits      = 4;

// Scalars become bool, number or string. Quoted scalars (tag "!") stay strings.
void ToValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      return;

    case YAML::NodeType::Scalar: {
      const std::string& scalar = node.Scalar();
      if (node.Tag() == "!") {
        value->set_string_value(scalar);
      } else if (scalar == "true" || scalar == "false") {
        value->set_bool_value(scalar == "true");
      } else {
        char*        end    = nullptr;
        const double number = std::strtod(scalar.c_str(), &end);
        if (!scalar.empty() && end && *end == '\0') {
          value->set_number_value(number);
        } else {
          value->set_string_value(scalar);
        }
      }
      return;
    }

    case YAML::NodeType::Sequence:
      for (const auto& item : node) {
        ToValue(item, value->mutable_list_value()->add_values());
      }
      return;

    case YAML::NodeType::Map:
      for (const auto& entry : node) {
        ToValue(entry.second, &(*value->mutable_struct_value()->mutable_fields())[entry.first.Scalar()]);
      }
      return;

    case YAML::NodeType::Undefined:
      break;
  }
  throw util::ValidationError("unsupported YAML node");
}

void Validate(const RuntimeConfig& config) {
  std::set<std::string> names;
  for (const auto& collection : config.collections()) {
    if (!collection.name().empty() && !names.insert(collection.name()).second) {
      throw util::ValidationError("duplicate collection name: " + collection.name());
    }
  }
  if (config.merge().position_digits() > static_cast<uint32_t>(geo::kPositionDigits)) {
    throw util::ValidationError("merge.position_digits above stored precision of " +
                                std::to_string(geo::kPositionDigits));
  }
}

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw util::ValidationError("Failed to load YAML config " + path + ": " + e.what());
  }

  google::protobuf::Value value;
  ToValue(yaml, &value);

  std::string json;
  auto        to_json = google::protobuf::util::MessageToJsonString(value, &json);
  if (!to_json.ok()) {
    throw util::ValidationError("Failed to serialize YAML to JSON: " + std::string(to_json.message()));
  }

  RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto parsed = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!parsed.ok()) {
    throw util::ValidationError("Invalid configuration " + path + ": " + std::string(parsed.message()));
  }

  Validate(config);
  ApplyDefaults(config);
  return config;
}

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  if (config.diff().similar_min_positions() == 0) {
    config.mutable_diff()->set_similar_min_positions(kDefaultSimilarMinPositions);
  }
  if (config.merge().position_digits() == 0) {
    config.mutable_merge()->set_position_digits(kDefaultPositionDigits);
  }
}

} // namespace tracksync::config
