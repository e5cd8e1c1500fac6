#include "internal/observability/logging.hpp"

#include <array>
#include <cstdio>
#include <cstdlib>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"
#include "internal/util/errors.hpp"

namespace tracksync::observability {
namespace {

constexpr const char* kLoggerName     = "tracksync";
constexpr const char* kDefaultLevel   = "info";
constexpr const char* kDefaultPattern = "%Y-%m-%d %H:%M:%S.%e [%^%l%$] %v";

constexpr std::array<std::string_view, 7> kLevelNames = {"trace", "debug", "info", "warn", "err", "critical", "off"};

// environment first, then config, then fallback
std::string Setting(const char* env, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(env)) {
    return value;
  }
  return configured.empty() ? fallback : configured;
}

spdlog::level::level_enum ParseLevel(const std::string& name) {
  for (auto known : kLevelNames) {
    if (name == known) {
      return spdlog::level::from_str(name);
    }
  }
  // spdlog maps unknown names to "off", which would silence everything
  throw util::ValidationError("unknown log level: " + name);
}

void AppendValue(std::string& out, const std::string& value) {
  if (value.find_first_of(" \t\"=") == std::string::npos) {
    out += value;
    return;
  }
  out += '"';
  for (char c : value) {
    if (c == '"' || c == '\\') {
      out += '\\';
    }
    out += c;
  }
  out += '"';
}

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

LogField DoubleField(std::string_view key, double value, int digits) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.*f", digits, value);
  return {std::string(key), buf};
}

void InitializeLogging(const tracksync::runtime::config::RuntimeConfig& config) {
  const auto level   = ParseLevel(Setting("TRACKSYNC_LOG_LEVEL", config.logging().level(), kDefaultLevel));
  const auto pattern = Setting("TRACKSYNC_LOG_PATTERN", config.logging().pattern(), kDefaultPattern);

  auto logger = spdlog::get(kLoggerName);
  if (!logger) {
    logger = spdlog::stdout_color_mt(kLoggerName);
  }
  logger->set_pattern(pattern);
  logger->set_level(level);
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
}

bool ShouldLog(spdlog::level::level_enum level) {
  return spdlog::default_logger_raw()->should_log(level);
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!ShouldLog(level)) {
    return;
  }
  std::string line(message);
  for (const auto& field : fields) {
    line += ' ';
    line += field.key;
    line += '=';
    AppendValue(line, field.value);
  }
  spdlog::log(level, "{}", line);
}

} // namespace tracksync::observability
