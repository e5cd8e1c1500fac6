#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace tracksync::runtime::config {
class RuntimeConfig;
}

namespace tracksync::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);
LogField DoubleField(std::string_view key, double value, int digits = 3);

/*
  Installs the "tracksync" logger as spdlog default.

  Level and pattern come from the config section; TRACKSYNC_LOG_LEVEL and
  TRACKSYNC_LOG_PATTERN override it. An unknown level name is a
  ValidationError. Safe to call again; the logger is reconfigured.
*/
void InitializeLogging(const tracksync::runtime::config::RuntimeConfig& config);

// For call sites whose fields cost I/O to compute (record identifiers may load).
bool ShouldLog(spdlog::level::level_enum level);

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogDebug(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::debug, message, fields);
}

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace tracksync::observability

#define TRACKSYNC_LOG_DEBUG(message, ...) ::tracksync::observability::LogDebug((message), ##__VA_ARGS__)
#define TRACKSYNC_LOG_INFO(message, ...) ::tracksync::observability::LogInfo((message), ##__VA_ARGS__)
#define TRACKSYNC_LOG_WARN(message, ...) ::tracksync::observability::LogWarn((message), ##__VA_ARGS__)
#define TRACKSYNC_LOG_ERROR(message, ...) ::tracksync::observability::LogError((message), ##__VA_ARGS__)
