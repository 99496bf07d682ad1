#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace trackmatch::runtime::config {
class RuntimeConfig;
}

namespace trackmatch::observability {

/*
  Structured logging on spdlog.

  Lines read `<message> key=value ...`; values with spaces, '=' or quotes
  are quoted. Trace and span ids are appended when OpenTelemetry is on and
  logging.include_trace_context is set.
*/
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);
LogField DoubleField(std::string_view key, double value);

void InitializeLogging(const trackmatch::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

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

} // namespace trackmatch::observability

#define TRACKMATCH_LOG_DEBUG(message, ...) ::trackmatch::observability::LogDebug((message), ##__VA_ARGS__)
#define TRACKMATCH_LOG_INFO(message, ...) ::trackmatch::observability::LogInfo((message), ##__VA_ARGS__)
#define TRACKMATCH_LOG_WARN(message, ...) ::trackmatch::observability::LogWarn((message), ##__VA_ARGS__)
#define TRACKMATCH_LOG_ERROR(message, ...) ::trackmatch::observability::LogError((message), ##__VA_ARGS__)
