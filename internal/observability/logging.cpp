#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace trackmatch::observability {
namespace {

constexpr const char* kLoggerName     = "trackmatch";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

struct LogSettings {
  std::string level{"info"};
  std::string pattern{kDefaultPattern};
  bool        trace_context{false};
};

// Environment beats the config file, which beats the built-in default.
std::string Pick(const char* env, const std::string& configured, const std::string& fallback) {
  if (const char* value = std::getenv(env)) return value;
  return configured.empty() ? fallback : configured;
}

LogSettings Resolve(const trackmatch::runtime::config::LoggingConfig& config) {
  LogSettings settings;
  settings.level   = Pick("TRACKMATCH_LOG_LEVEL", config.level(), settings.level);
  settings.pattern = Pick("TRACKMATCH_LOG_PATTERN", config.pattern(), settings.pattern);

  const auto trace = Pick("TRACKMATCH_LOG_INCLUDE_TRACE_CONTEXT", config.include_trace_context() ? "true" : "", "false");
  settings.trace_context = trace == "1" || trace == "true";
  return settings;
}

bool g_trace_context{false};

bool NeedsQuoting(const std::string& value) {
  return value.empty() || value.find_first_of(" =\"") != std::string::npos;
}

void AppendField(std::ostringstream& out, const LogField& field) {
  out << ' ' << field.key << '=';
  if (NeedsQuoting(field.value)) {
    out << std::quoted(field.value);
  } else {
    out << field.value;
  }
}

#ifdef ENABLE_OTEL
template <size_t N>
std::string Hex(const uint8_t (&bytes)[N]) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string out;
  out.reserve(N * 2);
  for (uint8_t b : bytes) {
    out.push_back(kDigits[b >> 4]);
    out.push_back(kDigits[b & 0x0F]);
  }
  return out;
}

std::vector<LogField> TraceFields() {
  if (!g_trace_context) return {};

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) return {};

  const auto context = span->GetContext();
  if (!context.IsValid()) return {};

  uint8_t trace_id[16];
  uint8_t span_id[8];
  context.trace_id().CopyBytesTo(trace_id);
  context.span_id().CopyBytesTo(span_id);
  return {{"trace_id", Hex(trace_id)}, {"span_id", Hex(span_id)}};
}
#else
std::vector<LogField> TraceFields() {
  return {};
}
#endif

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

LogField DoubleField(std::string_view key, double value) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(2) << value;
  return {std::string(key), out.str()};
}

void InitializeLogging(const trackmatch::runtime::config::RuntimeConfig& config) {
  const auto settings = Resolve(config.logging());

  spdlog::drop(kLoggerName);
  auto logger = spdlog::stdout_color_mt(kLoggerName);
  logger->set_pattern(settings.pattern);
  logger->set_level(spdlog::level::from_str(settings.level));

  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
  g_trace_context = settings.trace_context;
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) return;

  std::ostringstream line;
  line << message;
  for (const auto& field : fields) AppendField(line, field);
  for (const auto& field : TraceFields()) AppendField(line, field);

  spdlog::log(level, "{}", line.str());
}

} // namespace trackmatch::observability
