#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace saga::observability {
namespace {

constexpr const char* kLoggerName     = "saga-orchestrator";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

struct LogSettings {
  std::string level   = "info";
  std::string pattern = kDefaultPattern;
  bool        include_trace_context = false;
};

// Environment beats the config file, which beats the built-in default.
void Override(std::string& target, const std::string& configured, const char* env_name) {
  if (!configured.empty()) target = configured;
  if (const char* env = std::getenv(env_name)) target = env;
}

LogSettings ResolveSettings(const saga::runtime::config::RuntimeConfig& config) {
  LogSettings settings;
  Override(settings.level, config.logging().level(), "SAGA_LOG_LEVEL");
  Override(settings.pattern, config.logging().pattern(), "SAGA_LOG_PATTERN");

  settings.include_trace_context = config.logging().include_trace_context();
  if (const char* env = std::getenv("SAGA_LOG_INCLUDE_TRACE_CONTEXT")) {
    const std::string value(env);
    settings.include_trace_context = value == "1" || value == "true";
  }
  return settings;
}

bool g_include_trace_context{false};

// Values with spaces or quotes are quoted so error messages stay one field.
std::string QuoteIfNeeded(const std::string& value) {
  if (!value.empty() && value.find_first_of(" \"=") == std::string::npos) {
    return value;
  }
  std::string quoted = "\"";
  for (char c : value) {
    if (c == '"' || c == '\\') quoted.push_back('\\');
    quoted.push_back(c);
  }
  quoted.push_back('"');
  return quoted;
}

void AppendFields(std::string& line, std::initializer_list<LogField> fields) {
  for (const auto& field : fields) {
    line.push_back(' ');
    line += field.key;
    line.push_back('=');
    line += QuoteIfNeeded(field.value);
  }
}

#ifdef ENABLE_OTEL
std::string HexId(const uint8_t* data, std::size_t size) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string result;
  result.reserve(size * 2);
  for (std::size_t i = 0; i < size; ++i) {
    result.push_back(kHex[(data[i] >> 4) & 0x0F]);
    result.push_back(kHex[data[i] & 0x0F]);
  }
  return result;
}

std::string TraceContextFields() {
  if (!g_include_trace_context) {
    return {};
  }

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) {
    return {};
  }

  auto context = span->GetContext();
  if (!context.IsValid()) {
    return {};
  }

  auto trace_id = context.trace_id();
  auto span_id  = context.span_id();
  if (trace_id.IsValid() && span_id.IsValid()) {
    uint8_t trace_bytes[16];
    uint8_t span_bytes[8];
    trace_id.CopyBytesTo(trace_bytes);
    span_id.CopyBytesTo(span_bytes);
    return "trace_id=" + HexId(trace_bytes, 16) + " span_id=" + HexId(span_bytes, 8);
  }
  return {};
}
#else
std::string TraceContextFields() {
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

LogField ExecutionField(std::string_view execution_id) {
  return StringField("execution_id", execution_id);
}

void InitializeLogging(const saga::runtime::config::RuntimeConfig& config) {
  const auto settings = ResolveSettings(config);

  // tests and repeated daemon setup replace the previous logger
  spdlog::drop(kLoggerName);
  auto logger = spdlog::stdout_color_mt(kLoggerName);
  logger->set_pattern(settings.pattern);
  logger->set_level(spdlog::level::from_str(settings.level));
  logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(std::move(logger));
  g_include_trace_context = settings.include_trace_context;
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  std::string line(message);
  AppendFields(line, fields);
  if (const auto trace = TraceContextFields(); !trace.empty()) {
    line.push_back(' ');
    line += trace;
  }
  spdlog::log(level, "{}", line);
}

} // namespace saga::observability
