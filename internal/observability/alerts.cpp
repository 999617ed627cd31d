#include "internal/observability/alerts.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <vector>

#include "config/config.pb.h"

namespace saga::observability {
namespace {

constexpr const char* kAlertLogger = "saga-alerts";

std::shared_ptr<spdlog::logger> AlertLogger(const std::string& file_path) {
  if (auto existing = spdlog::get(kAlertLogger)) {
    if (file_path.empty()) return existing;
    spdlog::drop(kAlertLogger);
  }

  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  if (!file_path.empty()) {
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(file_path));
  }

  auto logger = std::make_shared<spdlog::logger>(kAlertLogger, sinks.begin(), sinks.end());
  logger->set_level(spdlog::level::critical);
  logger->flush_on(spdlog::level::critical);
  spdlog::register_logger(logger);
  return logger;
}

} // namespace

LogAlertSink::LogAlertSink() {
  AlertLogger({});
}

LogAlertSink::LogAlertSink(const saga::runtime::config::RuntimeConfig& config) {
  AlertLogger(config.logging().alert_log_path());
}

void LogAlertSink::Raise(const Alert& alert) {
  AlertLogger({})->critical("SAGA ALERT execution_id={} saga_type={} status={} reason=\"{}\"", alert.execution_id, alert.saga_type, alert.status,
                            alert.reason);
}

} // namespace saga::observability
