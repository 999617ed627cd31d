#pragma once

#include <memory>
#include <string>

namespace saga::runtime::config {
class RuntimeConfig;
}

namespace saga::observability {

/*
  Operator alert channel.

  Raised when an execution needs a human: compensation gave up, or an
  execution stayed non-terminal past the alert threshold.
*/
struct Alert {
  std::string execution_id;
  std::string saga_type;
  std::string status;
  std::string reason;
};

class AlertSink {
 public:
  virtual ~AlertSink() = default;

  virtual void Raise(const Alert& alert) = 0;
};

/*
  Writes alerts at critical level to a dedicated "saga-alerts" logger
  (stderr, plus an optional file).
*/
class LogAlertSink final : public AlertSink {
 public:
  LogAlertSink();
  explicit LogAlertSink(const saga::runtime::config::RuntimeConfig& config);

  void Raise(const Alert& alert) override;
};

} // namespace saga::observability
