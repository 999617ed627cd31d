#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

namespace saga::runtime::config {
class RuntimeConfig;
}

namespace saga::observability {

// Starts the OTLP exporter named by `tracing` in the runtime config.
// Returns false when tracing is disabled or the build has no OpenTelemetry.
bool InitializeTracing(const saga::runtime::config::RuntimeConfig& config);
void ShutdownTracing();

enum class StepPhase : std::uint8_t { kExecute, kCompensate };

// "saga.step.execute" / "saga.step.compensate"
constexpr std::string_view StepSpanName(StepPhase phase) {
  return phase == StepPhase::kCompensate ? "saga.step.compensate" : "saga.step.execute";
}

struct StepSpanInfo {
  StepPhase        phase = StepPhase::kExecute;
  std::string_view execution_id;
  std::string_view saga_type;
  std::string_view step;
  std::int64_t     step_index = 0;
  // 1-based, counts retries of the same step
  std::int64_t attempt = 1;
};

/*
  Span around one step call, active for its duration so outbound gRPC calls
  made by the step nest under it. Ends when destroyed.

  Inert when tracing was never initialized or the build lacks ENABLE_OTEL.
*/
class StepSpan {
 public:
  explicit StepSpan(const StepSpanInfo& info);
  ~StepSpan();

  StepSpan(const StepSpan&)            = delete;
  StepSpan& operator=(const StepSpan&) = delete;

  // outcome is "retryable" or "terminal"; marks the span as an error
  void Fail(std::string_view outcome, std::string_view message);

  bool Recording() const;

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const saga::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline StepSpan::StepSpan(const StepSpanInfo&) {
}

inline StepSpan::~StepSpan() {
}

inline void StepSpan::Fail(std::string_view, std::string_view) {
}

inline bool StepSpan::Recording() const {
  return false;
}
#endif

} // namespace saga::observability
