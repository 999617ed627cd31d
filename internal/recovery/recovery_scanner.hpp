#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_set>

namespace saga::db {
class Repository;
}

namespace saga::core {
class Orchestrator;
}

namespace saga::observability {
class AlertSink;
}

namespace saga::recovery {

struct RecoveryOptions {
  std::chrono::milliseconds interval{std::chrono::seconds(30)};
  // Non-terminal records untouched for this long are resumed.
  std::chrono::milliseconds stale_after{std::chrono::minutes(1)};
  // Records created this long ago and still non-terminal alert instead.
  std::chrono::milliseconds alert_after{std::chrono::minutes(30)};
  std::size_t               batch_limit = 100;
};

struct SweepStats {
  std::size_t resumed = 0;
  std::size_t alerted = 0;
  std::size_t failed  = 0;
};

/*
  Periodically re-drives executions left non-terminal by a crash or an
  abandoned write. Uses Orchestrator::Resume, the same path as any other
  advance.
*/
class RecoveryScanner {
 public:
  RecoveryScanner(std::shared_ptr<db::Repository> repository, std::shared_ptr<core::Orchestrator> orchestrator,
                  std::shared_ptr<observability::AlertSink> alerts, RecoveryOptions options);
  ~RecoveryScanner();

  void Start();
  void Stop();

  SweepStats SweepOnce(uint64_t now_ms);

 private:
  void Loop();

  std::shared_ptr<db::Repository>           repository_;
  std::shared_ptr<core::Orchestrator>       orchestrator_;
  std::shared_ptr<observability::AlertSink> alerts_;
  RecoveryOptions                           options_;

  // executions already alerted by this process
  std::unordered_set<std::string> alerted_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  std::thread             thread_;
  std::atomic<bool>       running_{false};
};

} // namespace saga::recovery
