#include "recovery_scanner.hpp"

#include <algorithm>

#include "internal/core/orchestrator.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/observability/alerts.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace saga::recovery {

using saga::model::ExecutionStatus;
using observability::IntField;
using observability::ExecutionField;
using observability::StringField;

RecoveryScanner::RecoveryScanner(std::shared_ptr<db::Repository> repository, std::shared_ptr<core::Orchestrator> orchestrator,
                                 std::shared_ptr<observability::AlertSink> alerts, RecoveryOptions options)
    : repository_(std::move(repository)), orchestrator_(std::move(orchestrator)), alerts_(std::move(alerts)), options_(options) {
}

RecoveryScanner::~RecoveryScanner() {
  Stop();
}

void RecoveryScanner::Start() {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&RecoveryScanner::Loop, this);
}

void RecoveryScanner::Stop() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

SweepStats RecoveryScanner::SweepOnce(uint64_t now_ms) {
  db::StaleQuery query;
  query.statuses          = {ExecutionStatus::kStarted, ExecutionStatus::kInProgress, ExecutionStatus::kCompensating};
  query.updated_before_ms = now_ms - std::min<uint64_t>(now_ms, options_.stale_after.count());
  // Rows already alerted stay non-terminal and keep sorting first; widen the
  // page by their count so they cannot fill the batch.
  query.limit = options_.batch_limit + alerted_.size();

  std::vector<db::model::ExecutionRecord> stale;
  {
    auto tx = repository_->Begin();
    stale   = repository_->ListStale(*tx, query);
    tx->Commit();
  }

  const auto alert_after = static_cast<uint64_t>(options_.alert_after.count());

  SweepStats  stats;
  std::size_t handled = 0;
  for (const auto& record : stale) {
    if (handled == options_.batch_limit) break;
    if (alerted_.contains(record.execution_id)) continue;

    ++handled;
    if (now_ms >= record.created_at_ms && now_ms - record.created_at_ms >= alert_after) {
      alerted_.insert(record.execution_id);
      alerts_->Raise({record.execution_id, record.saga_type, std::string(saga::model::ToString(record.status)),
                      "execution stuck non-terminal for " + std::to_string((now_ms - record.created_at_ms) / 1000) + "s"});
      ++stats.alerted;
      continue;
    }

    try {
      orchestrator_->Resume(record.execution_id);
      ++stats.resumed;
    } catch (const std::exception& e) {
      SAGA_LOG_ERROR("recovery resume failed", {ExecutionField(record.execution_id), StringField("error", e.what())});
      ++stats.failed;
    }
  }

  if (!stale.empty()) {
    SAGA_LOG_INFO("recovery sweep", {IntField("stale", static_cast<int64_t>(stale.size())), IntField("resumed", static_cast<int64_t>(stats.resumed)),
                                     IntField("alerted", static_cast<int64_t>(stats.alerted)), IntField("failed", static_cast<int64_t>(stats.failed))});
  }
  return stats;
}

void RecoveryScanner::Loop() {
  while (running_) {
    try {
      SweepOnce(util::NowMillis());
    } catch (const std::exception& e) {
      SAGA_LOG_ERROR("recovery sweep failed", {StringField("error", e.what())});
    }

    std::unique_lock lock(mutex_);
    cv_.wait_for(lock, options_.interval, [this] { return !running_; });
  }
}

} // namespace saga::recovery
