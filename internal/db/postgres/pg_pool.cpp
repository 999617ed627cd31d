#include "pg_pool.hpp"

namespace saga::db::postgres {

namespace {

constexpr const char* kColumns =
    "execution_id,saga_type,status,current_step_index,total_steps,context,retry_count,last_error,failed_step,"
    "failure_reason,cancel_requested,created_at_ms,updated_at_ms,completed_at_ms,version";

} // namespace

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

PgPool::Lease PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  returned_.wait(lock, [this] {
    return !parked_.empty() || opened_ < max_connections_;
  });

  if (!parked_.empty()) {
    auto conn = std::move(parked_.back());
    parked_.pop_back();
    return Lend(conn.release());
  }

  ++opened_;
  lock.unlock();

  try {
    auto conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareExecutionStatements(*conn);
    return Lend(conn.release());
  } catch (...) {
    std::lock_guard rollback_lock(mutex_);
    --opened_;
    returned_.notify_one();
    throw;
  }
}

void PgPool::Bootstrap(const std::vector<std::string>& statements) {
  auto       conn = Acquire();
  pqxx::work tx(*conn);
  for (const auto& statement : statements) {
    tx.exec(statement);
  }
  tx.commit();
}

void PgPool::PrepareExecutionStatements(pqxx::connection& conn) {
  const std::string columns(kColumns);

  conn.prepare("insert_execution",
               "INSERT INTO saga_execution(" + columns + ") "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13,$14,$15) "
               // a failed statement would abort the caller's transaction
               "ON CONFLICT (execution_id) DO NOTHING");

  conn.prepare("get_execution", "SELECT " + columns + " FROM saga_execution WHERE execution_id=$1");

  conn.prepare("update_execution_cas",
               "UPDATE saga_execution SET status=$3,current_step_index=$4,context=$5,retry_count=$6,last_error=$7,"
               "failed_step=$8,failure_reason=$9,cancel_requested=$10,updated_at_ms=$11,completed_at_ms=$12,"
               "version=version+1 WHERE execution_id=$1 AND version=$2");

  conn.prepare("list_by_status",
               "SELECT " + columns + " FROM saga_execution WHERE status=$1 "
               "ORDER BY updated_at_ms ASC, execution_id ASC LIMIT $2");

  conn.prepare("list_stale",
               "SELECT " + columns + " FROM saga_execution WHERE status = ANY(string_to_array($1, ',')) "
               "AND updated_at_ms < $2 ORDER BY updated_at_ms ASC, execution_id ASC LIMIT $3");
}

PgPool::Lease PgPool::Lend(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return Lease(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->GiveBack(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::GiveBack(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    if (conn->is_open()) {
      parked_.emplace_back(conn);
    } else {
      delete conn;
      --opened_;
    }
  }
  returned_.notify_one();
}

} // namespace saga::db::postgres
