#include "pg_repository.hpp"

#include <stdexcept>

namespace saga::db::postgres {

namespace {

model::ExecutionRecord ReadRow(const pqxx::row& row) {
  model::ExecutionRecord r;
  r.execution_id = row[0].c_str();
  r.saga_type    = row[1].c_str();

  const std::string status_text = row[2].c_str();
  const auto        status      = saga::model::ParseStatus(status_text);
  if (!status) throw std::runtime_error("execution " + r.execution_id + " has unknown status '" + status_text + "'");
  r.status = *status;

  r.current_step_index = row[3].as<int32_t>();
  r.total_steps        = row[4].as<int32_t>();
  r.context            = row[5].c_str();
  r.retry_count        = row[6].as<uint32_t>();
  r.last_error         = row[7].c_str();
  r.failed_step        = row[8].c_str();
  r.failure_reason     = row[9].c_str();
  r.cancel_requested   = row[10].as<bool>();
  r.created_at_ms      = row[11].as<uint64_t>();
  r.updated_at_ms      = row[12].as<uint64_t>();
  r.completed_at_ms    = row[13].as<uint64_t>();
  r.version            = row[14].as<uint64_t>();
  return r;
}

std::vector<model::ExecutionRecord> ReadAll(const pqxx::result& res) {
  std::vector<model::ExecutionRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadRow(row));
  }
  return out;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) return Result::Err(ErrorCode::AlreadyExists, e.what());
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) return Result::Err(ErrorCode::ConstraintViolation, e.what());
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) return Result::Err(ErrorCode::SerializationFailure, e.what());
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) return Result::Err(ErrorCode::IOError, e.what());
  return Result::Err(ErrorCode::InternalError, e.what());
}

Result PgRepository::InsertExecution(Transaction& t, const model::ExecutionRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("insert_execution", r.execution_id, r.saga_type, std::string(saga::model::ToString(r.status)),
                                          r.current_step_index, r.total_steps, r.context, r.retry_count, r.last_error, r.failed_step,
                                          r.failure_reason, r.cancel_requested, r.created_at_ms, r.updated_at_ms, r.completed_at_ms, r.version);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::AlreadyExists, "execution " + r.execution_id + " already exists");
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ExecutionRecord> PgRepository::GetExecution(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("get_execution", id);
  if (res.empty()) return std::nullopt;
  return ReadRow(res[0]);
}

Result PgRepository::UpdateExecution(Transaction& t, model::ExecutionRecord& r, uint64_t expected_version) {
  try {
    auto res = TX(t).Work().exec_prepared("update_execution_cas", r.execution_id, expected_version,
                                          std::string(saga::model::ToString(r.status)), r.current_step_index, r.context,
                                          r.retry_count, r.last_error, r.failed_step, r.failure_reason, r.cancel_requested,
                                          r.updated_at_ms, r.completed_at_ms);
    if (res.affected_rows() == 0) {
      if (!GetExecution(t, r.execution_id)) return Result::Err(ErrorCode::NotFound, "execution " + r.execution_id + " not found");
      return Result::Err(ErrorCode::Conflict, "execution " + r.execution_id + " moved past version " + std::to_string(expected_version));
    }
    r.version = expected_version + 1;
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::ExecutionRecord> PgRepository::ListByStatus(Transaction& t, saga::model::ExecutionStatus status, std::size_t limit) {
  return ReadAll(TX(t).Work().exec_prepared("list_by_status", std::string(saga::model::ToString(status)), static_cast<int64_t>(limit)));
}

std::vector<model::ExecutionRecord> PgRepository::ListStale(Transaction& t, const StaleQuery& query) {
  if (query.statuses.empty()) return {};

  std::string statuses;
  for (auto status : query.statuses) {
    if (!statuses.empty()) statuses += ",";
    statuses += saga::model::ToString(status);
  }
  return ReadAll(TX(t).Work().exec_prepared("list_stale", statuses, query.updated_before_ms, static_cast<int64_t>(query.limit)));
}

} // namespace saga::db::postgres
