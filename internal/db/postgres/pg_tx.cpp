#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace saga::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool) : conn_(pool->Acquire()), work_(std::make_unique<pqxx::work>(*conn_)) {
}

PgTransaction::~PgTransaction() {
  if (!open_) return;
  try {
    work_->abort();
  } catch (const std::exception& e) {
    SAGA_LOG_WARN("postgres execution transaction left open", {observability::StringField("error", e.what())});
  }
}

void PgTransaction::Commit() {
  open_ = false;
  try {
    work_->commit();
  } catch (const pqxx::serialization_failure& e) {
    throw util::Conflict(std::string("execution store commit lost a race: ") + e.what());
  }
}

void PgTransaction::Rollback() {
  open_ = false;
  work_->abort();
}

} // namespace saga::db::postgres
