#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/model/execution_record.hpp"
#include "internal/db/sql/schema.hpp"
#include "internal/util/errors.hpp"

#if SAGA_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

#if SAGA_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace {

using saga::db::ErrorCode;
using saga::db::Repository;
using saga::db::StaleQuery;
using saga::db::memory::MemoryRepository;
using saga::db::model::ExecutionRecord;
using saga::model::ExecutionStatus;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
  bool                                              supports_parallel_transactions = true;
};

ExecutionRecord MakeRecord(const std::string& id, ExecutionStatus status = ExecutionStatus::kStarted, uint64_t updated_at_ms = 0) {
  ExecutionRecord record;
  record.execution_id       = id;
  record.saga_type          = "CreateOrderSaga";
  record.status             = status;
  record.current_step_index = 0;
  record.total_steps        = 3;
  record.context            = R"({"values":{"order":"{\"orderId\":\"o-1\"}"}})";
  record.created_at_ms      = updated_at_ms == 0 ? NowMs() : updated_at_ms;
  record.updated_at_ms      = record.created_at_ms;
  record.version            = 1;
  return record;
}

void VerifyInsertGetUpdate(Repository& repo, const std::string& id) {
  auto tx = repo.Begin();

  auto record = MakeRecord(id);
  assert(repo.InsertExecution(*tx, record));

  auto duplicate = repo.InsertExecution(*tx, record);
  assert(!duplicate);
  assert(duplicate.code == ErrorCode::AlreadyExists);

  auto loaded = repo.GetExecution(*tx, id);
  assert(loaded.has_value());
  assert(loaded->status == ExecutionStatus::kStarted);
  assert(loaded->context == record.context);

  loaded->status             = ExecutionStatus::kCompensating;
  loaded->current_step_index = 1;
  loaded->retry_count        = 2;
  loaded->last_error         = "payment declined: card";
  loaded->failed_step        = "ProcessPayment";
  loaded->failure_reason     = "payment declined: card";
  loaded->cancel_requested   = true;
  assert(repo.UpdateExecution(*tx, *loaded, 1));
  assert(loaded->version == 2);
  tx->Commit();

  auto verify_tx = repo.Begin();
  auto stored    = repo.GetExecution(*verify_tx, id);
  assert(stored.has_value());
  assert(stored->version == 2);
  assert(stored->status == ExecutionStatus::kCompensating);
  assert(stored->current_step_index == 1);
  assert(stored->total_steps == 3);
  assert(stored->retry_count == 2);
  assert(stored->failed_step == "ProcessPayment");
  assert(stored->failure_reason == "payment declined: card");
  assert(stored->cancel_requested);
  assert(stored->completed_at_ms == 0);
  verify_tx->Commit();
}

void VerifyNegativeIndexRoundTrips(Repository& repo, const std::string& id) {
  auto tx     = repo.Begin();
  auto record = MakeRecord(id, ExecutionStatus::kCompensating);
  assert(repo.InsertExecution(*tx, record));

  record.status             = ExecutionStatus::kCompensated;
  record.current_step_index = saga::model::kCompensatedIndex;
  record.completed_at_ms    = NowMs();
  assert(repo.UpdateExecution(*tx, record, 1));
  tx->Commit();

  auto read_tx = repo.Begin();
  auto stored  = repo.GetExecution(*read_tx, id);
  assert(stored.has_value());
  assert(stored->current_step_index == -1);
  assert(stored->completed_at_ms == record.completed_at_ms);
  read_tx->Commit();
}

void VerifyCompareAndSet(Repository& repo, const std::string& id) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertExecution(*tx, MakeRecord(id)));
    tx->Commit();
  }

  auto tx     = repo.Begin();
  auto record = repo.GetExecution(*tx, id).value();
  record.status = ExecutionStatus::kInProgress;

  auto stale = repo.UpdateExecution(*tx, record, 7);
  assert(!stale);
  assert(stale.code == ErrorCode::Conflict);

  auto missing_record         = record;
  missing_record.execution_id = id + "-missing";
  auto missing                = repo.UpdateExecution(*tx, missing_record, 1);
  assert(!missing);
  assert(missing.code == ErrorCode::NotFound);

  assert(repo.UpdateExecution(*tx, record, 1));
  // the first writer moved the version on
  record.current_step_index = 1;
  assert(repo.UpdateExecution(*tx, record, 1).code == ErrorCode::Conflict);
  assert(repo.UpdateExecution(*tx, record, 2));
  tx->Commit();

  auto read_tx = repo.Begin();
  assert(repo.GetExecution(*read_tx, id)->version == 3);
  read_tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& id) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertExecution(*tx, MakeRecord(id)));
    tx->Rollback();
  }

  {
    auto tx = repo.Begin();
    assert(!repo.GetExecution(*tx, id).has_value());
    assert(repo.InsertExecution(*tx, MakeRecord(id)));
    // destroyed without Commit
  }

  auto tx = repo.Begin();
  assert(!repo.GetExecution(*tx, id).has_value());
  tx->Commit();
}

void VerifyConcurrentUpdates(Repository& repo, const std::string& id, bool supports_parallel_transactions) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertExecution(*tx, MakeRecord(id, ExecutionStatus::kInProgress)));
    tx->Commit();
  }

  if (!supports_parallel_transactions) {
    // a single connection serializes writers; CAS alone decides the race
    for (int writer = 0; writer < 2; ++writer) {
      auto tx     = repo.Begin();
      auto record = repo.GetExecution(*tx, id).value();
      record.current_step_index += 1;
      const auto result = repo.UpdateExecution(*tx, record, 1);
      assert(static_cast<bool>(result) == (writer == 0));
      tx->Commit();
    }
    return;
  }

  auto tx1 = repo.Begin();
  auto tx2 = repo.Begin();

  auto first  = repo.GetExecution(*tx1, id).value();
  auto second = repo.GetExecution(*tx2, id).value();
  first.current_step_index  = 1;
  second.cancel_requested   = true;

  assert(repo.UpdateExecution(*tx1, first, 1));
  tx1->Commit();

  // the second writer either fails the CAS or fails at commit
  bool lost = false;
  try {
    auto result = repo.UpdateExecution(*tx2, second, 1);
    if (!result) {
      assert(result.code == ErrorCode::Conflict);
      lost = true;
      tx2->Rollback();
    } else {
      tx2->Commit();
    }
  } catch (const saga::util::Conflict&) {
    lost = true;
  }
  assert(lost);

  auto verify_tx = repo.Begin();
  auto final     = repo.GetExecution(*verify_tx, id);
  assert(final.has_value());
  assert(final->version == 2);
  assert(final->current_step_index == 1);
  assert(!final->cancel_requested);
  verify_tx->Commit();
}

void VerifyStatusAndStaleQueries(Repository& repo, const std::string& prefix) {
  const uint64_t base = 1'000'000;
  {
    auto tx = repo.Begin();
    assert(repo.InsertExecution(*tx, MakeRecord(prefix + "-a", ExecutionStatus::kInProgress, base + 30)));
    assert(repo.InsertExecution(*tx, MakeRecord(prefix + "-b", ExecutionStatus::kInProgress, base + 10)));
    assert(repo.InsertExecution(*tx, MakeRecord(prefix + "-c", ExecutionStatus::kCompensating, base + 20)));
    assert(repo.InsertExecution(*tx, MakeRecord(prefix + "-d", ExecutionStatus::kCompleted, base + 5)));
    assert(repo.InsertExecution(*tx, MakeRecord(prefix + "-e", ExecutionStatus::kStarted, base + 500)));
    tx->Commit();
  }

  auto tx = repo.Begin();

  // postgres keeps rows from earlier runs; look only at this run's ids
  const auto ours = [&prefix](const std::vector<ExecutionRecord>& records) {
    std::vector<std::string> ids;
    for (const auto& record : records) {
      if (record.execution_id.rfind(prefix, 0) == 0) ids.push_back(record.execution_id);
    }
    return ids;
  };

  auto ids = ours(repo.ListByStatus(*tx, ExecutionStatus::kInProgress, 1000));
  assert((ids == std::vector<std::string>{prefix + "-b", prefix + "-a"}));

  StaleQuery query;
  query.statuses          = {ExecutionStatus::kStarted, ExecutionStatus::kInProgress, ExecutionStatus::kCompensating};
  query.updated_before_ms = base + 100;
  query.limit             = 1000;
  ids                     = ours(repo.ListStale(*tx, query));
  // oldest first; terminal and recently touched records are excluded
  assert((ids == std::vector<std::string>{prefix + "-b", prefix + "-c", prefix + "-a"}));

  query.limit = 2;
  assert(repo.ListStale(*tx, query).size() == 2);

  query.statuses = {ExecutionStatus::kCompensating};
  query.limit    = 1000;
  assert((ours(repo.ListStale(*tx, query)) == std::vector<std::string>{prefix + "-c"}));
  tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& id) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto tx     = repo->Begin();
    auto record = MakeRecord(id, ExecutionStatus::kInProgress);
    record.current_step_index = 1;
    record.version            = 11;
    assert(repo->InsertExecution(*tx, record));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  auto r  = repo->GetExecution(*tx, id);
  assert(r.has_value());
  assert(r->version == 11);
  assert(r->status == ExecutionStatus::kInProgress);
  assert(r->current_step_index == 1);
  tx->Commit();

  backend.cleanup();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name                           = "memory",
      .make_repository                = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart               = []() { return false; },
      .restart                        = [](std::shared_ptr<Repository>&) {},
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
  };
}

#if SAGA_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("saga_orchestrator_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<saga::db::sqlite::SqliteDB>(db_path);
    for (const auto& sql : saga::db::sql::SqliteSchema()) {
      db->Exec(sql);
    }
    return std::make_shared<saga::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name                           = "sqlite",
      .make_repository                = make_repo,
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup                        = [db_path]() { std::filesystem::remove(db_path); },
      .supports_parallel_transactions = false,
  };
}
#endif

#if SAGA_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("SAGA_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("SAGA_TEST_POSTGRES_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() {
    auto pool = std::make_shared<saga::db::postgres::PgPool>(conninfo);
    pool->Bootstrap(saga::db::sql::PostgresSchema());
    return std::make_shared<saga::db::postgres::PgRepository>(std::move(pool));
  };

  return BackendFactory{
      .name                           = "postgres",
      .make_repository                = make_repo,
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();

  // postgres tables outlive the process; keep ids unique per run
  const auto run = backend.name + "-" + std::to_string(NowMs());

  VerifyInsertGetUpdate(*repo, run + "-lifecycle");
  VerifyNegativeIndexRoundTrips(*repo, run + "-compensated");
  VerifyCompareAndSet(*repo, run + "-cas");
  VerifyRollbackBehavior(*repo, run + "-rollback");
  VerifyConcurrentUpdates(*repo, run + "-concurrency", backend.supports_parallel_transactions);
  VerifyStatusAndStaleQueries(*repo, run + "-query");

  VerifyRestartDurability(backend, run + "-durable");

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if SAGA_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if SAGA_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "saga_orchestrator_integration_repository_parity: pass\n";
  return 0;
}
