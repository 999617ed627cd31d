#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/schema.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"
#if SAGA_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if SAGA_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace saga::factory {

using observability::BoolField;
using observability::IntField;
using observability::StringField;

namespace {

constexpr std::size_t kFailedReportLimit = 100;

#if SAGA_DB_SQLITE
void BootstrapSqliteSchema(const std::shared_ptr<db::sqlite::SqliteDB>& sqlite_db) {
  for (const auto& sql : db::sql::SqliteSchema()) {
    sqlite_db->Exec(sql);
  }

  sqlite_db->Exec("SELECT execution_id,status,current_step_index,version FROM saga_execution LIMIT 1;");
}
#endif

std::size_t WorkerThreads(const saga::runtime::config::RuntimeConfig& config) {
  if (config.orchestrator().worker_threads() > 0) return config.orchestrator().worker_threads();
  const auto hw = std::thread::hardware_concurrency();
  return hw == 0 ? 4 : hw;
}

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const saga::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if SAGA_DB_SQLITE
    const auto& sqlite    = database.sqlite();
    auto        sqlite_db = std::make_shared<db::sqlite::SqliteDB>(sqlite.path(), sqlite.wal_mode());
    BootstrapSqliteSchema(sqlite_db);
    SAGA_LOG_INFO("execution store ready", {StringField("backend", "sqlite"), StringField("path", sqlite.path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if SAGA_DB_POSTGRES
    const auto& postgres = database.postgres();
    auto pool = std::make_shared<db::postgres::PgPool>(postgres.connection_uri(), postgres.max_connections() == 0 ? 16 : postgres.max_connections());
    pool->Bootstrap(db::sql::PostgresSchema());
    SAGA_LOG_INFO("execution store ready", {StringField("backend", "postgres")});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  SAGA_LOG_WARN("execution store is in-memory; executions do not survive a restart");
  return std::make_shared<db::memory::MemoryRepository>();
}

core::RetryPolicy ResolveRetryPolicy(const saga::runtime::config::RuntimeConfig& config, const std::string& saga_type) {
  const auto& orchestrator = config.orchestrator();
  auto        defaults     = core::RetryPolicy::FromConfig(orchestrator.default_retry(), core::RetryPolicy{});

  auto it = orchestrator.saga_retry().find(saga_type);
  if (it == orchestrator.saga_retry().end()) return defaults;
  return core::RetryPolicy::FromConfig(it->second, defaults);
}

recovery::RecoveryOptions ResolveRecoveryOptions(const saga::runtime::config::RuntimeConfig& config) {
  const auto&               recovery = config.recovery();
  recovery::RecoveryOptions options;
  options.interval    = util::ToMillis(recovery.interval(), options.interval);
  options.stale_after = util::ToMillis(recovery.stale_after(), options.stale_after);
  options.alert_after = util::ToMillis(recovery.alert_after(), options.alert_after);
  if (recovery.batch_limit() > 0) options.batch_limit = recovery.batch_limit();
  return options;
}

/*
    Build full application dependency graph
*/
Application Build(const saga::runtime::config::RuntimeConfig& config, sagas::CreateOrderClients clients) {
  Application app;

  // ------------------------------------------------------------------
  // Store and saga definitions
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);

  app.registry = std::make_shared<core::SagaRegistry>();
  app.registry->Register(sagas::BuildCreateOrderSaga(std::move(clients), ResolveRetryPolicy(config, sagas::kCreateOrderSagaType)));
  app.registry->Freeze();

  // ------------------------------------------------------------------
  // Orchestrator
  // ------------------------------------------------------------------
  app.leases = std::make_shared<lease::LeaseManager>(util::ToMillis(config.orchestrator().lease_ttl(), std::chrono::seconds(30)));
  app.alerts = std::make_shared<observability::LogAlertSink>(config);
  app.orchestrator = std::make_shared<core::Orchestrator>(app.repository, app.registry, app.leases, app.alerts, util::GenerateUUIDString());

  // ------------------------------------------------------------------
  // Dispatch and recovery
  // ------------------------------------------------------------------
  app.queue   = std::make_shared<dispatch::DispatchQueue>();
  app.workers = std::make_shared<dispatch::WorkerPool>(app.queue, app.orchestrator, WorkerThreads(config));

  std::weak_ptr<dispatch::DispatchQueue> weak_queue = app.queue;
  app.orchestrator->SetDispatcher([weak_queue](const std::string& execution_id) {
    if (auto queue = weak_queue.lock()) queue->Enqueue(execution_id);
  });

  app.scanner          = std::make_shared<recovery::RecoveryScanner>(app.repository, app.orchestrator, app.alerts, ResolveRecoveryOptions(config));
  app.recovery_enabled = !config.has_recovery() || config.recovery().enabled();

  return app;
}

void Application::Start() {
  // FAILED executions stay put until an operator acts on their alert
  const auto failed = orchestrator->List(saga::model::ExecutionStatus::kFailed, kFailedReportLimit);
  if (!failed.empty()) {
    SAGA_LOG_WARN("failed executions awaiting intervention",
                  {IntField("count", static_cast<int64_t>(failed.size())), BoolField("truncated", failed.size() == kFailedReportLimit),
                   StringField("oldest_execution_id", failed.front().execution_id)});
  }

  workers->Start();
  if (recovery_enabled) scanner->Start();
  std::string types;
  for (const auto& type : registry->Types()) {
    if (!types.empty()) types += ",";
    types += type;
  }
  SAGA_LOG_INFO("orchestrator running", {StringField("sagas", types), BoolField("recovery", recovery_enabled)});
}

void Application::Stop() {
  scanner->Stop();
  workers->Stop();
}

} // namespace saga::factory
