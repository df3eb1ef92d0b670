#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/path_utils.hpp"
#include "internal/worker/process_supervisor.hpp"
#include "internal/worker/worker_registry.hpp"
#if JOBQ_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if JOBQ_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace jobq::factory {

namespace {

#if JOBQ_DB_SQLITE
void BootstrapSqliteSchema(const std::shared_ptr<db::sqlite::SqliteDB>& sqlite_db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS jobs (id TEXT PRIMARY KEY, command TEXT NOT NULL, state TEXT NOT NULL DEFAULT 'pending', attempts INTEGER NOT NULL DEFAULT 0, max_retries INTEGER NOT NULL, timeout INTEGER NOT NULL, backoff_base INTEGER NOT NULL, priority INTEGER NOT NULL DEFAULT 0, waiting_time INTEGER NOT NULL DEFAULT 0, created_at TEXT NOT NULL, updated_at TEXT NOT NULL, next_retry_at TEXT, error_message TEXT, output TEXT, execution_time REAL, locked_by TEXT, locked_at TEXT);",
      "CREATE INDEX IF NOT EXISTS idx_jobs_state ON jobs(state);",
      "CREATE INDEX IF NOT EXISTS idx_jobs_next_retry_at ON jobs(next_retry_at);",
      "CREATE INDEX IF NOT EXISTS idx_jobs_priority_created ON jobs(priority, created_at);",
      "CREATE INDEX IF NOT EXISTS idx_jobs_locked_by ON jobs(locked_by);",
      "CREATE TABLE IF NOT EXISTS config (key TEXT PRIMARY KEY, value TEXT NOT NULL);"};

  for (const auto& sql : kBootstrapSql) {
    sqlite_db->Exec(sql);
  }

  sqlite_db->Exec("SELECT id,command,state,attempts,max_retries,timeout,backoff_base,priority,waiting_time,created_at,updated_at,next_retry_at,error_message,output,execution_time,locked_by,locked_at FROM jobs LIMIT 1;");
  sqlite_db->Exec("SELECT key,value FROM config LIMIT 1;");
}
#endif

#if JOBQ_DB_POSTGRES
void BootstrapPostgresSchema(const std::shared_ptr<db::postgres::PgPool>& pool) {
  auto conn = pool->Acquire();
  pqxx::work tx(*conn);

  tx.exec("CREATE TABLE IF NOT EXISTS jobs (id TEXT PRIMARY KEY, command TEXT NOT NULL, state TEXT NOT NULL DEFAULT 'pending', attempts BIGINT NOT NULL DEFAULT 0, max_retries BIGINT NOT NULL, timeout BIGINT NOT NULL, backoff_base BIGINT NOT NULL, priority BIGINT NOT NULL DEFAULT 0, waiting_time BIGINT NOT NULL DEFAULT 0, created_at TEXT NOT NULL, updated_at TEXT NOT NULL, next_retry_at TEXT, error_message TEXT, output TEXT, execution_time DOUBLE PRECISION, locked_by TEXT, locked_at TEXT);");
  tx.exec("CREATE INDEX IF NOT EXISTS idx_jobs_state ON jobs(state);");
  tx.exec("CREATE INDEX IF NOT EXISTS idx_jobs_next_retry_at ON jobs(next_retry_at);");
  tx.exec("CREATE INDEX IF NOT EXISTS idx_jobs_priority_created ON jobs(priority, created_at);");
  tx.exec("CREATE INDEX IF NOT EXISTS idx_jobs_locked_by ON jobs(locked_by);");
  tx.exec("CREATE TABLE IF NOT EXISTS config (key TEXT PRIMARY KEY, value TEXT NOT NULL);");

  tx.exec("SELECT id,command,state,attempts,max_retries,timeout,backoff_base,priority,waiting_time,created_at,updated_at,next_retry_at,error_message,output,execution_time,locked_by,locked_at FROM jobs LIMIT 1;");
  tx.exec("SELECT key,value FROM config LIMIT 1;");
  tx.commit();
}
#endif

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const jobq::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if JOBQ_DB_SQLITE
    const auto path = util::ExpandUserPath(database.sqlite().path());
    util::EnsureParentDirectory(path);
    const auto busy_timeout_ms = database.sqlite().busy_timeout_ms() == 0 ? 5000 : database.sqlite().busy_timeout_ms();
    auto       sqlite_db       = std::make_shared<db::sqlite::SqliteDB>(path.string(), static_cast<int>(busy_timeout_ms));
    BootstrapSqliteSchema(sqlite_db);
    JOBQ_LOG_DEBUG("opened sqlite repository", {observability::StringField("path", path.string())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if JOBQ_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() == 0 ? 16 : database.postgres().max_connections();
    auto       pool            = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    BootstrapPostgresSchema(pool);
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

core::JobDefaults JobDefaultsFromConfig(const jobq::runtime::config::RuntimeConfig& config) {
  core::JobDefaults defaults;
  const auto&       cfg = config.job_defaults();
  if (cfg.max_retries() > 0) defaults.max_retries = cfg.max_retries();
  if (cfg.timeout_seconds() > 0) defaults.timeout = cfg.timeout_seconds();
  if (cfg.backoff_base() > 0) defaults.backoff_base = cfg.backoff_base();
  if (cfg.priority() != 0) defaults.priority = cfg.priority();
  return defaults;
}

/*
    Build full application dependency graph
*/
Application Build(const jobq::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Storage + job store
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);
  app.store      = std::make_shared<core::JobStore>(app.repository);
  app.store->SeedDefaults(JobDefaultsFromConfig(config));

  // ------------------------------------------------------------------
  // Worker pool
  // ------------------------------------------------------------------
  const auto& workers = config.workers();

  worker::WorkerPoolOptions pool_options;
  pool_options.worker_binary = workers.worker_binary();
  pool_options.config_path   = workers.config_path();
  pool_options.log_dir       = workers.log_dir();

  auto registry = std::make_shared<worker::WorkerRegistry>(util::ExpandUserPath(workers.registry_path()));
  app.pool      = std::make_shared<worker::WorkerPool>(std::make_shared<worker::PosixProcessSupervisor>(), std::move(registry), pool_options);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.store = app.store;
  ctx.pool  = app.pool;

  app.admin = std::make_shared<service::AdminService>(ctx);

  return app;
}

} // namespace jobq::factory
