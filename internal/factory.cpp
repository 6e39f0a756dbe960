#include "factory.hpp"

#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/schema.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/service_context.hpp"
#if PROGRESS_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if PROGRESS_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace progress::factory {

namespace rc = progress::runtime::config;

namespace {

#if PROGRESS_DB_SQLITE
void BootstrapSqliteSchema(const std::shared_ptr<db::sqlite::SqliteDB>& sqlite_db) {
  for (const auto* sql : db::sql::kSqliteSchema) {
    sqlite_db->Exec(sql);
  }

  sqlite_db->Exec("SELECT id,project_id,item_type,identity_key,milestones FROM items LIMIT 1;");
  sqlite_db->Exec("SELECT seq,item_id,milestone_name,previous_value,new_value,kind,corrects_seq FROM milestone_events LIMIT 1;");
  sqlite_db->Exec("SELECT project_id,item_type,milestone_name,weight,kind,category,version FROM milestone_templates LIMIT 1;");
}
#endif

#if PROGRESS_DB_POSTGRES
void BootstrapPostgresSchema(const std::shared_ptr<db::postgres::PgPool>& pool) {
  auto       conn = pool->Acquire();
  pqxx::work tx(*conn);

  for (const auto* sql : db::sql::kPostgresSchema) {
    tx.exec(sql);
  }

  tx.exec("SELECT id,project_id,item_type,identity_key,milestones FROM items LIMIT 1;");
  tx.exec("SELECT seq,item_id,milestone_name,previous_value,new_value,kind,corrects_seq FROM milestone_events LIMIT 1;");
  tx.commit();
}
#endif

std::shared_ptr<db::Repository> BuildRepository(const rc::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if PROGRESS_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    BootstrapSqliteSchema(sqlite_db);
    PROGRESS_LOG_INFO("database ready", {observability::StringField("backend", "sqlite"),
                                         observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if PROGRESS_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() > 0 ? database.postgres().max_connections() : 16u;
    auto       pool            = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    BootstrapPostgresSchema(pool);
    PROGRESS_LOG_INFO("database ready", {observability::StringField("backend", "postgres"),
                                         observability::IntField("max_connections", max_connections)});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  PROGRESS_LOG_WARN("no database configured; state is kept in memory only");
  return std::make_shared<db::memory::MemoryRepository>();
}

core::EngineOptions ToEngineOptions(const rc::EngineConfig& engine) {
  core::EngineOptions options;
  if (engine.reconciliation_tolerance_hours() > 0.0) {
    options.reconciliation_tolerance_hours = engine.reconciliation_tolerance_hours();
  }
  options.rollup_refresh =
      engine.rollup_refresh() == rc::ROLLUP_REFRESH_ON_READ ? core::RollupRefresh::kOnRead : core::RollupRefresh::kEager;
  if (engine.max_clock_skew_ms() > 0) {
    options.max_clock_skew_ms = engine.max_clock_skew_ms();
  }
  return options;
}

} // namespace

RuntimeDependencies BuildRuntime(const rc::RuntimeConfig& config) {
  return BuildRuntime(config, BuildRepository(config));
}

/*
    Build full application dependency graph
*/
RuntimeDependencies BuildRuntime(const rc::RuntimeConfig& config, std::shared_ptr<db::Repository> repository) {
  RuntimeDependencies deps;
  deps.repository = std::move(repository);

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  deps.registry = std::make_shared<templates::TemplateRegistry>(deps.repository, config.engine().weight_tolerance());
  deps.manager  = std::make_shared<core::ProgressManager>(deps.repository, deps.registry, ToEngineOptions(config.engine()));
  deps.registry->SetRecalculator(deps.manager);

  if (config.engine().seed_default_templates()) {
    deps.registry->SeedDefaults();
  }

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.manager    = deps.manager;
  ctx.registry   = deps.registry;
  ctx.repository = deps.repository;

  deps.progress_service = std::make_shared<service::ProgressService>(ctx);
  deps.template_service = std::make_shared<service::TemplateService>(ctx);
  return deps;
}

} // namespace progress::factory
