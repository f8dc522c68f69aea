#include "factory.hpp"

#include <grpcpp/grpcpp.h>

#include <stdexcept>
#include <utility>

#include "internal/audit/db_audit_recorder.hpp"
#include "internal/campaign/db_campaign_repository.hpp"
#include "internal/cooldown/cooldown_tracker.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/engine/engine_options.hpp"
#include "internal/gateway/commerce_bridge_client.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/ingest_server.hpp"
#include "internal/lock/lock_manager.hpp"
#include "internal/observability/logging.hpp"
#include "internal/rollback/campaign_rollback.hpp"
#include "internal/rules/rule_state_machine.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/time.hpp"
#include "internal/variant/variant_state_capturer.hpp"
#if REPRICER_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if REPRICER_DB_POSTGRES
#include "internal/db/postgres/pg_migrations.hpp"
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace repricer::factory {

using repricer::observability::StringField;

std::shared_ptr<db::Repository> BuildRepository(const repricer::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if REPRICER_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    db::sql::RunMigrations(*sqlite_db, db::sql::SqliteSchema());
    REPRICER_LOG_INFO("using sqlite repository", {StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if REPRICER_DB_POSTGRES
    db::postgres::BootstrapSchema(database.postgres().connection_uri());
    const auto max_connections = database.postgres().max_connections() == 0 ? 16u : database.postgres().max_connections();
    auto       pool            = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    REPRICER_LOG_INFO("using postgres repository");
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  REPRICER_LOG_WARN("no database configured; in-memory repository coordinates this process only");
  return std::make_shared<db::memory::MemoryRepository>();
}

std::shared_ptr<gateway::CommerceGateway> BuildGateway(const repricer::runtime::config::RuntimeConfig& config) {
  const auto& gateway_config = config.gateway();
  if (gateway_config.endpoint().empty()) {
    throw std::runtime_error("gateway.endpoint is required");
  }

  auto credentials = gateway_config.insecure() ? ::grpc::InsecureChannelCredentials() : ::grpc::SslCredentials(::grpc::SslCredentialsOptions());
  auto channel     = ::grpc::CreateChannel(gateway_config.endpoint(), credentials);
  return std::make_shared<gateway::CommerceBridgeClient>(std::move(channel),
                                                         util::ToMillis(gateway_config.timeout(), std::chrono::seconds(10)));
}

/*
    Build full application dependency graph
*/
Application Build(const repricer::runtime::config::RuntimeConfig& config, std::shared_ptr<db::Repository> repository,
                  std::shared_ptr<gateway::CommerceGateway> gateway) {
  Application app;
  app.repository = repository;

  const auto options = engine::EngineOptions::FromConfig(config.engine());

  // ------------------------------------------------------------------
  // Engine components
  // ------------------------------------------------------------------
  engine::EngineContext engine_ctx;
  engine_ctx.gateway     = std::move(gateway);
  engine_ctx.campaigns   = std::make_shared<campaign::DbCampaignRepository>(repository);
  engine_ctx.audit       = std::make_shared<audit::DbAuditRecorder>(repository);
  engine_ctx.locks       = std::make_shared<lock::LockManager>(repository, options.process_id);
  engine_ctx.cooldowns   = std::make_shared<cooldown::CooldownTracker>(repository);
  engine_ctx.capturer    = std::make_shared<variant::VariantStateCapturer>(repository);
  engine_ctx.rule_states = std::make_shared<rules::RuleStateMachine>(repository, options.rule_rearm_cooldown);

  app.processor = std::make_shared<engine::EventProcessor>(engine_ctx, options);

  REPRICER_LOG_INFO("engine ready", {StringField("process_id", options.process_id)});

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.processor  = app.processor;
  ctx.campaigns  = engine_ctx.campaigns;
  ctx.cooldowns  = engine_ctx.cooldowns;
  ctx.locks      = engine_ctx.locks;
  ctx.repository = repository;

  rollback::RollbackOptions rollback_options;
  rollback_options.variant_lock_ttl      = options.variant_lock_ttl;
  rollback_options.price_update_cooldown = options.price_update_cooldown;
  ctx.rollback = std::make_shared<rollback::CampaignRollback>(repository, engine_ctx.campaigns, engine_ctx.gateway, engine_ctx.audit,
                                                              engine_ctx.locks, engine_ctx.cooldowns, rollback_options);

  app.ingest_service = std::make_shared<service::IngestService>(ctx);
  app.admin_service  = std::make_shared<service::AdminService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::IngestServer>(app.ingest_service));
  app.grpc_services.push_back(std::make_unique<grpc::AdminServer>(app.admin_service));

  return app;
}

Application Build(const repricer::runtime::config::RuntimeConfig& config) {
  return Build(config, BuildRepository(config), BuildGateway(config));
}

} // namespace repricer::factory
