#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/events/event_sink.hpp"
#include "internal/observability/logging.hpp"
#include "internal/token/store_token_ledger.hpp"
#if RENTLEDGER_WITH_GRPC
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/ledger_server.hpp"
#include "internal/grpc/registry_server.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/ledger_service.hpp"
#include "internal/service/registry_service.hpp"
#include "internal/service/service_context.hpp"
#endif
#if RENTLEDGER_DB_SQLITE || RENTLEDGER_DB_POSTGRES
#include "internal/db/sql/schema.hpp"
#endif
#if RENTLEDGER_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if RENTLEDGER_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace rentledger::factory {

using namespace rentledger;

namespace {

#if RENTLEDGER_DB_SQLITE
void BootstrapSqliteSchema(const std::shared_ptr<db::sqlite::SqliteDB>& sqlite_db) {
  sqlite_db->Exec(db::sql::kSqliteSchema);
  sqlite_db->Exec("SELECT durability,slot,value,live_until FROM ledger_entries LIMIT 1;");
}
#endif

#if RENTLEDGER_DB_POSTGRES
void BootstrapPostgresSchema(const std::shared_ptr<db::postgres::PgPool>& pool) {
  auto       conn = pool->Acquire();
  pqxx::work tx(*conn);

  tx.exec(db::sql::kPostgresSchema);
  tx.exec("SELECT durability,slot,value,live_until FROM ledger_entries LIMIT 1;");
  tx.commit();
}
#endif

storage::TtlPolicy ToTtlPolicy(const rentledger::runtime::config::TtlPolicy& policy) {
  storage::TtlPolicy ttl;
  if (policy.threshold_seconds() != 0 || policy.extend_to_seconds() != 0) {
    ttl.threshold_seconds = policy.threshold_seconds();
    ttl.extend_to_seconds = policy.extend_to_seconds();
  }
  return ttl;
}

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const rentledger::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if RENTLEDGER_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    BootstrapSqliteSchema(sqlite_db);
    RENTLEDGER_LOG_INFO("using sqlite repository", {observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if RENTLEDGER_DB_POSTGRES
    auto pool = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri());
    BootstrapPostgresSchema(pool);
    RENTLEDGER_LOG_INFO("using postgres repository");
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  RENTLEDGER_LOG_INFO("using in-memory repository");
  return std::make_shared<db::memory::MemoryRepository>();
}

core::LedgerOptions BuildLedgerOptions(const rentledger::runtime::config::RuntimeConfig& config) {
  core::LedgerOptions options;
  options.instance_ttl   = ToTtlPolicy(config.ledger().instance_ttl());
  options.persistent_ttl = ToTtlPolicy(config.ledger().persistent_ttl());
  options.token_admin    = config.ledger().token_admin();
  return options;
}

/*
    Build full application dependency graph
*/
Application Build(const rentledger::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);
  app.ledger     = std::make_shared<core::RentLedger>(app.repository, std::make_shared<token::StoreTokenLedger>(),
                                                  std::make_shared<events::LogEventSink>(), BuildLedgerOptions(config));

#if RENTLEDGER_WITH_GRPC
  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.ledger = app.ledger;

  auto ledger_service   = std::make_shared<service::LedgerService>(ctx);
  auto registry_service = std::make_shared<service::RegistryService>(ctx);
  auto admin_service    = std::make_shared<service::AdminService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  grpc::IdentityPolicy identity;
  identity.trust_principal_metadata = config.server().trust_principal_metadata();
  if (identity.trust_principal_metadata) {
    RENTLEDGER_LOG_WARN("trusting x-rentledger-principal metadata as caller identity");
  }

  app.grpc_services.push_back(std::make_unique<grpc::LedgerServer>(ledger_service, identity));
  app.grpc_services.push_back(std::make_unique<grpc::RegistryServer>(registry_service, identity));
  app.grpc_services.push_back(std::make_unique<grpc::ObligationServer>(registry_service, identity));
  app.grpc_services.push_back(std::make_unique<grpc::AdminServer>(admin_service, identity));
#endif

  return app;
}

} // namespace rentledger::factory
