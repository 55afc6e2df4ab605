#include "store_factory.hpp"

#include <chrono>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/store/memory/memory_store.hpp"
#if CIRCULATE_STORE_SQLITE
#include "internal/store/sqlite/sqlite_db.hpp"
#include "internal/store/sqlite/sqlite_store.hpp"
#endif
#if CIRCULATE_STORE_POSTGRES
#include "internal/store/postgres/pg_store.hpp"
#endif

namespace circulate::store {

std::shared_ptr<CoordinationStore> StoreFactory::Build(const circulate::runtime::config::StoreConfig& cfg) {
  if (cfg.has_sqlite()) {
#if CIRCULATE_STORE_SQLITE
    if (cfg.sqlite().path().empty()) throw std::invalid_argument("store.sqlite.path is required");
    const auto busy_timeout = std::chrono::milliseconds(cfg.sqlite().busy_timeout_ms() == 0 ? 5000 : cfg.sqlite().busy_timeout_ms());
    auto       db           = std::make_shared<sqlite::SqliteDB>(cfg.sqlite().path(), busy_timeout);
    CIRCULATE_LOG_INFO("coordination store ready", {observability::StringField("backend", "sqlite"), observability::StringField("path", cfg.sqlite().path())});
    return std::make_shared<sqlite::SqliteStore>(std::move(db));
#else
    throw std::runtime_error("sqlite store requested but not enabled at build time");
#endif
  }

  if (cfg.has_postgres()) {
#if CIRCULATE_STORE_POSTGRES
    if (cfg.postgres().connection_uri().empty()) throw std::invalid_argument("store.postgres.connection_uri is required");
    const std::size_t max_connections = cfg.postgres().max_connections() == 0 ? 16 : cfg.postgres().max_connections();
    auto              store           = std::make_shared<postgres::PgStore>(cfg.postgres().connection_uri(), max_connections);
    CIRCULATE_LOG_INFO("coordination store ready", {observability::StringField("backend", "postgres")});
    return store;
#else
    throw std::runtime_error("postgres store requested but not enabled at build time");
#endif
  }

  CIRCULATE_LOG_INFO("coordination store ready", {observability::StringField("backend", "memory")});
  return std::make_shared<memory::MemoryStore>();
}

std::string StoreFactory::KeyPrefix(const circulate::runtime::config::StoreConfig& cfg) {
  return cfg.key_prefix().empty() ? std::string(kDefaultKeyPrefix) : cfg.key_prefix();
}

} // namespace circulate::store
