#include "pg_pool.hpp"

namespace circulate::store::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [this] {
    return !idle_.empty() || live_connections_ < max_connections_;
  });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    if (conn->is_open()) return Wrap(conn.release());
    --live_connections_;
  }

  ++live_connections_;
  lock.unlock();

  std::unique_ptr<pqxx::connection> conn;
  try {
    conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareStatements(*conn);
  } catch (const std::exception&) {
    std::lock_guard rollback_lock(mutex_);
    --live_connections_;
    cv_.notify_one();
    throw;
  }
  return Wrap(conn.release());
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("kv_read",
               "SELECT encode(value, 'hex'), expires_at_ms FROM circulate_kv "
               "WHERE key=$1 AND (expires_at_ms IS NULL OR expires_at_ms > $2)");

  conn.prepare("kv_write",
               "INSERT INTO circulate_kv(key, value, expires_at_ms) VALUES($1, decode($2, 'hex'), $3) "
               "ON CONFLICT (key) DO UPDATE SET value=EXCLUDED.value, expires_at_ms=EXCLUDED.expires_at_ms");

  conn.prepare("kv_erase", "DELETE FROM circulate_kv WHERE key=$1");

  conn.prepare("kv_scan",
               "SELECT key, encode(value, 'hex'), expires_at_ms FROM circulate_kv "
               "WHERE left(key, length($1)) = $1 AND (expires_at_ms IS NULL OR expires_at_ms > $2) "
               "ORDER BY key");

  conn.prepare("kv_sweep", "DELETE FROM circulate_kv WHERE expires_at_ms IS NOT NULL AND expires_at_ms <= $1");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace circulate::store::postgres
