#include "sqlite_store.hpp"

#include "sqlite_tx.hpp"

namespace circulate::store::sqlite {

SqliteStore::SqliteStore(std::shared_ptr<SqliteDB> db, util::ClockFn clock) : db_(std::move(db)), clock_(std::move(clock)) {
  Bootstrap();
}

void SqliteStore::Bootstrap() {
  db_->Exec("CREATE TABLE IF NOT EXISTS circulate_kv (key TEXT PRIMARY KEY, value BLOB NOT NULL, expires_at_ms INTEGER);");
  db_->Exec("CREATE INDEX IF NOT EXISTS circulate_kv_expiry ON circulate_kv(expires_at_ms) WHERE expires_at_ms IS NOT NULL;");
}

void SqliteStore::Execute(const std::function<void(StoreTransaction&)>& fn) {
  std::lock_guard lock(mutex_);

  const auto        now_ms = static_cast<int64_t>(util::ToUnixMillis(clock_()));
  SqliteTransaction tx(db_, now_ms);

  Statement sweep(*db_, "DELETE FROM circulate_kv WHERE expires_at_ms IS NOT NULL AND expires_at_ms <= ?1;");
  sweep.BindInt64(1, now_ms);
  sweep.Step();

  fn(tx);
  tx.Commit();
}

} // namespace circulate::store::sqlite
