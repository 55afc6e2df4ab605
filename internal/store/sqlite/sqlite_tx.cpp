#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace circulate::store::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db, int64_t now_ms) : db_(std::move(db)), now_ms_(now_ms) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (committed_) return;
  try {
    db_->Exec("ROLLBACK;");
  } catch (const std::exception& e) {
    CIRCULATE_LOG_WARN("sqlite rollback failed", {observability::StringField("path", db_->Path()), observability::StringField("error", e.what())});
  }
}

std::optional<Entry> SqliteTransaction::Read(const std::string& key) {
  Statement st(*db_, "SELECT value, expires_at_ms FROM circulate_kv WHERE key = ?1 AND (expires_at_ms IS NULL OR expires_at_ms > ?2);");
  st.BindText(1, key);
  st.BindInt64(2, now_ms_);
  if (!st.Step()) return std::nullopt;

  Entry entry;
  entry.value = st.ColBlob(0);
  if (!st.ColIsNull(1)) entry.expires_at_ms = st.ColInt64(1);
  return entry;
}

void SqliteTransaction::Write(const std::string& key, const Entry& entry) {
  Statement st(*db_,
               "INSERT INTO circulate_kv(key, value, expires_at_ms) VALUES(?1, ?2, ?3) "
               "ON CONFLICT(key) DO UPDATE SET value = excluded.value, expires_at_ms = excluded.expires_at_ms;");
  st.BindText(1, key);
  st.BindBlob(2, entry.value);
  if (entry.expires_at_ms) {
    st.BindInt64(3, *entry.expires_at_ms);
  } else {
    st.BindNull(3);
  }
  st.Step();
}

bool SqliteTransaction::Erase(const std::string& key) {
  const bool existed = Read(key).has_value();

  Statement st(*db_, "DELETE FROM circulate_kv WHERE key = ?1;");
  st.BindText(1, key);
  st.Step();
  return existed;
}

std::vector<std::pair<std::string, Entry>> SqliteTransaction::ScanPrefix(const std::string& prefix) {
  Statement st(*db_,
               "SELECT key, value, expires_at_ms FROM circulate_kv "
               "WHERE substr(key, 1, length(?1)) = ?1 AND (expires_at_ms IS NULL OR expires_at_ms > ?2) "
               "ORDER BY key;");
  st.BindText(1, prefix);
  st.BindInt64(2, now_ms_);

  std::vector<std::pair<std::string, Entry>> out;
  while (st.Step()) {
    Entry entry;
    entry.value = st.ColBlob(1);
    if (!st.ColIsNull(2)) entry.expires_at_ms = st.ColInt64(2);
    out.emplace_back(st.ColText(0), std::move(entry));
  }
  return out;
}

void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  committed_ = true;
}

} // namespace circulate::store::sqlite
