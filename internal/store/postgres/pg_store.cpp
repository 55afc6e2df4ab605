#include "pg_store.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/store/api/result.hpp"

namespace circulate::store::postgres {

namespace {

constexpr int kMaxSerializationRetries = 8;

std::string ToHex(const std::string& bytes) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string           out;
  out.reserve(bytes.size() * 2);
  for (unsigned char c : bytes) {
    out.push_back(kHex[c >> 4]);
    out.push_back(kHex[c & 0x0F]);
  }
  return out;
}

int HexDigit(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  throw std::runtime_error("postgres store: invalid hex digit in value");
}

std::string FromHex(std::string_view hex) {
  if (hex.size() % 2 != 0) throw std::runtime_error("postgres store: odd-length hex value");
  std::string out;
  out.reserve(hex.size() / 2);
  for (std::size_t i = 0; i < hex.size(); i += 2) {
    out.push_back(static_cast<char>((HexDigit(hex[i]) << 4) | HexDigit(hex[i + 1])));
  }
  return out;
}

Entry ReadEntry(const pqxx::row& row, int value_col, int expiry_col) {
  Entry entry;
  entry.value = FromHex(row[value_col].c_str());
  if (!row[expiry_col].is_null()) entry.expires_at_ms = row[expiry_col].as<int64_t>();
  return entry;
}

using SerializableWork = pqxx::transaction<pqxx::isolation_level::serializable>;

class PgTransaction final : public StoreTransaction {
 public:
  PgTransaction(SerializableWork& work, int64_t now_ms) : work_(work), now_ms_(now_ms) {
  }

  std::optional<Entry> Read(const std::string& key) override {
    auto res = work_.exec_prepared("kv_read", key, now_ms_);
    if (res.empty()) return std::nullopt;
    return ReadEntry(res[0], 0, 1);
  }

  void Write(const std::string& key, const Entry& entry) override {
    work_.exec_prepared("kv_write", key, ToHex(entry.value), entry.expires_at_ms);
  }

  bool Erase(const std::string& key) override {
    const bool existed = Read(key).has_value();
    work_.exec_prepared("kv_erase", key);
    return existed;
  }

  std::vector<std::pair<std::string, Entry>> ScanPrefix(const std::string& prefix) override {
    auto res = work_.exec_prepared("kv_scan", prefix, now_ms_);

    std::vector<std::pair<std::string, Entry>> out;
    out.reserve(res.size());
    for (const auto& row : res) {
      out.emplace_back(row[0].c_str(), ReadEntry(row, 1, 2));
    }
    return out;
  }

  int64_t NowMs() const override {
    return now_ms_;
  }

 private:
  SerializableWork& work_;
  int64_t           now_ms_;
};

} // namespace

PgStore::PgStore(const std::string& conninfo, std::size_t max_connections, util::ClockFn clock)
    : clock_(std::move(clock)) {
  Bootstrap(conninfo);
  pool_ = std::make_shared<PgPool>(conninfo, max_connections);
}

void PgStore::Bootstrap(const std::string& conninfo) {
  pqxx::connection conn(conninfo);
  pqxx::work       tx(conn);
  tx.exec("CREATE TABLE IF NOT EXISTS circulate_kv (key TEXT PRIMARY KEY, value BYTEA NOT NULL, expires_at_ms BIGINT);");
  tx.exec("CREATE INDEX IF NOT EXISTS circulate_kv_expiry ON circulate_kv(expires_at_ms) WHERE expires_at_ms IS NOT NULL;");
  tx.commit();
}

void PgStore::Execute(const std::function<void(StoreTransaction&)>& fn) {
  for (int attempt = 0;; ++attempt) {
    try {
      auto             conn   = pool_->Acquire();
      const auto       now_ms = static_cast<int64_t>(util::ToUnixMillis(clock_()));
      SerializableWork work(*conn);

      work.exec_prepared("kv_sweep", now_ms);

      PgTransaction tx(work, now_ms);
      fn(tx);
      work.commit();
      return;
    } catch (const pqxx::serialization_failure& e) {
      if (attempt + 1 >= kMaxSerializationRetries) {
        Raise(Result::Err(ErrorCode::SerializationFailure, e.what()));
      }
      CIRCULATE_LOG_DEBUG("postgres serialization conflict, retrying", {observability::IntField("attempt", attempt + 1)});
    } catch (const pqxx::broken_connection& e) {
      Raise(Result::Err(ErrorCode::Unavailable, e.what()));
    }
  }
}

} // namespace circulate::store::postgres
