#pragma once

#include <memory>
#include <mutex>

#include "internal/store/transactional_store.hpp"
#include "internal/util/time.hpp"
#include "sqlite_db.hpp"

namespace circulate::store::sqlite {

/*
  Coordination store on a shared SQLite file.

  Schema (created on construction):

      circulate_kv(key TEXT PRIMARY KEY, value BLOB, expires_at_ms INTEGER)

  Expired rows are filtered on read and swept at the start of each write
  transaction.
*/
class SqliteStore final : public TransactionalStore {
 public:
  explicit SqliteStore(std::shared_ptr<SqliteDB> db, util::ClockFn clock = util::Now);

 protected:
  void Execute(const std::function<void(StoreTransaction&)>& fn) override;

 private:
  void Bootstrap();

  std::shared_ptr<SqliteDB> db_;
  util::ClockFn             clock_;

  // one connection, one transaction at a time
  std::mutex mutex_;
};

} // namespace circulate::store::sqlite
