#pragma once

#include <memory>

#include "internal/store/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace circulate::store::sqlite {

/*
  SQLite transaction wrapper.

  Uses BEGIN IMMEDIATE:
    - grabs the write lock up front, so the read-check-write of a
      conditional operation cannot interleave with another process
    - a busy database surfaces as StoreUnavailable on entry
*/
class SqliteTransaction final : public StoreTransaction {
 public:
  SqliteTransaction(std::shared_ptr<SqliteDB> db, int64_t now_ms);
  ~SqliteTransaction() override;

  std::optional<Entry>                       Read(const std::string& key) override;
  void                                       Write(const std::string& key, const Entry& entry) override;
  bool                                       Erase(const std::string& key) override;
  std::vector<std::pair<std::string, Entry>> ScanPrefix(const std::string& prefix) override;

  int64_t NowMs() const override {
    return now_ms_;
  }

  void Commit();

 private:
  std::shared_ptr<SqliteDB> db_;
  int64_t                   now_ms_;
  bool                      committed_ = false;
};

} // namespace circulate::store::sqlite
