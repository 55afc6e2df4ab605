#pragma once

#include <map>
#include <optional>

#include "internal/store/api/transaction.hpp"
#include "memory_store.hpp"

namespace circulate::store::memory {

/*
  Transaction = committed map + write set. Caller holds the store mutex for
  the whole lifetime.
*/
class MemoryTransaction final : public StoreTransaction {
 public:
  MemoryTransaction(MemoryStore& store, int64_t now_ms);

  std::optional<Entry>                     Read(const std::string& key) override;
  void                                     Write(const std::string& key, const Entry& entry) override;
  bool                                     Erase(const std::string& key) override;
  std::vector<std::pair<std::string, Entry>> ScanPrefix(const std::string& prefix) override;

  int64_t NowMs() const override {
    return now_ms_;
  }

  void Commit();

 private:
  bool Live(const Entry& entry) const;

  MemoryStore&                                 store_;
  int64_t                                      now_ms_;
  std::map<std::string, std::optional<Entry>> writes_;
};

} // namespace circulate::store::memory
