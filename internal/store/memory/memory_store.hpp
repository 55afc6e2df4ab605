#pragma once

#include <map>
#include <mutex>

#include "internal/store/transactional_store.hpp"
#include "internal/util/time.hpp"

namespace circulate::store::memory {

class MemoryTransaction;

/*
  Single-process coordination store.

  Used by tests and by single-node deployments. The clock is injectable so
  tests can expire leases without sleeping.
*/
class MemoryStore final : public TransactionalStore {
 public:
  explicit MemoryStore(util::ClockFn clock = util::Now);

  // Number of stored entries, expired ones included until the next operation.
  std::size_t Size() const;

 protected:
  void Execute(const std::function<void(StoreTransaction&)>& fn) override;

 private:
  friend class MemoryTransaction;

  void PurgeExpired(int64_t now_ms);

  util::ClockFn                clock_;
  mutable std::mutex           mutex_;
  std::map<std::string, Entry> committed_;
};

} // namespace circulate::store::memory
