#include "memory_store.hpp"

#include "memory_tx.hpp"

namespace circulate::store::memory {

MemoryStore::MemoryStore(util::ClockFn clock) : clock_(std::move(clock)) {
}

std::size_t MemoryStore::Size() const {
  std::lock_guard lock(mutex_);
  return committed_.size();
}

void MemoryStore::Execute(const std::function<void(StoreTransaction&)>& fn) {
  std::lock_guard lock(mutex_);

  const auto        now_ms = static_cast<int64_t>(util::ToUnixMillis(clock_()));
  MemoryTransaction tx(*this, now_ms);
  fn(tx);
  tx.Commit();

  PurgeExpired(now_ms);
}

void MemoryStore::PurgeExpired(int64_t now_ms) {
  for (auto it = committed_.begin(); it != committed_.end();) {
    if (it->second.expires_at_ms && *it->second.expires_at_ms <= now_ms) {
      it = committed_.erase(it);
    } else {
      ++it;
    }
  }
}

} // namespace circulate::store::memory
