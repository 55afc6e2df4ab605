#include "memory_tx.hpp"

namespace circulate::store::memory {

namespace {

bool HasPrefix(const std::string& key, const std::string& prefix) {
  return key.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

MemoryTransaction::MemoryTransaction(MemoryStore& store, int64_t now_ms) : store_(store), now_ms_(now_ms) {
}

bool MemoryTransaction::Live(const Entry& entry) const {
  return !entry.expires_at_ms || *entry.expires_at_ms > now_ms_;
}

std::optional<Entry> MemoryTransaction::Read(const std::string& key) {
  if (auto it = writes_.find(key); it != writes_.end()) {
    if (it->second && Live(*it->second)) return it->second;
    return std::nullopt;
  }

  auto it = store_.committed_.find(key);
  if (it == store_.committed_.end() || !Live(it->second)) return std::nullopt;
  return it->second;
}

void MemoryTransaction::Write(const std::string& key, const Entry& entry) {
  writes_[key] = entry;
}

bool MemoryTransaction::Erase(const std::string& key) {
  const bool existed = Read(key).has_value();
  writes_[key]       = std::nullopt;
  return existed;
}

std::vector<std::pair<std::string, Entry>> MemoryTransaction::ScanPrefix(const std::string& prefix) {
  std::map<std::string, Entry> merged;

  for (auto it = store_.committed_.lower_bound(prefix); it != store_.committed_.end() && HasPrefix(it->first, prefix); ++it) {
    merged.emplace(it->first, it->second);
  }

  for (auto it = writes_.lower_bound(prefix); it != writes_.end() && HasPrefix(it->first, prefix); ++it) {
    if (it->second) {
      merged[it->first] = *it->second;
    } else {
      merged.erase(it->first);
    }
  }

  std::vector<std::pair<std::string, Entry>> out;
  for (auto& [key, entry] : merged) {
    if (Live(entry)) out.emplace_back(key, std::move(entry));
  }
  return out;
}

void MemoryTransaction::Commit() {
  for (auto& [key, entry] : writes_) {
    if (entry) {
      store_.committed_[key] = std::move(*entry);
    } else {
      store_.committed_.erase(key);
    }
  }
  writes_.clear();
}

} // namespace circulate::store::memory
