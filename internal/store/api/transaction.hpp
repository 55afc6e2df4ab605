#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace circulate::store {

struct Entry {
  std::string            value;
  std::optional<int64_t> expires_at_ms;
};

/*
  Abstract store transaction.

  Semantics guaranteed for ALL backends:

  - Read / ScanPrefix only return live (unexpired) entries
  - Writes are invisible to other callers until the enclosing Execute returns
  - An exception escaping Execute discards every write

  SQLite: BEGIN IMMEDIATE
  Postgres: serializable pqxx transaction
  Memory: write set applied under the store mutex
*/
class StoreTransaction {
 public:
  virtual ~StoreTransaction() = default;

  virtual std::optional<Entry> Read(const std::string& key) = 0;

  virtual void Write(const std::string& key, const Entry& entry) = 0;

  // true if a live entry was removed
  virtual bool Erase(const std::string& key) = 0;

  virtual std::vector<std::pair<std::string, Entry>> ScanPrefix(const std::string& prefix) = 0;

  // Clock all expiry decisions of this transaction are made against.
  virtual int64_t NowMs() const = 0;
};

} // namespace circulate::store
