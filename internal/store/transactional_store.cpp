#include "transactional_store.hpp"

namespace circulate::store {

namespace {

std::optional<int64_t> ExpiryFor(const StoreTransaction& tx, std::optional<Millis> ttl) {
  if (!ttl) return std::nullopt;
  return tx.NowMs() + ttl->count();
}

bool Holds(StoreTransaction& tx, const Condition& condition) {
  auto current = tx.Read(condition.key);
  switch (condition.kind) {
    case Condition::Kind::kEquals:
      return current && current->value == condition.value;
    case Condition::Kind::kAbsent:
      return !current.has_value();
  }
  return false;
}

} // namespace

std::optional<std::string> TransactionalStore::SetIfAbsent(const std::string& key, const std::string& value, std::optional<Millis> ttl) {
  std::optional<std::string> previous;
  Execute([&](StoreTransaction& tx) {
    previous     = std::nullopt;
    auto current = tx.Read(key);
    if (current) {
      previous = current->value;
      return;
    }
    tx.Write(key, Entry{value, ExpiryFor(tx, ttl)});
  });
  return previous;
}

bool TransactionalStore::CompareAndDelete(const std::string& key, const std::string& expected) {
  bool deleted = false;
  Execute([&](StoreTransaction& tx) {
    deleted      = false;
    auto current = tx.Read(key);
    if (!current || current->value != expected) return;
    deleted = tx.Erase(key);
  });
  return deleted;
}

bool TransactionalStore::CompareAndExpire(const std::string& key, const std::string& expected, std::optional<Millis> ttl) {
  bool updated = false;
  Execute([&](StoreTransaction& tx) {
    updated      = false;
    auto current = tx.Read(key);
    if (!current || current->value != expected) return;
    current->expires_at_ms = ExpiryFor(tx, ttl);
    tx.Write(key, *current);
    updated = true;
  });
  return updated;
}

std::optional<std::string> TransactionalStore::Get(const std::string& key) {
  std::optional<std::string> value;
  Execute([&](StoreTransaction& tx) {
    value = std::nullopt;
    if (auto current = tx.Read(key)) value = std::move(current->value);
  });
  return value;
}

std::optional<Millis> TransactionalStore::Ttl(const std::string& key) {
  std::optional<Millis> remaining;
  Execute([&](StoreTransaction& tx) {
    remaining    = std::nullopt;
    auto current = tx.Read(key);
    if (!current || !current->expires_at_ms) return;
    remaining = Millis(*current->expires_at_ms - tx.NowMs());
  });
  return remaining;
}

bool TransactionalStore::Delete(const std::string& key) {
  bool deleted = false;
  Execute([&](StoreTransaction& tx) { deleted = tx.Erase(key); });
  return deleted;
}

std::vector<KeyValue> TransactionalStore::Scan(const std::string& prefix) {
  std::vector<KeyValue> out;
  Execute([&](StoreTransaction& tx) {
    out.clear();
    for (auto& [key, entry] : tx.ScanPrefix(prefix)) {
      out.emplace_back(key, std::move(entry.value));
    }
  });
  return out;
}

std::optional<std::vector<OperationReply>> TransactionalStore::Commit(const std::vector<Condition>& conditions,
                                                                      const std::vector<Operation>& operations) {
  std::optional<std::vector<OperationReply>> replies;
  Execute([&](StoreTransaction& tx) {
    replies = std::nullopt;
    for (const auto& condition : conditions) {
      if (!Holds(tx, condition)) return;
    }

    std::vector<OperationReply> out;
    out.reserve(operations.size());
    for (const auto& op : operations) {
      out.push_back(Apply(tx, op));
    }
    replies = std::move(out);
  });
  return replies;
}

OperationReply TransactionalStore::Apply(StoreTransaction& tx, const Operation& op) {
  OperationReply reply;

  switch (op.kind) {
    case Operation::Kind::kSet:
      tx.Write(op.key, Entry{op.value, ExpiryFor(tx, op.ttl)});
      break;

    case Operation::Kind::kSetIfAbsent:
      if (tx.Read(op.key)) {
        reply.applied = false;
      } else {
        tx.Write(op.key, Entry{op.value, ExpiryFor(tx, op.ttl)});
      }
      break;

    case Operation::Kind::kAppend: {
      auto entry = tx.Read(op.key).value_or(Entry{});
      entry.value += op.value;
      if (op.ttl) entry.expires_at_ms = ExpiryFor(tx, op.ttl);
      reply.count = static_cast<int64_t>(entry.value.size());
      tx.Write(op.key, entry);
      break;
    }

    case Operation::Kind::kDelete:
      reply.applied = tx.Erase(op.key);
      break;

    case Operation::Kind::kExpire: {
      auto entry = tx.Read(op.key);
      if (!entry) {
        reply.applied = false;
        break;
      }
      entry->expires_at_ms = ExpiryFor(tx, op.ttl);
      tx.Write(op.key, *entry);
      break;
    }

    case Operation::Kind::kDeletePrefix:
      for (const auto& [key, entry] : tx.ScanPrefix(op.key)) {
        if (tx.Erase(key)) ++reply.count;
      }
      break;

    case Operation::Kind::kExpirePrefix:
      for (auto& [key, entry] : tx.ScanPrefix(op.key)) {
        entry.expires_at_ms = ExpiryFor(tx, op.ttl);
        tx.Write(key, entry);
        ++reply.count;
      }
      break;
  }

  return reply;
}

} // namespace circulate::store
