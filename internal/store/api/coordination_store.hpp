#pragma once

#include <chrono>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace circulate::store {

using Millis = std::chrono::milliseconds;

/*
  Guard evaluated at the start of an atomic batch. All guards must hold for
  any operation of the batch to run.
*/
struct Condition {
  enum class Kind {
    kEquals,
    kAbsent,
  };

  Kind        kind = Kind::kEquals;
  std::string key;
  std::string value;

  static Condition Equals(std::string key, std::string value) {
    return {Kind::kEquals, std::move(key), std::move(value)};
  }

  static Condition Absent(std::string key) {
    return {Kind::kAbsent, std::move(key), {}};
  }
};

/*
  One step of an atomic batch.

    Set           value + ttl (no ttl = persistent)
    SetIfAbsent   only when no live value exists
    Append        concatenates, keeps the existing expiry unless ttl is given
    Delete        removes the key
    Expire        replaces the expiry of a live key (no ttl = persist)
    DeletePrefix  removes every key starting with `key`
    ExpirePrefix  re-expires every live key starting with `key`
*/
struct Operation {
  enum class Kind {
    kSet,
    kSetIfAbsent,
    kAppend,
    kDelete,
    kExpire,
    kDeletePrefix,
    kExpirePrefix,
  };

  Kind                  kind = Kind::kSet;
  std::string           key;
  std::string           value;
  std::optional<Millis> ttl;

  static Operation Set(std::string key, std::string value, std::optional<Millis> ttl = std::nullopt) {
    return {Kind::kSet, std::move(key), std::move(value), ttl};
  }

  static Operation SetIfAbsent(std::string key, std::string value, std::optional<Millis> ttl = std::nullopt) {
    return {Kind::kSetIfAbsent, std::move(key), std::move(value), ttl};
  }

  static Operation Append(std::string key, std::string value, std::optional<Millis> ttl = std::nullopt) {
    return {Kind::kAppend, std::move(key), std::move(value), ttl};
  }

  static Operation Delete(std::string key) {
    return {Kind::kDelete, std::move(key), {}, std::nullopt};
  }

  static Operation Expire(std::string key, std::optional<Millis> ttl) {
    return {Kind::kExpire, std::move(key), {}, ttl};
  }

  static Operation DeletePrefix(std::string prefix) {
    return {Kind::kDeletePrefix, std::move(prefix), {}, std::nullopt};
  }

  static Operation ExpirePrefix(std::string prefix, std::optional<Millis> ttl) {
    return {Kind::kExpirePrefix, std::move(prefix), {}, ttl};
  }
};

/*
  Per-operation reply of a committed batch.

  applied: false for SetIfAbsent on a live key and Delete/Expire on a missing key
  count:   new length for Append, keys touched for the prefix operations
*/
struct OperationReply {
  bool    applied = true;
  int64_t count   = 0;
};

using KeyValue = std::pair<std::string, std::string>;

/*
  CoordinationStore

  Shared key/value store with TTL expiry and atomic check-then-act. Every
  method is atomic with respect to every other caller, in this process or any
  other process sharing the backend.

  Implementations must be thread-safe.
*/
class CoordinationStore {
 public:
  virtual ~CoordinationStore() = default;

  // Stores `value` only if the key has no live value.
  // Returns the previous live value, nullopt when the write happened.
  virtual std::optional<std::string> SetIfAbsent(const std::string& key, const std::string& value, std::optional<Millis> ttl) = 0;

  // Deletes the key iff its live value equals `expected`.
  virtual bool CompareAndDelete(const std::string& key, const std::string& expected) = 0;

  // Replaces the expiry iff the live value equals `expected`.
  virtual bool CompareAndExpire(const std::string& key, const std::string& expected, std::optional<Millis> ttl) = 0;

  virtual std::optional<std::string> Get(const std::string& key) = 0;

  // Remaining lifetime of a live key; nullopt when missing or persistent.
  virtual std::optional<Millis> Ttl(const std::string& key) = 0;

  virtual bool Delete(const std::string& key) = 0;

  // Live entries whose key starts with `prefix`, ordered by key.
  virtual std::vector<KeyValue> Scan(const std::string& prefix) = 0;

  // Atomic guarded batch. nullopt when a condition did not hold; nothing is
  // written in that case.
  virtual std::optional<std::vector<OperationReply>> Commit(const std::vector<Condition>& conditions, const std::vector<Operation>& operations) = 0;
};

// Escapes ':' (and the escape character) so a name cannot span segments.
inline std::string EscapeKeySegment(std::string_view segment) {
  std::string escaped;
  escaped.reserve(segment.size());
  for (char c : segment) {
    if (c == '%') {
      escaped.append("%25");
    } else if (c == ':') {
      escaped.append("%3A");
    } else {
      escaped.push_back(c);
    }
  }
  return escaped;
}

// Joins key segments with ':'. The first segment is the namespace and is
// taken as is, so it may itself be a joined key; the rest are escaped.
inline std::string JoinKey(std::initializer_list<std::string_view> parts) {
  std::string key;
  bool        head = true;
  for (auto part : parts) {
    if (head) {
      key.append(part);
      head = false;
      continue;
    }
    key.push_back(':');
    key.append(EscapeKeySegment(part));
  }
  return key;
}

inline std::string JoinKey(const std::string& head, const std::vector<std::string>& tail) {
  std::string key = head;
  for (const auto& part : tail) {
    key.push_back(':');
    key.append(EscapeKeySegment(part));
  }
  return key;
}

} // namespace circulate::store
