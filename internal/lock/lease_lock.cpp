#include "lease_lock.hpp"

#include <random>
#include <stdexcept>

#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace circulate::lock {

namespace {

void Record(const std::string& lock_type, AcquireResult result) {
  observability::Metrics::Instance().RecordLockAcquire(lock_type, AcquireResultName(result));
}

} // namespace

LeaseLock::LeaseLock(std::shared_ptr<store::CoordinationStore> store,
                     const std::string&                        key_prefix,
                     const std::string&                        lock_type,
                     const std::vector<std::string>&           names,
                     std::optional<std::string>                token,
                     LeaseLockOptions                          options)
    : store_(std::move(store)),
      lock_type_(lock_type),
      key_(store::JoinKey(store::JoinKey({key_prefix, lock_type}), names)),
      token_(token ? std::move(*token) : util::NewToken()),
      options_(std::move(options)) {
  if (!store_) throw std::invalid_argument("lease lock requires a coordination store");
  if (token_.empty()) throw util::LockError("lock token must not be empty");
}

AcquireResult LeaseLock::Acquire() {
  auto previous = store_->SetIfAbsent(key_, token_, options_.lock_timeout);

  AcquireResult result = AcquireResult::kFailed;
  if (!previous) {
    result = AcquireResult::kAcquired;
  } else if (*previous == token_) {
    // re-entry by the same owner refreshes the lease
    if (!options_.lock_timeout) {
      result = AcquireResult::kAcquired;
    } else if (store_->CompareAndExpire(key_, token_, options_.lock_timeout)) {
      result = AcquireResult::kExtended;
    }
  }

  Record(lock_type_, result);
  return result;
}

bool LeaseLock::Release() {
  return store_->CompareAndDelete(key_, token_);
}

bool LeaseLock::ExtendTimeout() {
  if (!options_.lock_timeout) return false;
  return store_->CompareAndExpire(key_, token_, options_.lock_timeout);
}

bool LeaseLock::Locked(bool by_us) {
  auto current = store_->Get(key_);
  if (!current) return false;
  return !by_us || *current == token_;
}

std::chrono::milliseconds LeaseLock::NextRetryDelay(int attempt) const {
  if (options_.backoff) return util::BackoffDelay(attempt, *options_.backoff);

  const auto max_ms = options_.retry_delay.count();
  if (max_ms <= 0) return std::chrono::milliseconds(0);

  static thread_local std::mt19937_64   rng{std::random_device{}()};
  std::uniform_int_distribution<int64_t> dist(0, max_ms);
  return std::chrono::milliseconds(dist(rng));
}

std::unique_ptr<LeaseLock> MakeTaskLock(std::shared_ptr<store::CoordinationStore> store,
                                        const std::string&                        key_prefix,
                                        const std::string&                        task_name,
                                        const std::string&                        root_id,
                                        std::optional<std::vector<std::string>>   names,
                                        LeaseLockOptions                          options) {
  if (root_id.empty()) throw util::LockError("task lock requires the task root id as owner token");

  std::vector<std::string> lock_names;
  if (names) {
    lock_names = std::move(*names);
  } else {
    if (task_name.empty()) throw util::LockError("task lock requires a task name when no lock name is given");
    lock_names = {"Task", task_name};
  }

  return std::make_unique<LeaseLock>(std::move(store), key_prefix, kTaskLockType, lock_names, root_id, std::move(options));
}

} // namespace circulate::lock
