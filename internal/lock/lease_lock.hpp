#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/lock/lock.hpp"
#include "internal/store/api/coordination_store.hpp"
#include "internal/util/backoff.hpp"

namespace circulate::lock {

struct LeaseLockOptions {
  // Lease length. nullopt = the lock never expires on its own.
  std::optional<std::chrono::milliseconds> lock_timeout = std::chrono::minutes(5);

  // Blocking attempts wait uniform(0, retry_delay) between tries...
  std::chrono::milliseconds retry_delay{200};

  // ...unless a backoff policy is given.
  std::optional<util::BackoffPolicy> backoff;
};

/*
  LeaseLock

  Lock record at `{prefix}:{lock_type}:{names...}` whose value is the owner
  token. Acquisition is a single set-if-absent with TTL that returns the
  previous value; finding our own token there turns the call into a lease
  extension.

  Passing the same token from several invocations (e.g. a task's root id)
  lets retries of one logical task re-enter a lock they already hold.
*/
class LeaseLock : public Lock {
 public:
  LeaseLock(std::shared_ptr<store::CoordinationStore> store,
            const std::string&                        key_prefix,
            const std::string&                        lock_type,
            const std::vector<std::string>&           names,
            std::optional<std::string>                token   = std::nullopt,
            LeaseLockOptions                          options = {});

  using Lock::Acquire;

  AcquireResult Acquire() override;
  bool          Release() override;
  bool          ExtendTimeout() override;
  bool          Locked(bool by_us = false) override;

  const std::string& Key() const override {
    return key_;
  }

  const std::string& Token() const override {
    return token_;
  }

  const std::string& LockType() const {
    return lock_type_;
  }

  const LeaseLockOptions& Options() const {
    return options_;
  }

 protected:
  std::chrono::milliseconds NextRetryDelay(int attempt) const override;

 private:
  std::shared_ptr<store::CoordinationStore> store_;
  std::string                               lock_type_;
  std::string                               key_;
  std::string                               token_;
  LeaseLockOptions                          options_;
};

inline constexpr const char* kTaskLockType = "TaskLock";

/*
  Lock scoped to a logical task. The owner token is the task's root id so
  every retry and continuation of the same task shares ownership; the
  default name is Task:{task_name}.

  Throws util::LockError when neither a name nor a root id is available.
*/
std::unique_ptr<LeaseLock> MakeTaskLock(std::shared_ptr<store::CoordinationStore> store,
                                        const std::string&                        key_prefix,
                                        const std::string&                        task_name,
                                        const std::string&                        root_id,
                                        std::optional<std::vector<std::string>>   names   = std::nullopt,
                                        LeaseLockOptions                          options = {});

} // namespace circulate::lock
