#pragma once

#include <chrono>
#include <exception>
#include <string>
#include <string_view>

#include "internal/observability/logging.hpp"
#include "internal/util/outcome.hpp"

namespace circulate::lock {

enum class AcquireResult {
  kAcquired,
  kExtended,
  kFailed,
  kTimedOut,
};

std::string_view AcquireResultName(AcquireResult result);

inline bool Held(AcquireResult result) {
  return result == AcquireResult::kAcquired || result == AcquireResult::kExtended;
}

/*
  How WithLock() acquires and cleans up.

  timeout only applies when blocking; zero waits forever.
*/
struct LockPolicy {
  bool                      blocking = false;
  std::chrono::milliseconds timeout{0};
  bool                      release_on_error = true;
  bool                      release_on_exit  = true;
};

/*
  Lock

  A named exclusive lock owned through a token. Non-blocking failure is a
  result, never an exception. Release and extension only succeed for the
  current owner token; a lock lost to expiry is not detected until then.
*/
class Lock {
 public:
  virtual ~Lock() = default;

  // Single non-blocking attempt.
  virtual AcquireResult Acquire() = 0;

  // Retries Acquire() until `timeout` elapses (zero = forever).
  // Throws util::LockError for a negative timeout.
  AcquireResult Acquire(bool blocking, std::chrono::milliseconds timeout);

  // true iff this token still owned the lock
  virtual bool Release() = 0;

  // false when not owned or the lock has no lease
  virtual bool ExtendTimeout() = 0;

  // by_us: only report locks held by this token
  virtual bool Locked(bool by_us = false) = 0;

  virtual const std::string& Key() const   = 0;
  virtual const std::string& Token() const = 0;

 protected:
  // Wait between blocking attempts.
  virtual std::chrono::milliseconds NextRetryDelay(int attempt) const = 0;
};

namespace detail {

inline void ReleaseQuietly(Lock& lock) {
  try {
    lock.Release();
  } catch (const std::exception& e) {
    CIRCULATE_LOG_WARN("lock release failed", {observability::StringField("key", lock.Key()), observability::StringField("error", e.what())});
  }
}

} // namespace detail

/*
  Runs `fn(AcquireResult)` with the lock acquired per `policy`.

  `fn` always runs, so it can decide what to do when the lock was not
  obtained. Cleanup only touches a lock this call obtained:

    exception      -> release if release_on_error, rethrow
    kFailed        -> release if release_on_error
    anything else  -> release if release_on_exit
*/
template <typename Fn>
util::Outcome WithLock(Lock& lock, const LockPolicy& policy, Fn&& fn) {
  const auto result = lock.Acquire(policy.blocking, policy.timeout);
  const bool held   = Held(result);

  util::Outcome outcome;
  try {
    outcome = fn(result);
  } catch (...) {
    if (held && policy.release_on_error) detail::ReleaseQuietly(lock);
    throw;
  }

  const bool release = outcome.IsError() ? policy.release_on_error : policy.release_on_exit;
  if (held && release) detail::ReleaseQuietly(lock);
  return outcome;
}

} // namespace circulate::lock
