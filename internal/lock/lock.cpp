#include "lock.hpp"

#include <algorithm>
#include <thread>

#include "internal/util/errors.hpp"

namespace circulate::lock {

std::string_view AcquireResultName(AcquireResult result) {
  switch (result) {
    case AcquireResult::kAcquired:
      return "acquired";
    case AcquireResult::kExtended:
      return "extended";
    case AcquireResult::kFailed:
      return "failed";
    case AcquireResult::kTimedOut:
      return "timed_out";
  }
  return "unknown";
}

AcquireResult Lock::Acquire(bool blocking, std::chrono::milliseconds timeout) {
  if (!blocking) return Acquire();
  if (timeout.count() < 0) throw util::LockError("Cannot specify a negative timeout");

  using SteadyClock   = std::chrono::steady_clock;
  const bool forever  = timeout.count() == 0;
  const auto deadline = SteadyClock::now() + timeout;

  for (int attempt = 0;; ++attempt) {
    auto result = Acquire();
    if (Held(result)) return result;

    auto delay = NextRetryDelay(attempt);
    if (!forever) {
      const auto now = SteadyClock::now();
      if (now >= deadline) return AcquireResult::kTimedOut;
      delay = std::min(delay, std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now));
    }
    std::this_thread::sleep_for(delay);
  }
}

} // namespace circulate::lock
