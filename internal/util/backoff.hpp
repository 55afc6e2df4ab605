#pragma once

#include <chrono>
#include <optional>

namespace circulate::util {

/*
  Exponential backoff with jitter.

      delay = factor * base^retries * U[1 - jitter, 1 + jitter]

  capped at max_time seconds when given. Shared by task retry scheduling and
  lock re-acquisition so that many workers failing together spread out instead
  of retrying in lockstep.
*/
struct BackoffPolicy {
  double                factor = 3.0;
  double                base   = 3.0;
  double                jitter = 0.3;
  std::optional<double> max_time;
};

// Seconds to wait before retry number `retries` (0 based).
// Throws std::invalid_argument for retries < 0, jitter outside [0, 1],
// factor < 0 or base <= 1.
double Backoff(int retries, double factor = 3.0, double base = 3.0, double jitter = 0.3, std::optional<double> max_time = std::nullopt);

double Backoff(int retries, const BackoffPolicy& policy);

// Backoff() in milliseconds, capped at one week.
std::chrono::milliseconds BackoffDelay(int retries, const BackoffPolicy& policy);

} // namespace circulate::util
