#include "backoff.hpp"

#include <algorithm>
#include <cmath>
#include <random>
#include <stdexcept>

namespace circulate::util {

namespace {

// One week. Larger delays are meaningless for retry scheduling and would
// overflow the integer conversion.
constexpr double kMaxDelayMillis = 7.0 * 24 * 60 * 60 * 1000;

double JitterMultiplier(double jitter) {
  if (jitter == 0.0) return 1.0;

  static thread_local std::mt19937_64    rng{std::random_device{}()};
  std::uniform_real_distribution<double> dist(1.0 - jitter, 1.0 + jitter);
  return dist(rng);
}

} // namespace

double Backoff(int retries, double factor, double base, double jitter, std::optional<double> max_time) {
  if (retries < 0) throw std::invalid_argument("backoff: retries must be >= 0");
  if (jitter < 0.0 || jitter > 1.0) throw std::invalid_argument("backoff: jitter must be between 0 and 1");
  if (factor < 0.0) throw std::invalid_argument("backoff: factor must be >= 0");
  if (base <= 1.0) throw std::invalid_argument("backoff: base must be > 1");
  if (factor == 0.0) return 0.0;

  double delay = factor * std::pow(base, retries) * JitterMultiplier(jitter);
  if (max_time) delay = std::min(delay, *max_time);
  return delay;
}

double Backoff(int retries, const BackoffPolicy& policy) {
  return Backoff(retries, policy.factor, policy.base, policy.jitter, policy.max_time);
}

std::chrono::milliseconds BackoffDelay(int retries, const BackoffPolicy& policy) {
  const auto millis = std::min(Backoff(retries, policy) * 1000.0, kMaxDelayMillis);
  return std::chrono::milliseconds(static_cast<int64_t>(std::llround(millis)));
}

} // namespace circulate::util
