#include "internal/util/backoff.hpp"

#include <cassert>
#include <chrono>
#include <cmath>
#include <iostream>
#include <stdexcept>

namespace {

using circulate::util::Backoff;
using circulate::util::BackoffDelay;
using circulate::util::BackoffPolicy;

template <typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const std::invalid_argument&) {
    return true;
  }
  return false;
}

void TestZeroRetriesWithoutJitterIsFactor() {
  assert(Backoff(0, 3.0, 3.0, 0.0) == 3.0);
  assert(Backoff(0, 0.5, 2.0, 0.0) == 0.5);
}

void TestGrowsExponentially() {
  assert(Backoff(1, 3.0, 3.0, 0.0) == 9.0);
  assert(Backoff(2, 3.0, 3.0, 0.0) == 27.0);
  assert(Backoff(3, 1.0, 2.0, 0.0) == 8.0);
}

void TestNonDecreasingWithoutJitter() {
  double previous = 0.0;
  for (int retries = 0; retries < 12; ++retries) {
    const double delay = Backoff(retries, 1.5, 2.0, 0.0);
    assert(delay >= previous);
    previous = delay;
  }
}

void TestJitterStaysInBounds() {
  for (int i = 0; i < 500; ++i) {
    const double delay = Backoff(2, 3.0, 3.0, 0.3);
    assert(delay >= 27.0 * 0.7 - 1e-9);
    assert(delay <= 27.0 * 1.3 + 1e-9);
  }
}

void TestMaxTimeCaps() {
  for (int retries = 0; retries < 20; ++retries) {
    assert(Backoff(retries, 3.0, 3.0, 0.3, 60.0) <= 60.0);
  }
  assert(Backoff(10, 3.0, 3.0, 0.0, 5.0) == 5.0);
}

void TestValidation() {
  assert(Throws([] { Backoff(-1); }));
  assert(Throws([] { Backoff(0, 3.0, 3.0, -0.1); }));
  assert(Throws([] { Backoff(0, 3.0, 3.0, 1.1); }));
  assert(Throws([] { Backoff(0, -1.0); }));
  assert(Throws([] { Backoff(0, 3.0, 1.0); }));
  assert(!Throws([] { Backoff(0, 0.0, 1.0001, 1.0); }));
}

void TestDelayInMilliseconds() {
  BackoffPolicy policy;
  policy.factor = 0.25;
  policy.base   = 2.0;
  policy.jitter = 0.0;

  assert(BackoffDelay(0, policy).count() == 250);
  assert(BackoffDelay(2, policy).count() == 1000);
}

void TestDelayIsCappedForHugeRetryCounts() {
  BackoffPolicy policy;
  policy.jitter = 0.0;

  const auto week = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::hours(24 * 7)).count();
  assert(BackoffDelay(40, policy).count() == week);
  assert(BackoffDelay(2000, policy).count() == week);

  policy.factor = 0.0;
  assert(Backoff(2000, policy) == 0.0);
  assert(BackoffDelay(2000, policy).count() == 0);
}

} // namespace

int main() {
  TestZeroRetriesWithoutJitterIsFactor();
  TestGrowsExponentially();
  TestNonDecreasingWithoutJitter();
  TestJitterStaysInBounds();
  TestMaxTimeCaps();
  TestValidation();
  TestDelayInMilliseconds();
  TestDelayIsCappedForHugeRetryCounts();

  std::cout << "circulate_unit_backoff: pass\n";
  return 0;
}
