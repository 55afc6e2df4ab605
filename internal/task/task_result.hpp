#pragma once

#include <optional>
#include <set>
#include <string>
#include <vector>

#include "circulate/v1.hpp"
#include "internal/util/outcome.hpp"

namespace circulate::task {

struct RecordFailure {
  std::string identifier;
  std::string reason;
};

/*
  What one invocation hands back to the queue adapter.

  `next` is the successor for Outcome::kContinue, or the completion
  follow-up (reap) of a terminal page. The adapter enqueues it; handlers
  never touch the queue.
*/
struct TaskResult {
  util::Outcome                  outcome;
  std::optional<v1::TaskRequest> next;
  std::vector<RecordFailure>     failures;

  // Export only: objects finalized by the terminal page.
  std::set<std::string> finalized_keys;
};

} // namespace circulate::task
