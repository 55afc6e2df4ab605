#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace circulate::util {

/*
  Tagged result of a unit of work run under a lock or an upload session.

  Only kFailed counts as an error for cleanup purposes. kSuperseded and
  kContinue are expected early exits and take the normal release path.
*/
struct Outcome {
  enum class Kind {
    kCompleted,
    kContinue,
    kSkipped,
    kSuperseded,
    kFailed,
  };

  Kind        kind = Kind::kCompleted;
  std::string reason;

  static Outcome Completed() {
    return {Kind::kCompleted, {}};
  }

  static Outcome Continue() {
    return {Kind::kContinue, {}};
  }

  static Outcome Skipped(std::string reason) {
    return {Kind::kSkipped, std::move(reason)};
  }

  static Outcome Superseded(std::string reason) {
    return {Kind::kSuperseded, std::move(reason)};
  }

  static Outcome Failed(std::string reason) {
    return {Kind::kFailed, std::move(reason)};
  }

  bool IsError() const {
    return kind == Kind::kFailed;
  }
};

inline std::string_view OutcomeName(Outcome::Kind kind) {
  switch (kind) {
    case Outcome::Kind::kCompleted:
      return "completed";
    case Outcome::Kind::kContinue:
      return "continue";
    case Outcome::Kind::kSkipped:
      return "skipped";
    case Outcome::Kind::kSuperseded:
      return "superseded";
    case Outcome::Kind::kFailed:
      return "failed";
  }
  return "unknown";
}

} // namespace circulate::util
