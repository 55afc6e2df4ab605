#pragma once

#include <string>
#include <utility>

#include "internal/task/page_source.hpp"

namespace circulate::task {

struct ApplyResult {
  enum class Kind {
    kApplied,
    kUnchanged,
    kFailed,
  };

  Kind        kind = Kind::kApplied;
  std::string reason;

  static ApplyResult Applied() {
    return {Kind::kApplied, {}};
  }

  // The catalog already matches the record.
  static ApplyResult Unchanged() {
    return {Kind::kUnchanged, {}};
  }

  static ApplyResult Failed(std::string reason) {
    return {Kind::kFailed, std::move(reason)};
  }
};

/*
  Catalog side of an import. Called once per record while the record lock
  for its identifier is held.

  A per-record problem is reported as Failed or by throwing
  util::PermanentError; util::TransientError fails the whole invocation.
*/
class ApplyCollaborator {
 public:
  virtual ~ApplyCollaborator() = default;

  virtual ApplyResult Apply(const Record& record) = 0;
};

} // namespace circulate::task
