#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "circulate/v1.hpp"
#include "internal/lock/lease_lock.hpp"
#include "internal/store/api/coordination_store.hpp"
#include "internal/task/apply.hpp"
#include "internal/task/page_source.hpp"
#include "internal/task/task_result.hpp"

namespace circulate::task {

inline constexpr const char* kImportLockType = "ImportLock";
inline constexpr const char* kRecordLockType = "RecordLock";

struct ImportTaskOptions {
  std::string key_prefix = "circulate";

  // Resource lock, owned by the run's root id.
  lock::LeaseLockOptions resource_lock;

  // Per-identifier lock around each Apply() call.
  lock::LeaseLockOptions    record_lock;
  std::chrono::milliseconds record_lock_timeout = std::chrono::seconds(30);

  std::chrono::milliseconds identifier_ttl = std::chrono::hours(24);
};

/*
  ImportTask

  One invocation imports one page of a resource's feed:

      ImportLock(resource) non-blocking  -> Skipped when held elsewhere
      Fetch(resource, cursor)
      Apply(record) under RecordLock(identifier), record by record
      Continue(next page) or, after the last page, a reap follow-up

  Record locks wait up to record_lock_timeout; running out throws
  util::LockTimeout so the queue retries the whole page.
*/
class ImportTask {
 public:
  static constexpr const char* kName = "import";

  ImportTask(std::shared_ptr<store::CoordinationStore> store,
             std::shared_ptr<PageSource>               source,
             std::shared_ptr<ApplyCollaborator>        apply,
             ImportTaskOptions                         options = {});

  TaskResult Run(const v1::CursorTaskArgs& args);

 private:
  ApplyResult ApplyLocked(const Record& record);

  std::shared_ptr<store::CoordinationStore> store_;
  std::shared_ptr<PageSource>               source_;
  std::shared_ptr<ApplyCollaborator>        apply_;
  ImportTaskOptions                         options_;
};

} // namespace circulate::task
