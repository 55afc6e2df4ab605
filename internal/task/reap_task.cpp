#include "reap_task.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/task/identifier_set.hpp"
#include "internal/task/import_task.hpp"

namespace circulate::task {

ReapTask::ReapTask(std::shared_ptr<store::CoordinationStore> store,
                   std::shared_ptr<Reaper>                   reaper,
                   std::string                               key_prefix,
                   lock::LeaseLockOptions                    lock_options)
    : store_(std::move(store)), reaper_(std::move(reaper)), key_prefix_(std::move(key_prefix)), lock_options_(std::move(lock_options)) {
  if (!store_ || !reaper_) throw std::invalid_argument("reap task requires a store and a reaper");
}

TaskResult ReapTask::Run(const v1::ReapTaskArgs& args) {
  IdentifierSet identifiers(store_, key_prefix_, args.resource_id(), args.root_id());

  lock::LeaseLock resource_lock(store_, key_prefix_, kImportLockType, {args.resource_id()}, args.root_id(), lock_options_);

  TaskResult result;
  result.outcome = lock::WithLock(resource_lock, lock::LockPolicy{}, [&](lock::AcquireResult acquired) {
    if (!lock::Held(acquired)) {
      CIRCULATE_LOG_INFO("Skipping reap for resource " + args.resource_id() + ": another task is already processing it");
      return util::Outcome::Skipped("another task is already processing it");
    }

    auto seen = identifiers.Members();
    reaper_->Reap(args.resource_id(), seen);
    identifiers.Clear();

    CIRCULATE_LOG_INFO("reap finished",
                       {observability::StringField("resource", args.resource_id()), observability::IntField("seen", static_cast<int64_t>(seen.size()))});
    return util::Outcome::Completed();
  });
  return result;
}

} // namespace circulate::task
