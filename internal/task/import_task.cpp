#include "import_task.hpp"

#include <stdexcept>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/task/cursor_task.hpp"
#include "internal/task/identifier_set.hpp"
#include "internal/task/reap_task.hpp"
#include "internal/util/errors.hpp"

namespace circulate::task {

using lock::AcquireResult;
using util::Outcome;

ImportTask::ImportTask(std::shared_ptr<store::CoordinationStore> store,
                       std::shared_ptr<PageSource>               source,
                       std::shared_ptr<ApplyCollaborator>        apply,
                       ImportTaskOptions                         options)
    : store_(std::move(store)), source_(std::move(source)), apply_(std::move(apply)), options_(std::move(options)) {
  if (!store_ || !source_ || !apply_) throw std::invalid_argument("import task requires a store, a page source and an apply collaborator");
}

ApplyResult ImportTask::ApplyLocked(const Record& record) {
  lock::LeaseLock record_lock(store_, options_.key_prefix, kRecordLockType, {record.identifier}, std::nullopt, options_.record_lock);

  lock::LockPolicy policy;
  policy.blocking = true;
  policy.timeout  = options_.record_lock_timeout;

  ApplyResult applied;
  lock::WithLock(record_lock, policy, [&](AcquireResult result) {
    if (!lock::Held(result)) {
      throw util::LockTimeout("timed out waiting for " + record_lock.Key());
    }

    try {
      applied = apply_->Apply(record);
    } catch (const util::PermanentError& e) {
      applied = ApplyResult::Failed(e.what());
    }
    return Outcome::Completed();
  });
  return applied;
}

TaskResult ImportTask::Run(const v1::CursorTaskArgs& input) {
  if (input.resource_id().empty()) throw std::invalid_argument("import task requires a resource id");

  v1::CursorTaskArgs args = input;
  EnsureRootId(args);

  observability::SpanScope span("task.import");
  span.SetAttribute("resource", args.resource_id());
  span.SetAttribute("page", static_cast<int64_t>(args.page_number()));

  lock::LeaseLock resource_lock(store_, options_.key_prefix, kImportLockType, {args.resource_id()}, args.root_id(), options_.resource_lock);

  TaskResult result;
  result.outcome = lock::WithLock(resource_lock, lock::LockPolicy{}, [&](AcquireResult acquired) {
    if (!lock::Held(acquired)) {
      CIRCULATE_LOG_INFO("Skipping import for resource " + args.resource_id() + ": another task is already processing it");
      return Outcome::Skipped("another task is already processing it");
    }

    std::optional<std::string> cursor;
    if (args.has_cursor()) cursor = args.cursor();

    auto page = source_->Fetch(args.resource_id(), cursor);

    bool                     found_unchanged = false;
    std::vector<std::string> seen;
    for (const auto& record : page.records) {
      if (record.identifier.empty()) {
        result.failures.push_back({"", "record has no identifier"});
        continue;
      }
      seen.push_back(record.identifier);

      auto applied = ApplyLocked(record);
      switch (applied.kind) {
        case ApplyResult::Kind::kApplied:
          break;
        case ApplyResult::Kind::kUnchanged:
          found_unchanged = true;
          break;
        case ApplyResult::Kind::kFailed:
          result.failures.push_back({record.identifier, applied.reason});
          CIRCULATE_LOG_WARN("record import failed",
                             {observability::StringField("resource", args.resource_id()), observability::StringField("identifier", record.identifier),
                              observability::StringField("reason", applied.reason)});
          break;
      }
    }

    if (args.collect_identifiers()) {
      IdentifierSet(store_, options_.key_prefix, args.resource_id(), args.root_id(), options_.identifier_ttl).Add(seen);
    }

    if (ShouldContinue(page, found_unchanged, args)) {
      result.next = MakeRequest(kName, NextArgs(args, *page.next_cursor));
      return Outcome::Continue();
    }

    CIRCULATE_LOG_INFO("import finished",
                       {observability::StringField("resource", args.resource_id()), observability::IntField("pages", args.page_number() + 1),
                        observability::BoolField("stopped_early", page.next_cursor.has_value())});

    if (args.collect_identifiers()) {
      v1::ReapTaskArgs reap;
      reap.set_resource_id(args.resource_id());
      reap.set_root_id(args.root_id());
      result.next = MakeRequest(ReapTask::kName, reap);
    }
    return Outcome::Completed();
  });

  return result;
}

} // namespace circulate::task
