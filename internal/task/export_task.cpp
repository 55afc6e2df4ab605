#include "export_task.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/task/cursor_task.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace circulate::task {

using util::Outcome;

namespace {

constexpr const char* kScheduleTaskName = "schedule_export";

std::string SessionIdFor(const v1::CursorTaskArgs& args) {
  return args.session_id().empty() ? args.resource_id() : args.session_id();
}

// Owner token of one page of one run. Retries of the page share it, other
// pages of the run do not.
std::string InvocationToken(const v1::CursorTaskArgs& args) {
  return args.root_id() + ":" + std::to_string(args.page_number());
}

} // namespace

ExportTask::ExportTask(std::shared_ptr<store::CoordinationStore> store,
                       storage::ObjectStorePtr                   objects,
                       std::shared_ptr<PageSource>               source,
                       ExportTaskOptions                         options)
    : store_(std::move(store)), objects_(std::move(objects)), source_(std::move(source)), options_(std::move(options)) {
  if (!store_ || !objects_ || !source_) throw std::invalid_argument("export task requires a store, an object store and a page source");
}

std::string ExportTask::ObjectKey(const v1::CursorTaskArgs& args, const std::string& output_key) {
  return args.resource_id() + "/" + SessionIdFor(args) + "-" + std::to_string(args.run_update_number()) + "/" + output_key;
}

TaskResult ExportTask::Run(const v1::CursorTaskArgs& input, bool final_attempt) {
  if (input.resource_id().empty()) throw std::invalid_argument("export task requires a resource id");

  v1::CursorTaskArgs args = input;
  EnsureRootId(args);
  args.set_session_id(SessionIdFor(args));

  const bool first_page = args.page_number() == 0 && !args.has_cursor();

  observability::SpanScope span("task.export");
  span.SetAttribute("resource", args.resource_id());
  span.SetAttribute("session", args.session_id());
  span.SetAttribute("page", static_cast<int64_t>(args.page_number()));

  auto session = std::make_shared<upload::UploadSession>(store_, options_.key_prefix, args.session_id(), InvocationToken(args),
                                                         static_cast<int64_t>(args.update_number()), options_.session);
  upload::UploadManager manager(objects_, session, options_.upload);

  TaskResult result;
  result.outcome = manager.Begin([&](bool locked) {
    if (!locked) {
      CIRCULATE_LOG_INFO("Skipping export for resource " + args.resource_id() + ": another task is already processing it");
      return Outcome::Skipped("another task is already processing it");
    }

    const auto stored = session->StoredUpdateNumber();

    // an earlier attempt of this invocation already buffered the page
    const bool resumed = stored && *stored != session->UpdateNumber() && session->LastWriter() == session->Token();
    if (resumed) {
      CIRCULATE_LOG_INFO("resuming export page after a failed attempt",
                         {observability::StringField("session", args.session_id()), observability::IntField("page", args.page_number()),
                          observability::IntField("update_number", *stored)});
      session->SetUpdateNumber(*stored);
    } else if (first_page) {
      const bool foreign = session->State() == v1::UPLOAD_STATE_UPLOADING && stored != session->UpdateNumber();
      if (foreign) {
        if (!args.force()) {
          CIRCULATE_LOG_WARN("Skipping export for resource " + args.resource_id() + ": upload session " + args.session_id() + " belongs to another run");
          return Outcome::Skipped("upload session belongs to another run");
        }

        CIRCULATE_LOG_WARN("discarding upload session left by another run",
                           {observability::StringField("session", args.session_id()), observability::IntField("update_number", stored.value_or(0))});
        session->SetUpdateNumber(stored.value_or(0));
        manager.Reset();

        // the run starts over from page 0 under the new update number
        auto restart = args;
        restart.set_force(false);
        restart.set_update_number(static_cast<uint64_t>(session->UpdateNumber()));
        result.next = MakeRequest(kName, restart);
        return Outcome::Continue();
      }
    } else if (stored != session->UpdateNumber()) {
      CIRCULATE_LOG_INFO("export invocation superseded",
                         {observability::StringField("session", args.session_id()), observability::IntField("expected", session->UpdateNumber()),
                          observability::IntField("stored", stored.value_or(-1))});
      return Outcome::Superseded("Update number mismatch");
    }

    if (first_page) {
      args.set_run_update_number(args.update_number());
      if (args.start_time_unix_ms() == 0) args.set_start_time_unix_ms(static_cast<int64_t>(util::ToUnixMillis(util::Now())));
    }

    std::optional<std::string> cursor;
    if (args.has_cursor()) cursor = args.cursor();

    auto page = source_->Fetch(args.resource_id(), cursor);
    for (const auto& record : page.records) {
      if (record.output_key.empty()) {
        result.failures.push_back({record.identifier, "record has no output key"});
        continue;
      }
      if (!resumed) manager.AddRecord(ObjectKey(args, record.output_key), record.payload);
    }

    if (ShouldContinue(page, false, args)) {
      manager.Sync();

      auto next = NextArgs(args, *page.next_cursor);
      next.set_update_number(static_cast<uint64_t>(session->UpdateNumber()));
      result.next = MakeRequest(kName, next);
      return Outcome::Continue();
    }

    result.finalized_keys = manager.Complete();
    if (!session->Delete()) {
      CIRCULATE_LOG_WARN("upload session not deleted after completion", {observability::StringField("session", args.session_id())});
    }

    CIRCULATE_LOG_INFO("export finished",
                       {observability::StringField("resource", args.resource_id()), observability::IntField("pages", args.page_number() + 1),
                        observability::IntField("objects", static_cast<int64_t>(result.finalized_keys.size()))});
    return Outcome::Completed();
  }, final_attempt);

  return result;
}

// ------------------------------------------------------------------
// Scheduling
// ------------------------------------------------------------------

std::optional<v1::CursorTaskArgs> ScheduleExport(std::shared_ptr<store::CoordinationStore> store,
                                                 const ExportTaskOptions&                  options,
                                                 const std::string&                        resource_id,
                                                 std::optional<std::string>                session_id,
                                                 bool                                      force) {
  v1::CursorTaskArgs args;
  args.set_resource_id(resource_id);
  args.set_session_id(session_id ? *session_id : resource_id);
  args.set_force(force);
  EnsureRootId(args);

  auto task_lock = lock::MakeTaskLock(store, options.key_prefix, kScheduleTaskName, args.root_id(),
                                      std::vector<std::string>{"Task", kScheduleTaskName, args.session_id()});

  std::optional<v1::CursorTaskArgs> scheduled;
  lock::WithLock(*task_lock, lock::LockPolicy{}, [&](lock::AcquireResult acquired) {
    if (!lock::Held(acquired)) {
      CIRCULATE_LOG_INFO("Skipping export scheduling for resource " + resource_id + ": another task is already processing it");
      return Outcome::Skipped("another task is already processing it");
    }

    upload::UploadSession session(store, options.key_prefix, args.session_id(), args.root_id(), 0, options.session);
    return lock::WithLock(session, lock::LockPolicy{}, [&](lock::AcquireResult session_acquired) {
      if (!lock::Held(session_acquired)) {
        CIRCULATE_LOG_INFO("Skipping export for resource " + resource_id + ": another task is already processing it");
        return Outcome::Skipped("another task is already processing it");
      }

      const auto state = session.State();
      if (state == v1::UPLOAD_STATE_QUEUED || (state == v1::UPLOAD_STATE_UPLOADING && !force)) {
        CIRCULATE_LOG_INFO("Skipping export for resource " + resource_id + ": upload session is " + v1::UploadState_Name(*state));
        return Outcome::Skipped("session already queued");
      }

      if (state == v1::UPLOAD_STATE_UPLOADING) {
        // forced: the first invocation discards the old run
        scheduled = args;
        return Outcome::Completed();
      }

      session.SetUpdateNumber(session.StoredUpdateNumber().value_or(0));
      session.SetState(v1::UPLOAD_STATE_QUEUED);

      args.set_update_number(static_cast<uint64_t>(session.UpdateNumber()));
      scheduled = args;
      return Outcome::Completed();
    });
  });

  return scheduled;
}

} // namespace circulate::task
