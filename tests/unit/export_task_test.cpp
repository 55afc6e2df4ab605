#include "internal/task/export_task.hpp"

#include <cassert>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "internal/queue/local_task_queue.hpp"
#include "internal/queue/task_worker.hpp"
#include "internal/store/memory/memory_store.hpp"
#include "internal/util/errors.hpp"
#include "support/fake_object_store.hpp"
#include "support/log_capture.hpp"

namespace {

using circulate::lock::AcquireResult;
using circulate::queue::LocalTaskQueue;
using circulate::queue::TaskWorker;
using circulate::queue::WorkerOptions;
using circulate::store::memory::MemoryStore;
using circulate::task::ExportTask;
using circulate::task::ExportTaskOptions;
using circulate::task::Page;
using circulate::task::PageSource;
using circulate::task::Record;
using circulate::task::ScheduleExport;
using circulate::task::TaskResult;
using circulate::testing::FakeObjectStore;
using circulate::testing::LogCapture;
using circulate::upload::UploadSession;
using circulate::util::Outcome;
namespace v1 = circulate::v1;

class FakeSource final : public PageSource {
 public:
  void AddPage(const std::string& cursor, std::vector<Record> records, std::optional<std::string> next) {
    pages_[cursor] = Page{std::move(records), std::move(next)};
  }

  Page Fetch(const std::string&, const std::optional<std::string>& cursor) override {
    const auto hook = on_fetch.find(cursor.value_or(""));
    if (hook != on_fetch.end()) hook->second();
    return pages_.at(cursor.value_or(""));
  }

  // Called before a page is returned, keyed by cursor.
  std::map<std::string, std::function<void()>> on_fetch;

 private:
  std::map<std::string, Page> pages_;
};

Record Rec(const std::string& id, const std::string& output_key = "out") {
  return Record{id, output_key, "payload-" + id};
}

struct Fixture {
  std::shared_ptr<MemoryStore>     store   = std::make_shared<MemoryStore>();
  std::shared_ptr<FakeObjectStore> objects = std::make_shared<FakeObjectStore>();
  std::shared_ptr<FakeSource>      source  = std::make_shared<FakeSource>();
  ExportTaskOptions                options;

  Fixture() {
    options.upload.minimum_part_size = 4;
    source->AddPage("", {Rec("a"), Rec("b")}, std::string("p2"));
    source->AddPage("p2", {Rec("c"), Rec("d")}, std::string("p3"));
    source->AddPage("p3", {Rec("e"), Rec("f")}, std::nullopt);
  }

  ExportTask Task() {
    return ExportTask(store, objects, source, options);
  }

  UploadSession Session(const std::string& id = "users") {
    return UploadSession(store, options.key_prefix, id);
  }
};

v1::CursorTaskArgs Args(const std::string& resource) {
  v1::CursorTaskArgs args;
  args.set_resource_id(resource);
  return args;
}

std::vector<TaskResult> RunChain(ExportTask& task, v1::CursorTaskArgs args) {
  std::vector<TaskResult> results;
  for (;;) {
    results.push_back(task.Run(args));
    const auto& last = results.back();
    if (last.outcome.kind != Outcome::Kind::kContinue) break;
    args = last.next->cursor();
  }
  return results;
}

void TestObjectKeyLayout() {
  auto args = Args("users");
  args.set_run_update_number(7);
  assert(ExportTask::ObjectKey(args, "out") == "users/users-7/out");

  args.set_session_id("nightly");
  assert(ExportTask::ObjectKey(args, "a/b") == "users/nightly-7/a/b");
}

void TestScheduledExportProducesOneObject() {
  Fixture f;

  auto scheduled = ScheduleExport(f.store, f.options, "users");
  assert(scheduled.has_value());
  assert(scheduled->session_id() == "users");
  assert(scheduled->update_number() == 1);
  assert(f.Session().State() == v1::UPLOAD_STATE_QUEUED);

  // already queued
  assert(!ScheduleExport(f.store, f.options, "users").has_value());

  auto task    = f.Task();
  auto results = RunChain(task, *scheduled);

  assert(results.size() == 3);
  assert(results[0].outcome.kind == Outcome::Kind::kContinue);
  assert(results[1].outcome.kind == Outcome::Kind::kContinue);
  assert(results[2].outcome.kind == Outcome::Kind::kCompleted);
  assert(!results[2].next.has_value());

  const auto& page_two = results[0].next->cursor();
  assert(page_two.run_update_number() == 1);
  assert(page_two.start_time_unix_ms() > 0);
  assert(page_two.page_number() == 1);

  const std::string key = "users/users-1/out";
  assert(results[2].finalized_keys == std::set<std::string>{key});
  assert(f.objects->objects.at(key) == "payload-apayload-bpayload-cpayload-dpayload-epayload-f");
  assert(f.objects->creates == 1);
  assert(f.objects->OpenUploads() == 0);

  // the finished run leaves nothing behind
  assert(f.store->Scan("circulate:upload:users").empty());
}

void TestUnscheduledExportStartsAtZero() {
  Fixture f;
  f.options.upload.minimum_part_size = 1024;
  f.source->AddPage("", {Rec("a"), Rec("b", "other")}, std::nullopt);

  auto task   = f.Task();
  auto result = task.Run(Args("users"));

  assert(result.outcome.kind == Outcome::Kind::kCompleted);
  assert(f.objects->objects.at("users/users-0/out") == "payload-a");
  assert(f.objects->objects.at("users/users-0/other") == "payload-b");
  assert(f.objects->stores == 2);
}

void TestSkipsWhileAnotherTaskHoldsTheSession() {
  LogCapture logs;
  Fixture    f;
  auto       holder = f.Session();
  assert(holder.Acquire() == AcquireResult::kAcquired);

  auto task   = f.Task();
  auto result = task.Run(Args("users"));

  assert(result.outcome.kind == Outcome::Kind::kSkipped);
  assert(logs.Contains("Skipping export for resource users: another task is already processing it"));
  assert(holder.Locked(true));
  assert(f.objects->objects.empty());
}

void TestRepeatedInvocationIsSuperseded() {
  Fixture f;
  auto    task  = f.Task();
  auto    first = task.Run(Args("users"));
  assert(first.outcome.kind == Outcome::Kind::kContinue);

  const auto page_two = first.next->cursor();
  auto       again    = task.Run(page_two);
  assert(again.outcome.kind == Outcome::Kind::kContinue);

  // a repeat of the latest page finds its own work done and buffers nothing twice
  auto repeat = task.Run(page_two);
  assert(repeat.outcome.kind == Outcome::Kind::kContinue);
  assert(repeat.next->cursor().update_number() == again.next->cursor().update_number());
  assert(repeat.next->cursor().cursor() == "p3");

  auto last = task.Run(again.next->cursor());
  assert(last.outcome.kind == Outcome::Kind::kCompleted);
  assert(f.objects->objects.at("users/users-0/out") == "payload-apayload-bpayload-cpayload-dpayload-epayload-f");

  // once a later page moved the session on, the same delivery is stale
  auto duplicate = task.Run(page_two);
  assert(duplicate.outcome.kind == Outcome::Kind::kSuperseded);
  assert(duplicate.outcome.reason == "Update number mismatch");
  assert(!duplicate.next.has_value());
  assert(f.objects->aborted.empty());
  assert(f.objects->creates == 1);
}

void TestStaleDuplicateLeavesTheLiveRunAlone() {
  Fixture f;
  auto    task   = f.Task();
  auto    first  = task.Run(Args("users"));
  auto    second = task.Run(first.next->cursor());
  assert(second.outcome.kind == Outcome::Kind::kContinue);

  // the page-two message is redelivered while page three is being processed
  std::optional<TaskResult> stale;
  f.source->on_fetch["p3"] = [&] {
    if (!stale) stale = task.Run(first.next->cursor());
  };

  auto last = task.Run(second.next->cursor());

  assert(stale.has_value());
  assert(stale->outcome.kind == Outcome::Kind::kSkipped);
  assert(last.outcome.kind == Outcome::Kind::kCompleted);
  assert(f.objects->objects.at("users/users-0/out") == "payload-apayload-bpayload-cpayload-dpayload-epayload-f");
  assert(f.objects->aborted.empty());
  assert(f.store->Scan("circulate:upload:users").empty());
}

void TestRetryAfterFailedPartUploadResumesThePage() {
  Fixture f;
  auto    task = f.Task();

  int fetches = 0;
  f.source->on_fetch["p2"] = [&] {
    if (fetches++ == 0) f.objects->fail_next_part_uploads = 1;
  };

  auto       queue = std::make_shared<LocalTaskQueue>();
  WorkerOptions options;
  options.max_retries = 3;
  options.backoff     = circulate::util::BackoffPolicy{0.001, 2.0, 0.0, 0.01};
  TaskWorker worker(queue, options);
  worker.Register(ExportTask::kName, [&](const v1::TaskRequest& request) {
    return task.Run(request.cursor(), request.attempt() >= options.max_retries);
  });

  queue->Enqueue(ExportTask::kName, Args("users"));
  worker.Start();
  queue->WaitIdle();
  worker.Stop();

  assert(worker.Failures().empty());
  assert(fetches == 2);
  assert(f.objects->objects.at("users/users-0/out") == "payload-apayload-bpayload-cpayload-dpayload-epayload-f");
  assert(f.objects->creates == 1);
  assert(f.objects->aborted.empty());
  assert(f.objects->OpenUploads() == 0);
  assert(f.store->Scan("circulate:upload:users").empty());
}

void TestFinalAttemptAbortsTheRun() {
  Fixture f;
  auto    task  = f.Task();
  auto    first = task.Run(Args("users"));
  assert(f.objects->OpenUploads() == 1);

  f.objects->fail_part_uploads_after = 1;
  bool threw                         = false;
  try {
    task.Run(first.next->cursor(), true);
  } catch (const circulate::util::ObjectStoreError&) {
    threw = true;
  }

  assert(threw);
  assert(f.objects->aborted.size() == 1);
  assert(f.objects->OpenUploads() == 0);
  assert(f.store->Scan("circulate:upload:users").empty());
}

void TestForeignUploadingSessionNeedsForce() {
  Fixture f;
  auto    task = f.Task();

  auto abandoned = task.Run(Args("users"));
  assert(abandoned.outcome.kind == Outcome::Kind::kContinue);
  assert(f.objects->OpenUploads() == 1);

  auto skipped = task.Run(Args("users"));
  assert(skipped.outcome.kind == Outcome::Kind::kSkipped);
  assert(f.objects->OpenUploads() == 1);
  assert(!ScheduleExport(f.store, f.options, "users").has_value());

  auto forced_args = ScheduleExport(f.store, f.options, "users", std::nullopt, true);
  assert(forced_args.has_value());

  auto results = RunChain(task, *forced_args);

  // the forced invocation only discards the old run and restarts page 0
  assert(results.size() == 4);
  assert(results[0].outcome.kind == Outcome::Kind::kContinue);
  const auto& restart = results[0].next->cursor();
  assert(!restart.force());
  assert(restart.page_number() == 0 && !restart.has_cursor());
  assert(restart.update_number() == 4);

  assert(results.back().outcome.kind == Outcome::Kind::kCompleted);
  assert(f.objects->aborted.size() == 1);
  assert(f.objects->OpenUploads() == 0);
  assert(f.objects->objects.at("users/users-4/out") == "payload-apayload-bpayload-cpayload-dpayload-epayload-f");
}

void TestRecordsWithoutOutputKeyAreReported() {
  Fixture f;
  f.source->AddPage("", {Rec("a"), Rec("z", "")}, std::nullopt);

  auto task   = f.Task();
  auto result = task.Run(Args("users"));

  assert(result.outcome.kind == Outcome::Kind::kCompleted);
  assert(result.failures.size() == 1);
  assert(result.failures[0].identifier == "z");
  assert(result.failures[0].reason == "record has no output key");
  assert(result.finalized_keys.size() == 1);
}

void TestCustomSessionId() {
  Fixture f;
  f.source->AddPage("", {Rec("a")}, std::nullopt);

  auto scheduled = ScheduleExport(f.store, f.options, "users", std::string("nightly"));
  assert(scheduled && scheduled->session_id() == "nightly");
  assert(f.Session("nightly").State() == v1::UPLOAD_STATE_QUEUED);

  auto task   = f.Task();
  auto result = task.Run(*scheduled);
  assert(result.outcome.kind == Outcome::Kind::kCompleted);
  assert(f.objects->objects.at("users/nightly-1/out") == "payload-a");
}

} // namespace

int main() {
  TestObjectKeyLayout();
  TestScheduledExportProducesOneObject();
  TestUnscheduledExportStartsAtZero();
  TestSkipsWhileAnotherTaskHoldsTheSession();
  TestRepeatedInvocationIsSuperseded();
  TestStaleDuplicateLeavesTheLiveRunAlone();
  TestRetryAfterFailedPartUploadResumesThePage();
  TestFinalAttemptAbortsTheRun();
  TestForeignUploadingSessionNeedsForce();
  TestRecordsWithoutOutputKeyAreReported();
  TestCustomSessionId();

  std::cout << "circulate_unit_export_task: pass\n";
  return 0;
}
