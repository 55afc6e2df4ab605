#include "internal/task/import_task.hpp"

#include <cassert>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "internal/store/memory/memory_store.hpp"
#include "internal/task/identifier_set.hpp"
#include "internal/task/reap_task.hpp"
#include "internal/util/errors.hpp"
#include "support/log_capture.hpp"

namespace {

using namespace std::chrono_literals;

using circulate::lock::AcquireResult;
using circulate::lock::LeaseLock;
using circulate::store::memory::MemoryStore;
using circulate::task::ApplyCollaborator;
using circulate::task::ApplyResult;
using circulate::task::IdentifierSet;
using circulate::task::ImportTask;
using circulate::task::ImportTaskOptions;
using circulate::task::Page;
using circulate::task::PageSource;
using circulate::task::Reaper;
using circulate::task::ReapTask;
using circulate::task::Record;
using circulate::testing::LogCapture;
using circulate::util::Outcome;
namespace v1 = circulate::v1;

// Pages keyed by cursor; "" is the first page.
class FakeSource final : public PageSource {
 public:
  void AddPage(const std::string& cursor, std::vector<std::string> identifiers, std::optional<std::string> next) {
    Page page;
    for (auto& identifier : identifiers) page.records.push_back(Record{identifier, "out", "payload-" + identifier});
    page.next_cursor = std::move(next);
    pages_[cursor]   = std::move(page);
  }

  Page Fetch(const std::string&, const std::optional<std::string>& cursor) override {
    ++fetches;
    return pages_.at(cursor.value_or(""));
  }

  int fetches = 0;

 private:
  std::map<std::string, Page> pages_;
};

class FakeCatalog final : public ApplyCollaborator {
 public:
  ApplyResult Apply(const Record& record) override {
    std::lock_guard lock(mutex_);
    applied.push_back(record.identifier);
    if (unchanged.count(record.identifier)) return ApplyResult::Unchanged();
    if (rejected.count(record.identifier)) throw circulate::util::PermanentError("rejected " + record.identifier);
    if (failed.count(record.identifier)) return ApplyResult::Failed("bad " + record.identifier);
    return ApplyResult::Applied();
  }

  std::vector<std::string> applied;
  std::set<std::string>    unchanged;
  std::set<std::string>    rejected;
  std::set<std::string>    failed;

 private:
  std::mutex mutex_;
};

class FakeReaper final : public Reaper {
 public:
  void Reap(const std::string& resource_id, const std::set<std::string>& seen) override {
    reaped_resource = resource_id;
    reaped_seen     = seen;
    ++calls;
  }

  std::string           reaped_resource;
  std::set<std::string> reaped_seen;
  int                   calls = 0;
};

struct Fixture {
  std::shared_ptr<MemoryStore> store   = std::make_shared<MemoryStore>();
  std::shared_ptr<FakeSource>  source  = std::make_shared<FakeSource>();
  std::shared_ptr<FakeCatalog> catalog = std::make_shared<FakeCatalog>();

  Fixture() {
    source->AddPage("", {"a", "b"}, std::string("p2"));
    source->AddPage("p2", {"c", "d"}, std::string("p3"));
    source->AddPage("p3", {"e", "f"}, std::nullopt);
  }

  ImportTask Task(ImportTaskOptions options = {}) {
    return ImportTask(store, source, catalog, options);
  }
};

v1::CursorTaskArgs Args(const std::string& resource) {
  v1::CursorTaskArgs args;
  args.set_resource_id(resource);
  return args;
}

// Runs the chain of successors until a terminal outcome.
std::vector<circulate::task::TaskResult> RunChain(ImportTask& task, v1::CursorTaskArgs args) {
  std::vector<circulate::task::TaskResult> results;
  for (;;) {
    results.push_back(task.Run(args));
    const auto& last = results.back();
    if (last.outcome.kind != Outcome::Kind::kContinue) break;
    assert(last.next && last.next->has_cursor());
    args = last.next->cursor();
  }
  return results;
}

void TestWalksEveryPage() {
  Fixture f;
  auto    task    = f.Task();
  auto    results = RunChain(task, Args("users"));

  assert(results.size() == 3);
  assert(results[0].outcome.kind == Outcome::Kind::kContinue);
  assert(results[1].outcome.kind == Outcome::Kind::kContinue);
  assert(results[2].outcome.kind == Outcome::Kind::kCompleted);
  assert(!results[2].next.has_value());
  assert(f.catalog->applied == (std::vector<std::string>{"a", "b", "c", "d", "e", "f"}));

  const auto& second = results[0].next->cursor();
  assert(second.cursor() == "p2");
  assert(second.page_number() == 1);
  assert(!second.root_id().empty());
  assert(results[1].next->cursor().root_id() == second.root_id());

  // locks are gone once the run is over
  assert(f.store->Scan("circulate:ImportLock").empty());
  assert(f.store->Scan("circulate:RecordLock").empty());
}

void TestStopsEarlyOnUnchangedRecord() {
  Fixture f;
  f.catalog->unchanged = {"c"};
  auto task            = f.Task();
  auto results         = RunChain(task, Args("users"));

  assert(results.size() == 2);
  assert(results[1].outcome.kind == Outcome::Kind::kCompleted);
  assert(f.catalog->applied == (std::vector<std::string>{"a", "b", "c", "d"}));
}

void TestForceIgnoresUnchanged() {
  Fixture f;
  f.catalog->unchanged = {"a", "b", "c"};
  auto task            = f.Task();
  auto args            = Args("users");
  args.set_force(true);

  auto results = RunChain(task, args);
  assert(results.size() == 3);
  assert(f.catalog->applied.size() == 6);
}

void TestSkipsWhileAnotherRunHoldsTheResource() {
  LogCapture logs;
  Fixture    f;
  LeaseLock  other(f.store, "circulate", circulate::task::kImportLockType, {"users"}, std::string("other-root"));
  assert(other.Acquire() == AcquireResult::kAcquired);

  auto task   = f.Task();
  auto result = task.Run(Args("users"));

  assert(result.outcome.kind == Outcome::Kind::kSkipped);
  assert(!result.next.has_value());
  assert(f.source->fetches == 0);
  assert(other.Locked(true));
  assert(logs.Contains("Skipping import for resource users: another task is already processing it"));
}

void TestRecordFailuresDoNotStopThePage() {
  Fixture f;
  f.catalog->failed   = {"a"};
  f.catalog->rejected = {"b"};
  f.source->AddPage("", {"a", "", "b"}, std::string("p2"));

  auto task   = f.Task();
  auto result = task.Run(Args("users"));

  assert(result.outcome.kind == Outcome::Kind::kContinue);
  assert(result.failures.size() == 3);
  assert(result.failures[0].identifier == "a" && result.failures[0].reason == "bad a");
  assert(result.failures[1].identifier.empty() && result.failures[1].reason == "record has no identifier");
  assert(result.failures[2].identifier == "b" && result.failures[2].reason == "rejected b");
  assert(f.catalog->applied == (std::vector<std::string>{"a", "b"}));
}

void TestRecordLockTimeoutFailsTheInvocation() {
  Fixture   f;
  LeaseLock busy(f.store, "circulate", circulate::task::kRecordLockType, {"b"});
  assert(busy.Acquire() == AcquireResult::kAcquired);

  ImportTaskOptions options;
  options.record_lock_timeout     = 30ms;
  options.record_lock.retry_delay = 5ms;
  auto task                       = f.Task(options);

  bool timed_out = false;
  try {
    task.Run(Args("users"));
  } catch (const circulate::util::LockTimeout& e) {
    timed_out = std::string(e.what()) == "timed out waiting for circulate:RecordLock:b";
  }
  assert(timed_out);
  assert(f.catalog->applied == (std::vector<std::string>{"a"}));
  assert(f.store->Scan("circulate:ImportLock").empty());
}

void TestCollectIdentifiersEndsWithReap() {
  Fixture f;
  f.catalog->unchanged = {"a", "c"};
  auto task            = f.Task();
  auto args            = Args("users");
  args.set_collect_identifiers(true);
  args.set_root_id("run-1");

  auto results = RunChain(task, args);
  assert(results.size() == 3);

  const auto& last = results.back();
  assert(last.outcome.kind == Outcome::Kind::kCompleted);
  assert(last.next && last.next->task_name() == ReapTask::kName);
  assert(last.next->has_reap());
  assert(last.next->reap().resource_id() == "users");
  assert(last.next->reap().root_id() == "run-1");

  IdentifierSet identifiers(f.store, "circulate", "users", "run-1");
  assert(identifiers.Members() == (std::set<std::string>{"a", "b", "c", "d", "e", "f"}));
  const auto marker_ttl = f.store->Ttl(identifiers.Prefix() + "a");
  assert(marker_ttl && *marker_ttl <= 24h && *marker_ttl > 23h);

  auto       reaper = std::make_shared<FakeReaper>();
  ReapTask   reap(f.store, reaper, "circulate");
  const auto done = reap.Run(last.next->reap());

  assert(done.outcome.kind == Outcome::Kind::kCompleted);
  assert(reaper->calls == 1);
  assert(reaper->reaped_resource == "users");
  assert(reaper->reaped_seen.size() == 6);
  assert(identifiers.Members().empty());
}

void TestIdentifierSetsOfDifferentRunsStayApart() {
  auto store = std::make_shared<MemoryStore>();

  IdentifierSet colon_resource(store, "circulate", "users:eu", "run", std::nullopt);
  IdentifierSet colon_root(store, "circulate", "users", "eu:run", std::nullopt);
  assert(colon_resource.Prefix() != colon_root.Prefix());

  colon_resource.Add({"a"});
  colon_root.Add({"b"});
  assert(colon_resource.Members() == std::set<std::string>{"a"});
  assert(colon_root.Members() == std::set<std::string>{"b"});

  colon_resource.Clear();
  assert(colon_root.Members() == std::set<std::string>{"b"});
}

void TestReapSkipsWhileImportRuns() {
  Fixture   f;
  LeaseLock other(f.store, "circulate", circulate::task::kImportLockType, {"users"}, std::string("other-root"));
  other.Acquire();

  auto reaper = std::make_shared<FakeReaper>();
  ReapTask reap(f.store, reaper, "circulate");

  v1::ReapTaskArgs args;
  args.set_resource_id("users");
  args.set_root_id("run-1");
  auto result = reap.Run(args);

  assert(result.outcome.kind == Outcome::Kind::kSkipped);
  assert(reaper->calls == 0);
}

} // namespace

int main() {
  TestWalksEveryPage();
  TestStopsEarlyOnUnchangedRecord();
  TestForceIgnoresUnchanged();
  TestSkipsWhileAnotherRunHoldsTheResource();
  TestRecordFailuresDoNotStopThePage();
  TestRecordLockTimeoutFailsTheInvocation();
  TestCollectIdentifiersEndsWithReap();
  TestIdentifierSetsOfDifferentRunsStayApart();
  TestReapSkipsWhileImportRuns();

  std::cout << "circulate_unit_import_task: pass\n";
  return 0;
}
