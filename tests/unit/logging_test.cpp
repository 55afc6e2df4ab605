#include "internal/observability/logging.hpp"

#include <cassert>
#include <iostream>
#include <thread>

#include <spdlog/spdlog.h>

#include "support/log_capture.hpp"

namespace {

using circulate::observability::BoolField;
using circulate::observability::IntField;
using circulate::observability::LogScope;
using circulate::observability::StringField;
using circulate::testing::LogCapture;

void TestFieldsAreQuotedWhenNeeded() {
  LogCapture logs;
  CIRCULATE_LOG_INFO("uploaded part", {StringField("key", "users/users-0/out"), StringField("error", "disk \"full\""), IntField("part", 3),
                                       BoolField("final", true), StringField("etag", "")});
  assert(logs.Contains(R"(uploaded part key=users/users-0/out error="disk \"full\"" part=3 final=true etag="")"));
}

void TestScopeFieldsFollowTheCallFields() {
  LogCapture logs;
  {
    LogScope task({StringField("task", "export"), StringField("task_id", "t-1")});
    CIRCULATE_LOG_WARN("task failed, retrying", {IntField("delay_ms", 5)});
    {
      LogScope page({IntField("page", 2)});
      CIRCULATE_LOG_INFO("fetched page");
      assert(LogScope::Current().size() == 3);
    }
    assert(LogScope::Current().size() == 2);
  }
  CIRCULATE_LOG_INFO("worker idle");

  assert(logs.Contains("task failed, retrying delay_ms=5 task=export task_id=t-1"));
  assert(logs.Contains("fetched page task=export task_id=t-1 page=2"));
  assert(logs.Contains("worker idle"));
  assert(!logs.Contains("worker idle task="));
  assert(LogScope::Current().empty());
}

void TestScopesArePerThread() {
  LogScope outer({StringField("task", "import")});

  bool empty_elsewhere = false;
  std::thread other([&] { empty_elsewhere = LogScope::Current().empty(); });
  other.join();

  assert(empty_elsewhere);
  assert(LogScope::Current().size() == 1);
}

void TestSuppressedLevelsAreNotFormatted() {
  LogCapture logs;
  spdlog::default_logger()->set_level(spdlog::level::warn);

  CIRCULATE_LOG_DEBUG("part buffered");
  CIRCULATE_LOG_WARN("lock lost");

  assert(!logs.Contains("part buffered"));
  assert(logs.Contains("lock lost"));
}

} // namespace

int main() {
  TestFieldsAreQuotedWhenNeeded();
  TestScopeFieldsFollowTheCallFields();
  TestScopesArePerThread();
  TestSuppressedLevelsAreNotFormatted();

  std::cout << "circulate_unit_logging: pass\n";
  return 0;
}
