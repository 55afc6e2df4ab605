#include "internal/upload/upload_session.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/store/memory/memory_store.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace std::chrono_literals;

using circulate::lock::AcquireResult;
using circulate::store::memory::MemoryStore;
using circulate::upload::UploadSession;
using circulate::upload::UploadSessionOptions;
using circulate::util::UploadSessionError;
using Reason = circulate::util::UploadSessionError::Reason;

circulate::v1::UploadPart Part(int32_t number, const std::string& etag) {
  circulate::v1::UploadPart part;
  part.set_part_number(number);
  part.set_etag(etag);
  return part;
}

template <typename Fn>
std::pair<Reason, std::string> ExpectSessionError(Fn&& fn) {
  try {
    fn();
  } catch (const UploadSessionError& e) {
    return {e.reason(), e.what()};
  }
  assert(false && "expected UploadSessionError");
  return {};
}

void TestRejectsInvalidSessionIds() {
  auto store = std::make_shared<MemoryStore>();
  bool threw = false;
  try {
    UploadSession session(store, "circulate", "a:b");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    UploadSession session(store, "circulate", "");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestAcquireInitializesSession() {
  auto          store = std::make_shared<MemoryStore>();
  UploadSession session(store, "circulate", "users");

  assert(!session.State().has_value());
  assert(!session.StoredUpdateNumber().has_value());

  assert(session.Acquire() == AcquireResult::kAcquired);
  assert(session.Key() == "circulate:upload:users");
  assert(session.State() == circulate::v1::UPLOAD_STATE_INITIAL);
  assert(session.StoredUpdateNumber() == 0);

  // the holder re-acquiring extends
  assert(session.Acquire() == AcquireResult::kExtended);

  UploadSession other(store, "circulate", "users");
  assert(other.Acquire() == AcquireResult::kFailed);
}

void TestEveryMutationBumpsUpdateNumber() {
  auto          store = std::make_shared<MemoryStore>();
  UploadSession session(store, "circulate", "s");
  session.Acquire();

  auto lengths = session.AppendBuffers({{"a", "12"}, {"b", "345"}});
  assert(lengths.at("a") == 2);
  assert(lengths.at("b") == 3);
  assert(session.UpdateNumber() == 1);
  assert(session.StoredUpdateNumber() == 1);
  assert(session.State() == circulate::v1::UPLOAD_STATE_UPLOADING);

  lengths = session.AppendBuffers({{"a", "xyz"}});
  assert(lengths.at("a") == 5);
  assert(session.StoredUpdateNumber() == 2);

  session.SetUploadId("a", "upload-a");
  assert(session.StoredUpdateNumber() == 3);

  session.AddPartAndClearBuffer("a", Part(1, "e1"));
  assert(session.StoredUpdateNumber() == 4);

  session.SetState(circulate::v1::UPLOAD_STATE_QUEUED);
  assert(session.StoredUpdateNumber() == 5);
  assert(session.State() == circulate::v1::UPLOAD_STATE_QUEUED);

  // empty appends are not a mutation
  assert(session.AppendBuffers({}).empty());
  assert(session.StoredUpdateNumber() == 5);
}

void TestBuffersAndParts() {
  auto          store = std::make_shared<MemoryStore>();
  UploadSession session(store, "circulate", "s");
  session.Acquire();

  session.AppendBuffers({{"out", "hello "}});
  session.SetUploadId("out", "u1");
  session.AddPartAndClearBuffer("out", Part(1, "e1"));
  session.AppendBuffers({{"out", "world"}, {"small", "x"}});

  auto [last, buffer] = session.GetPartNumAndBuffer("out");
  assert(last == 1);
  assert(buffer == "world");

  auto records = session.Get();
  assert(records.size() == 2);
  assert(records.at("out").upload_id == "u1");
  assert(records.at("out").parts.size() == 1);
  assert(records.at("out").parts[0].etag() == "e1");
  assert(!records.at("small").upload_id.has_value());

  auto selected = session.Get(std::vector<std::string>{"small", "missing"});
  assert(selected.size() == 1 && selected.count("small") == 1);

  auto ids = session.GetUploadIds({"out", "small", "missing"});
  assert(ids.at("out") == "u1");
  assert(!ids.at("small").has_value());
  assert(!ids.at("missing").has_value());
}

void TestUploadIdErrors() {
  auto          store = std::make_shared<MemoryStore>();
  UploadSession session(store, "circulate", "s");
  session.Acquire();

  auto err = ExpectSessionError([&] { session.SetUploadId("nope", "u"); });
  assert(err.first == Reason::kNotInitialized);
  assert(err.second == "Failed to set upload ID for nope: key not initialized");

  session.AppendBuffers({{"k", "v"}});
  session.SetUploadId("k", "u");
  err = ExpectSessionError([&] { session.SetUploadId("k", "u2"); });
  assert(err.first == Reason::kUploadIdConflict);
  assert(err.second == "Failed to set upload ID for k: already set");

  err = ExpectSessionError([&] { session.AddPartAndClearBuffer("k", Part(2, "e")); });
  assert(err.first == Reason::kPartOutOfOrder);

  err = ExpectSessionError([&] { session.GetPartNumAndBuffer("nope"); });
  assert(err.first == Reason::kNotInitialized);
  assert(err.second == "Failed to get part number and buffer data for nope");
}

void TestMutationRequiresLock() {
  auto          store = std::make_shared<MemoryStore>();
  UploadSession session(store, "circulate", "s");

  auto err = ExpectSessionError([&] { session.AppendBuffers({{"k", "v"}}); });
  assert(err.first == Reason::kNotLocked);
  assert(err.second == "Must hold lock");
}

void TestStaleHolderIsRejected() {
  auto          store = std::make_shared<MemoryStore>();
  UploadSession first(store, "circulate", "s", std::string("root"));
  first.Acquire();
  first.AppendBuffers({{"k", "v"}});
  first.Release();

  // a later invocation of the same run picks up the stored number
  UploadSession second(store, "circulate", "s", std::string("root"), 1);
  assert(second.Acquire() == AcquireResult::kAcquired);
  second.AppendBuffers({{"k", "w"}});

  UploadSession stale(store, "circulate", "s", std::string("root"), 1);
  auto          err = ExpectSessionError([&] { stale.AppendBuffers({{"k", "!"}}); });
  assert(err.first == Reason::kUpdateNumberMismatch);
  assert(err.second == "Update number mismatch");

  UploadSessionError superseded(Reason::kConcurrentModification, "Another process is modifying the buffers");
  assert(superseded.Superseded());
  assert(!UploadSessionError(Reason::kNotLocked, "x").Superseded());

  assert(second.Get().at("k").buffer == "vw");
}

void TestClearUploads() {
  auto          store = std::make_shared<MemoryStore>();
  UploadSession session(store, "circulate", "s");
  session.Acquire();

  auto err = ExpectSessionError([&] { session.ClearUploads(); });
  assert(err.second == "Failed to clear uploads: session has no uploads");

  session.AppendBuffers({{"a", "1"}, {"b", "2"}});
  session.SetUploadId("a", "u");
  session.ClearUploads();
  assert(session.Get().empty());
  assert(session.Locked(true));
  assert(session.State() == circulate::v1::UPLOAD_STATE_UPLOADING);
}

void TestClearSomeUploads() {
  auto          store = std::make_shared<MemoryStore>();
  UploadSession session(store, "circulate", "s");
  session.Acquire();
  session.AppendBuffers({{"a", "1"}, {"b", "2"}});
  session.SetUploadId("a", "u");

  session.ClearUploads(std::vector<std::string>{"a"});
  const auto records = session.Get();
  assert(records.size() == 1);
  assert(records.at("b").buffer == "2");

  auto err = ExpectSessionError([&] { session.ClearUploads(std::vector<std::string>{"a"}); });
  assert(err.second == "Failed to clear uploads: session has no uploads");
}

void TestLastWriterFollowsMutations() {
  auto          store = std::make_shared<MemoryStore>();
  UploadSession first(store, "circulate", "s", std::string("run:0"));
  first.Acquire();
  assert(!first.LastWriter().has_value());

  first.AppendBuffers({{"a", "1"}});
  assert(first.LastWriter() == "run:0");
  first.Release();

  UploadSession second(store, "circulate", "s", std::string("run:1"), first.UpdateNumber());
  second.Acquire();
  assert(second.LastWriter() == "run:0");
  second.AppendBuffers({{"a", "2"}});
  assert(second.LastWriter() == "run:1");
  assert(first.LastWriter() == "run:1");
}

void TestLeaseCoversSessionData() {
  auto now   = circulate::util::FromUnixMillis(1'000);
  auto store = std::make_shared<MemoryStore>([&now] { return now; });

  UploadSessionOptions options;
  options.session_timeout = 1000ms;
  UploadSession session(store, "circulate", "s", std::nullopt, 0, options);
  session.Acquire();
  session.AppendBuffers({{"a", "1"}});
  session.Release();

  now += 900ms;
  UploadSession resumed(store, "circulate", "s", std::nullopt, 1, options);
  assert(resumed.Acquire() == AcquireResult::kAcquired);

  // acquiring restarted the lease on the buffers too
  now += 900ms;
  assert(resumed.Get().at("a").buffer == "1");

  now += 200ms;
  assert(resumed.Get().empty());
  assert(!resumed.Locked());
}

void TestDeleteRemovesEverything() {
  auto          store = std::make_shared<MemoryStore>();
  UploadSession session(store, "circulate", "s");
  session.Acquire();
  session.AppendBuffers({{"a", "1"}});

  UploadSession other(store, "circulate", "s");
  assert(!other.Delete());

  assert(session.Delete());
  assert(store->Scan("circulate:upload:s").empty());
  assert(!session.State().has_value());
}

} // namespace

int main() {
  TestRejectsInvalidSessionIds();
  TestAcquireInitializesSession();
  TestEveryMutationBumpsUpdateNumber();
  TestBuffersAndParts();
  TestUploadIdErrors();
  TestMutationRequiresLock();
  TestStaleHolderIsRejected();
  TestClearUploads();
  TestClearSomeUploads();
  TestLastWriterFollowsMutations();
  TestLeaseCoversSessionData();
  TestDeleteRemovesEverything();

  std::cout << "circulate_unit_upload_session: pass\n";
  return 0;
}
