#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <string_view>

#include "internal/storage/object_store.hpp"
#include "internal/upload/upload_session.hpp"
#include "internal/util/outcome.hpp"

namespace circulate::upload {

struct UploadOptions {
  std::string content_type = "application/octet-stream";

  // Persisted buffers at or above this size are flushed as a multipart part.
  int64_t minimum_part_size = 5 * 1024 * 1024;
};

/*
  UploadManager

  Turns records produced across many task invocations into objects:

      AddRecord()   in-process only, lost if the invocation dies
      Sync()        buffers -> session; full buffers -> next multipart part
      Complete()    last parts, multipart completion, small keys stored whole

  Keys are object keys. Only state that went through Sync() survives into
  the next invocation.
*/
class UploadManager {
 public:
  UploadManager(storage::ObjectStorePtr objects, std::shared_ptr<UploadSession> session, UploadOptions options = {});

  void AddRecord(const std::string& key, std::string_view bytes);

  void Sync(bool complete = false);

  // Finalized keys. The session keeps its lock but loses every upload.
  std::set<std::string> Complete();

  /*
    Runs fn(locked) holding the session lock when it could be taken.

      supersession (UploadSessionError from a newer invocation)
                           -> Outcome::Superseded
      util::TransientError -> lock released, session kept for the retry,
                              rethrown. On the final attempt it is handled
                              like any other exception.
      other exception      -> AbortSession(), rethrown
      Failed outcome       -> AbortSession()
      otherwise            -> lock released

    A holder that only re-entered a lock under the same token leaves it in
    place when superseded; the invocation that moved the session on owns it.
  */
  util::Outcome Begin(const std::function<util::Outcome(bool locked)>& fn, bool final_attempt = false);

  // Aborts open multipart uploads and deletes the session. Does nothing once
  // the lock belongs to someone else. Abort errors are logged.
  void AbortSession();

  // Aborts open multipart uploads and drops every buffer, keeping the lock
  // and the session. The session's update number must be current.
  void Reset();

  UploadSession& Session() {
    return *session_;
  }

 private:
  void Flush(const std::string& key, const UploadRecord& record);
  void AbortUploads(const std::map<std::string, UploadRecord>& records);

  storage::ObjectStorePtr            objects_;
  std::shared_ptr<UploadSession>     session_;
  UploadOptions                      options_;
  std::map<std::string, std::string> buffers_;
};

} // namespace circulate::upload
