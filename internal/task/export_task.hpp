#pragma once

#include <memory>
#include <optional>
#include <string>

#include "circulate/v1.hpp"
#include "internal/lock/lease_lock.hpp"
#include "internal/storage/object_store.hpp"
#include "internal/store/api/coordination_store.hpp"
#include "internal/task/page_source.hpp"
#include "internal/task/task_result.hpp"
#include "internal/upload/upload_manager.hpp"
#include "internal/upload/upload_session.hpp"

namespace circulate::task {

struct ExportTaskOptions {
  std::string                  key_prefix = "circulate";
  upload::UploadSessionOptions session;
  upload::UploadOptions        upload;
};

/*
  ExportTask

  One invocation serializes one page of a resource's feed into the run's
  upload session. The session lock is the resource lock, owned by
  "{root_id}:{page_number}" so retries of one page re-enter it and other
  pages of the run cannot.

      page 0:  adopt the session (a leftover UPLOADING session from another
               run is skipped, or reset and the run restarted when forced)
      page k:  exit Superseded when the stored update number moved on
      retry:   when this page made the last mutation, carry on from the
               stored update number without buffering the page again
      any:     AddRecord() per record, Sync(), Continue(next page)
      last:    Complete(), delete the session, report finalized keys

  Each record lands in the object

      {resource}/{session}-{run_update_number}/{output_key}

  so a stale run can never overwrite a newer run's output.
*/
class ExportTask {
 public:
  static constexpr const char* kName = "export";

  ExportTask(std::shared_ptr<store::CoordinationStore> store,
             storage::ObjectStorePtr                   objects,
             std::shared_ptr<PageSource>               source,
             ExportTaskOptions                         options = {});

  // On the final attempt a transient failure aborts the run's uploads.
  TaskResult Run(const v1::CursorTaskArgs& args, bool final_attempt = false);

  static std::string ObjectKey(const v1::CursorTaskArgs& args, const std::string& output_key);

 private:
  std::shared_ptr<store::CoordinationStore> store_;
  storage::ObjectStorePtr                   objects_;
  std::shared_ptr<PageSource>               source_;
  ExportTaskOptions                         options_;
};

/*
  Prepares the first invocation of an export run: takes the scheduling task
  lock, creates the session, marks it QUEUED and returns the arguments to
  enqueue. nullopt when a run for the session is already queued or
  uploading, or another scheduler holds the task lock.
*/
std::optional<v1::CursorTaskArgs> ScheduleExport(std::shared_ptr<store::CoordinationStore> store,
                                                 const ExportTaskOptions&                  options,
                                                 const std::string&                        resource_id,
                                                 std::optional<std::string>                session_id = std::nullopt,
                                                 bool                                      force      = false);

} // namespace circulate::task
