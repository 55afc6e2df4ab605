#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "circulate/v1.hpp"
#include "internal/queue/task_queue.hpp"
#include "internal/task/task_result.hpp"
#include "internal/util/backoff.hpp"

namespace circulate::queue {

using TaskHandler = std::function<task::TaskResult(const v1::TaskRequest&)>;

struct WorkerOptions {
  uint32_t           threads     = 1;
  uint32_t           max_retries = 3;
  util::BackoffPolicy backoff;
};

// A request that ended without completing.
struct TaskFailure {
  v1::TaskRequest request;
  std::string     error;
};

/*
  Pool of threads running queued requests through registered handlers.

      Continue / follow-up   -> next request enqueued
      util::TransientError   -> same request re-enqueued after
                                Backoff(attempt), up to max_retries
      anything else thrown   -> terminal failure
*/
class TaskWorker {
 public:
  TaskWorker(std::shared_ptr<TaskQueue> queue, WorkerOptions options = {});
  ~TaskWorker();

  void Register(const std::string& task_name, TaskHandler handler);

  void Start();
  void Stop();

  // Runs one request on the calling thread.
  void Process(const v1::TaskRequest& request);

  std::vector<TaskFailure> Failures() const;

  // Attempt number past which a transient error is no longer retried.
  uint32_t MaxRetries() const {
    return options_.max_retries;
  }

 private:
  void Run();
  void Fail(const v1::TaskRequest& request, const std::string& error);

  std::shared_ptr<TaskQueue>         queue_;
  WorkerOptions                      options_;
  std::map<std::string, TaskHandler> handlers_;

  mutable std::mutex       failures_mutex_;
  std::vector<TaskFailure> failures_;

  std::vector<std::thread> threads_;
  std::atomic<bool>        running_{false};
};

} // namespace circulate::queue
