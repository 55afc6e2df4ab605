#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "circulate/v1.hpp"

namespace circulate::queue {

/*
  Queue the task handlers' results are fed back into.

  Enqueue() returns the request's task id as the handle. A delayed request
  is not handed out before its delay has passed.
*/
class TaskQueue {
 public:
  virtual ~TaskQueue() = default;

  virtual std::string Enqueue(v1::TaskRequest request, std::chrono::milliseconds delay = std::chrono::milliseconds(0)) = 0;

  std::string Enqueue(const std::string& task_name, const v1::CursorTaskArgs& args);
  std::string Enqueue(const std::string& task_name, const v1::ReapTaskArgs& args);

  // Blocks until a request is due; nullopt once shut down.
  virtual std::optional<v1::TaskRequest> Dequeue() = 0;

  // Acknowledges a dequeued request once its handler and follow-ups are done.
  virtual void Done() {
  }

  virtual void Shutdown() = 0;
};

} // namespace circulate::queue
