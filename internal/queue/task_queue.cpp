#include "task_queue.hpp"

#include "internal/task/cursor_task.hpp"

namespace circulate::queue {

std::string TaskQueue::Enqueue(const std::string& task_name, const v1::CursorTaskArgs& args) {
  return Enqueue(task::MakeRequest(task_name, args));
}

std::string TaskQueue::Enqueue(const std::string& task_name, const v1::ReapTaskArgs& args) {
  return Enqueue(task::MakeRequest(task_name, args));
}

} // namespace circulate::queue
