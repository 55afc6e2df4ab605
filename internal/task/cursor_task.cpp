#include "cursor_task.hpp"

#include "internal/util/uuid.hpp"

namespace circulate::task {

v1::TaskRequest MakeRequest(const std::string& task_name, const v1::CursorTaskArgs& args) {
  v1::TaskRequest request;
  request.set_task_name(task_name);
  request.set_task_id(util::NewToken());
  *request.mutable_cursor() = args;
  // retries copy the request, so every attempt of a run's first page shares the root
  EnsureRootId(*request.mutable_cursor());
  return request;
}

v1::TaskRequest MakeRequest(const std::string& task_name, const v1::ReapTaskArgs& args) {
  v1::TaskRequest request;
  request.set_task_name(task_name);
  request.set_task_id(util::NewToken());
  *request.mutable_reap() = args;
  return request;
}

void EnsureRootId(v1::CursorTaskArgs& args) {
  if (args.root_id().empty()) args.set_root_id(util::NewToken());
}

} // namespace circulate::task
