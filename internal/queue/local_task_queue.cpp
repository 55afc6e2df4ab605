#include "local_task_queue.hpp"

#include "internal/util/uuid.hpp"

namespace circulate::queue {

std::string LocalTaskQueue::Enqueue(v1::TaskRequest request, std::chrono::milliseconds delay) {
  if (request.task_id().empty()) request.set_task_id(util::NewToken());
  auto handle = request.task_id();

  {
    std::lock_guard lock(mutex_);
    queue_.emplace(Slot{SteadyClock::now() + delay, sequence_++}, std::move(request));
  }
  cv_.notify_one();
  return handle;
}

std::optional<v1::TaskRequest> LocalTaskQueue::PopDueLocked(SteadyClock::time_point now) {
  if (queue_.empty() || queue_.begin()->first.first > now) return std::nullopt;

  auto node = queue_.extract(queue_.begin());
  ++in_flight_;
  return std::move(node.mapped());
}

std::optional<v1::TaskRequest> LocalTaskQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  while (!shutdown_) {
    if (auto request = PopDueLocked(SteadyClock::now())) return request;

    if (queue_.empty()) {
      cv_.wait(lock);
    } else {
      cv_.wait_until(lock, queue_.begin()->first.first);
    }
  }
  return std::nullopt;
}

std::optional<v1::TaskRequest> LocalTaskQueue::TryDequeue() {
  std::lock_guard lock(mutex_);
  if (shutdown_) return std::nullopt;
  return PopDueLocked(SteadyClock::now());
}

void LocalTaskQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
  idle_cv_.notify_all();
}

std::size_t LocalTaskQueue::Size() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

std::size_t LocalTaskQueue::InFlight() const {
  std::lock_guard lock(mutex_);
  return in_flight_;
}

void LocalTaskQueue::Done() {
  {
    std::lock_guard lock(mutex_);
    if (in_flight_ > 0) --in_flight_;
  }
  idle_cv_.notify_all();
}

void LocalTaskQueue::WaitIdle() {
  std::unique_lock lock(mutex_);
  idle_cv_.wait(lock, [&] { return shutdown_ || (queue_.empty() && in_flight_ == 0); });
}

} // namespace circulate::queue
