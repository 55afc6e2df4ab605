#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <utility>

#include "internal/queue/task_queue.hpp"

namespace circulate::queue {

/*
  In-process TaskQueue for worker threads of one process.

  Requests are handed out by due time, then in enqueue order.
*/
class LocalTaskQueue final : public TaskQueue {
 public:
  using TaskQueue::Enqueue;

  std::string Enqueue(v1::TaskRequest request, std::chrono::milliseconds delay = std::chrono::milliseconds(0)) override;

  // blocking wait
  std::optional<v1::TaskRequest> Dequeue() override;

  // Due request if any, without waiting.
  std::optional<v1::TaskRequest> TryDequeue();

  void Shutdown() override;

  std::size_t Size() const;

  // Requests handed out and not yet marked Done().
  std::size_t InFlight() const;

  void Done() override;

  // Blocks until nothing is queued or in flight.
  void WaitIdle();

 private:
  using SteadyClock = std::chrono::steady_clock;
  using Slot        = std::pair<SteadyClock::time_point, uint64_t>;

  std::optional<v1::TaskRequest> PopDueLocked(SteadyClock::time_point now);

  mutable std::mutex              mutex_;
  std::condition_variable         cv_;
  std::condition_variable         idle_cv_;
  std::map<Slot, v1::TaskRequest> queue_;
  uint64_t                        sequence_  = 0;
  std::size_t                     in_flight_ = 0;
  bool                            shutdown_  = false;
};

} // namespace circulate::queue
