#include "task_worker.hpp"

#include <chrono>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace circulate::queue {

TaskWorker::TaskWorker(std::shared_ptr<TaskQueue> queue, WorkerOptions options) : queue_(std::move(queue)), options_(options) {
  if (!queue_) throw std::invalid_argument("task worker requires a queue");
  if (options_.threads == 0) options_.threads = 1;
}

TaskWorker::~TaskWorker() {
  Stop();
}

void TaskWorker::Register(const std::string& task_name, TaskHandler handler) {
  if (running_) throw std::logic_error("handlers must be registered before Start()");
  handlers_[task_name] = std::move(handler);
}

void TaskWorker::Start() {
  running_ = true;
  for (uint32_t i = 0; i < options_.threads; ++i) {
    threads_.emplace_back(&TaskWorker::Run, this);
  }
}

void TaskWorker::Stop() {
  queue_->Shutdown();
  running_ = false;
  for (auto& thread : threads_) {
    if (thread.joinable()) thread.join();
  }
  threads_.clear();
}

void TaskWorker::Run() {
  while (running_) {
    auto request = queue_->Dequeue();
    if (!request) break;

    Process(*request);
    queue_->Done();
  }
}

std::vector<TaskFailure> TaskWorker::Failures() const {
  std::lock_guard lock(failures_mutex_);
  return failures_;
}

void TaskWorker::Fail(const v1::TaskRequest& request, const std::string& error) {
  CIRCULATE_LOG_ERROR("task failed", {observability::StringField("error", error)});
  observability::Metrics::Instance().RecordTaskOutcome(request.task_name(), "failed");

  std::lock_guard lock(failures_mutex_);
  failures_.push_back({request, error});
}

void TaskWorker::Process(const v1::TaskRequest& request) {
  observability::LogScope log_scope({observability::StringField("task", request.task_name()), observability::StringField("task_id", request.task_id()),
                                     observability::IntField("attempt", request.attempt())});

  auto handler = handlers_.find(request.task_name());
  if (handler == handlers_.end()) {
    Fail(request, "no handler registered for task " + request.task_name());
    return;
  }

  observability::SpanScope span("task.run");
  span.SetAttribute("task", request.task_name());
  span.SetAttribute("attempt", static_cast<int64_t>(request.attempt()));

  const auto started = std::chrono::steady_clock::now();

  task::TaskResult result;
  try {
    result = handler->second(request);
  } catch (const util::TransientError& e) {
    span.RecordError(e.what());
    if (request.attempt() >= options_.max_retries) {
      Fail(request, std::string(e.what()) + " (giving up after " + std::to_string(request.attempt()) + " retries)");
      return;
    }

    auto retry = request;
    retry.set_attempt(request.attempt() + 1);
    const auto delay = util::BackoffDelay(static_cast<int>(request.attempt()), options_.backoff);

    CIRCULATE_LOG_WARN("task failed, retrying", {observability::StringField("error", e.what()), observability::IntField("delay_ms", delay.count())});
    observability::Metrics::Instance().RecordTaskRetry(request.task_name());
    queue_->Enqueue(std::move(retry), delay);
    return;
  } catch (const std::exception& e) {
    span.RecordError(e.what());
    Fail(request, e.what());
    return;
  }

  const auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
  observability::Metrics::Instance().ObserveTaskDurationMs(request.task_name(), elapsed);
  observability::Metrics::Instance().RecordTaskOutcome(request.task_name(), util::OutcomeName(result.outcome.kind));

  for (const auto& failure : result.failures) {
    CIRCULATE_LOG_WARN("record failed", {observability::StringField("identifier", failure.identifier), observability::StringField("reason", failure.reason)});
  }

  if (result.outcome.IsError()) {
    Fail(request, result.outcome.reason);
    return;
  }

  if (result.next) queue_->Enqueue(*result.next);

  CIRCULATE_LOG_DEBUG("task finished", {observability::StringField("outcome", util::OutcomeName(result.outcome.kind))});
}

} // namespace circulate::queue
