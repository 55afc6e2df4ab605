#include "factory.hpp"

#include <stdexcept>

#include "internal/storage/storage_factory.hpp"
#include "internal/store/store_factory.hpp"

namespace circulate::factory {

using circulate::runtime::config::RuntimeConfig;

namespace {

std::chrono::milliseconds MillisOr(uint64_t value, std::chrono::milliseconds fallback) {
  return value == 0 ? fallback : std::chrono::milliseconds(value);
}

v1::CursorTaskArgs CursorArgs(const v1::TaskRequest& request) {
  if (!request.has_cursor()) throw std::invalid_argument("task " + request.task_name() + " expects cursor arguments");
  return request.cursor();
}

} // namespace

lock::LeaseLockOptions LockOptions(const RuntimeConfig& config) {
  lock::LeaseLockOptions options;
  options.lock_timeout = MillisOr(config.locks().lock_timeout_ms(), std::chrono::minutes(5));
  options.retry_delay  = MillisOr(config.locks().retry_delay_ms(), std::chrono::milliseconds(200));
  return options;
}

util::BackoffPolicy BackoffOptions(const circulate::runtime::config::BackoffConfig& config) {
  util::BackoffPolicy policy;
  if (config.has_factor()) policy.factor = config.factor();
  if (config.has_base()) policy.base = config.base();
  if (config.has_jitter()) policy.jitter = config.jitter();
  if (config.has_max_time_s()) policy.max_time = config.max_time_s();

  // throws std::invalid_argument for an invalid policy
  (void)util::Backoff(0, policy);
  return policy;
}

/*
    Build full application dependency graph
*/
Application Build(const RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Shared clients
  // ------------------------------------------------------------------
  app.store      = store::StoreFactory::Build(config.store());
  app.key_prefix = store::StoreFactory::KeyPrefix(config.store());
  app.objects    = storage::StorageFactory::Build(config.object_storage());

  // ------------------------------------------------------------------
  // Task options
  // ------------------------------------------------------------------
  const auto lock_options = LockOptions(config);

  app.import_options.key_prefix          = app.key_prefix;
  app.import_options.resource_lock       = lock_options;
  app.import_options.record_lock         = lock_options;
  app.import_options.record_lock_timeout = MillisOr(config.locks().record_lock_timeout_ms(), std::chrono::seconds(30));

  app.export_options.key_prefix              = app.key_prefix;
  app.export_options.session.session_timeout = MillisOr(config.uploads().session_timeout_ms(), std::chrono::minutes(30));
  app.export_options.session.retry_delay     = lock_options.retry_delay;
  if (config.uploads().minimum_part_size_bytes() > 0) {
    app.export_options.upload.minimum_part_size = static_cast<int64_t>(config.uploads().minimum_part_size_bytes());
  }
  if (!config.object_storage().content_type().empty()) {
    app.export_options.upload.content_type = config.object_storage().content_type();
  }

  // ------------------------------------------------------------------
  // Worker pool
  // ------------------------------------------------------------------
  queue::WorkerOptions worker_options;
  if (config.worker().threads() > 0) worker_options.threads = config.worker().threads();
  if (config.worker().max_retries() > 0) worker_options.max_retries = config.worker().max_retries();
  worker_options.backoff = BackoffOptions(config.worker().backoff());

  app.queue  = std::make_shared<queue::LocalTaskQueue>();
  app.worker = std::make_shared<queue::TaskWorker>(app.queue, worker_options);

  return app;
}

void RegisterImport(Application& app, std::shared_ptr<task::PageSource> source, std::shared_ptr<task::ApplyCollaborator> apply) {
  auto handler = std::make_shared<task::ImportTask>(app.store, std::move(source), std::move(apply), app.import_options);
  app.worker->Register(task::ImportTask::kName, [handler](const v1::TaskRequest& request) { return handler->Run(CursorArgs(request)); });
}

void RegisterExport(Application& app, std::shared_ptr<task::PageSource> source) {
  auto handler = std::make_shared<task::ExportTask>(app.store, app.objects, std::move(source), app.export_options);
  const auto max_retries = app.worker->MaxRetries();
  app.worker->Register(task::ExportTask::kName, [handler, max_retries](const v1::TaskRequest& request) {
    // the last attempt cleans up after itself instead of leaving the session for a retry
    return handler->Run(CursorArgs(request), request.attempt() >= max_retries);
  });
}

void RegisterReap(Application& app, std::shared_ptr<task::Reaper> reaper) {
  auto handler = std::make_shared<task::ReapTask>(app.store, std::move(reaper), app.key_prefix, app.import_options.resource_lock);
  app.worker->Register(task::ReapTask::kName, [handler](const v1::TaskRequest& request) {
    if (!request.has_reap()) throw std::invalid_argument("task " + request.task_name() + " expects reap arguments");
    return handler->Run(request.reap());
  });
}

} // namespace circulate::factory
