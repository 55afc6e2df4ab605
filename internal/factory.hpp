#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "config/config.pb.h"
#include "internal/lock/lease_lock.hpp"
#include "internal/queue/local_task_queue.hpp"
#include "internal/queue/task_worker.hpp"
#include "internal/storage/object_store.hpp"
#include "internal/store/api/coordination_store.hpp"
#include "internal/task/apply.hpp"
#include "internal/task/export_task.hpp"
#include "internal/task/import_task.hpp"
#include "internal/task/page_source.hpp"
#include "internal/task/reap_task.hpp"

namespace circulate::factory {

/*
  Application

  Everything one worker process shares between task invocations. Built once
  and passed down explicitly; nothing below reaches for globals.
*/
struct Application {
  std::shared_ptr<store::CoordinationStore> store;
  std::string                               key_prefix;
  storage::ObjectStorePtr                   objects;

  std::shared_ptr<queue::LocalTaskQueue> queue;
  std::shared_ptr<queue::TaskWorker>     worker;

  task::ImportTaskOptions import_options;
  task::ExportTaskOptions export_options;
};

/*
  Build

  Composition root. The only place that knows concrete store and object
  store types. Task handlers are registered separately because their
  collaborators (page sources, catalog) live outside this library.
*/
Application Build(const circulate::runtime::config::RuntimeConfig& config);

lock::LeaseLockOptions LockOptions(const circulate::runtime::config::RuntimeConfig& config);
util::BackoffPolicy    BackoffOptions(const circulate::runtime::config::BackoffConfig& config);

void RegisterImport(Application& app, std::shared_ptr<task::PageSource> source, std::shared_ptr<task::ApplyCollaborator> apply);
void RegisterExport(Application& app, std::shared_ptr<task::PageSource> source);
void RegisterReap(Application& app, std::shared_ptr<task::Reaper> reaper);

} // namespace circulate::factory
