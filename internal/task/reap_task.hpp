#pragma once

#include <memory>
#include <set>
#include <string>

#include "circulate/v1.hpp"
#include "internal/lock/lease_lock.hpp"
#include "internal/store/api/coordination_store.hpp"
#include "internal/task/task_result.hpp"

namespace circulate::task {

/*
  Catalog side of the reap step: removes whatever the resource holds that
  the exhaustive pass did not see.
*/
class Reaper {
 public:
  virtual ~Reaper() = default;

  virtual void Reap(const std::string& resource_id, const std::set<std::string>& seen) = 0;
};

/*
  Completion follow-up of an exhaustive import. Runs under the resource's
  ImportLock with the run's root id, hands the collected identifiers to the
  Reaper and drops them.
*/
class ReapTask {
 public:
  static constexpr const char* kName = "reap";

  ReapTask(std::shared_ptr<store::CoordinationStore> store,
           std::shared_ptr<Reaper>                   reaper,
           std::string                               key_prefix,
           lock::LeaseLockOptions                    lock_options = {});

  TaskResult Run(const v1::ReapTaskArgs& args);

 private:
  std::shared_ptr<store::CoordinationStore> store_;
  std::shared_ptr<Reaper>                   reaper_;
  std::string                               key_prefix_;
  lock::LeaseLockOptions                    lock_options_;
};

} // namespace circulate::task
