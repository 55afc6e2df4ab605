#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/storage/object_store.hpp"

namespace circulate::storage {

inline constexpr const char* kDefaultObjectRoot = "/tmp/circulate-objects";

/*
  Builds the object store export output is written to.

      auto objects = StorageFactory::Build(config.object_storage());
      objects->Store("r1/run-1/out.mrc", bytes, "application/marc");

  An empty root path falls back to kDefaultObjectRoot on the local
  filesystem.
*/
class StorageFactory {
 public:
  static ObjectStorePtr Build(const circulate::runtime::config::ObjectStorageConfig& cfg);
};

} // namespace circulate::storage
