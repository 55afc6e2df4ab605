#pragma once

#include <memory>
#include <string>

#include "config/config.pb.h"
#include "internal/store/api/coordination_store.hpp"

namespace circulate::store {

inline constexpr const char* kDefaultKeyPrefix = "circulate";

/*
  Builds the configured coordination store backend. An empty `store` section
  yields the in-memory backend.
*/
class StoreFactory {
 public:
  static std::shared_ptr<CoordinationStore> Build(const circulate::runtime::config::StoreConfig& cfg);

  static std::string KeyPrefix(const circulate::runtime::config::StoreConfig& cfg);
};

} // namespace circulate::store
