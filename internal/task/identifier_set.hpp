#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "internal/store/api/coordination_store.hpp"

namespace circulate::task {

/*
  Identifiers seen by one exhaustive import run, kept as marker keys

      {prefix}:identifiers:{resource}:{root}:{identifier}

  so every invocation of the run adds to the same set and the reap step
  can read it back after the last page.
*/
class IdentifierSet {
 public:
  IdentifierSet(std::shared_ptr<store::CoordinationStore> store,
                const std::string&                        key_prefix,
                const std::string&                        resource_id,
                const std::string&                        root_id,
                std::optional<std::chrono::milliseconds>  ttl = std::chrono::hours(24));

  void Add(const std::vector<std::string>& identifiers);

  std::set<std::string> Members();

  void Clear();

  const std::string& Prefix() const {
    return prefix_;
  }

 private:
  std::shared_ptr<store::CoordinationStore> store_;
  std::string                               prefix_;
  std::optional<std::chrono::milliseconds>  ttl_;
};

} // namespace circulate::task
