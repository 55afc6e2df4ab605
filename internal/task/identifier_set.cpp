#include "identifier_set.hpp"

#include <stdexcept>

namespace circulate::task {

IdentifierSet::IdentifierSet(std::shared_ptr<store::CoordinationStore> store,
                             const std::string&                        key_prefix,
                             const std::string&                        resource_id,
                             const std::string&                        root_id,
                             std::optional<std::chrono::milliseconds>  ttl)
    : store_(std::move(store)), prefix_(store::JoinKey({key_prefix, "identifiers", resource_id, root_id}) + ":"), ttl_(ttl) {
  if (resource_id.empty() || root_id.empty()) {
    throw std::invalid_argument("identifier set requires a resource id and a root id");
  }
}

void IdentifierSet::Add(const std::vector<std::string>& identifiers) {
  if (identifiers.empty()) return;

  std::vector<store::Operation> ops;
  ops.reserve(identifiers.size());
  for (const auto& identifier : identifiers) {
    ops.push_back(store::Operation::Set(prefix_ + identifier, "1", ttl_));
  }

  if (!store_->Commit({}, ops)) {
    throw std::runtime_error("failed to record identifiers under " + prefix_);
  }
}

std::set<std::string> IdentifierSet::Members() {
  std::set<std::string> members;
  for (const auto& [key, value] : store_->Scan(prefix_)) {
    members.insert(key.substr(prefix_.size()));
  }
  return members;
}

void IdentifierSet::Clear() {
  if (!store_->Commit({}, {store::Operation::DeletePrefix(prefix_)})) {
    throw std::runtime_error("failed to clear identifiers under " + prefix_);
  }
}

} // namespace circulate::task
