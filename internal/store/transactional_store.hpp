#pragma once

#include <functional>

#include "internal/store/api/coordination_store.hpp"
#include "internal/store/api/transaction.hpp"

namespace circulate::store {

/*
  CoordinationStore built from a single primitive: run a function inside one
  backend transaction. Every public operation is a read-check-write sequence
  inside Execute(), which is what makes check-then-act atomic on backends
  without server-side scripting.

  Execute() may run `fn` more than once (serialization retries), so `fn` must
  only produce effects through the transaction and by assigning its outputs.
*/
class TransactionalStore : public CoordinationStore {
 public:
  std::optional<std::string> SetIfAbsent(const std::string& key, const std::string& value, std::optional<Millis> ttl) override;
  bool                       CompareAndDelete(const std::string& key, const std::string& expected) override;
  bool                       CompareAndExpire(const std::string& key, const std::string& expected, std::optional<Millis> ttl) override;
  std::optional<std::string> Get(const std::string& key) override;
  std::optional<Millis>      Ttl(const std::string& key) override;
  bool                       Delete(const std::string& key) override;
  std::vector<KeyValue>      Scan(const std::string& prefix) override;

  std::optional<std::vector<OperationReply>> Commit(const std::vector<Condition>& conditions, const std::vector<Operation>& operations) override;

 protected:
  virtual void Execute(const std::function<void(StoreTransaction&)>& fn) = 0;

 private:
  static OperationReply Apply(StoreTransaction& tx, const Operation& op);
};

} // namespace circulate::store
