#pragma once

#include <memory>

#include "internal/store/transactional_store.hpp"
#include "internal/util/time.hpp"
#include "pg_pool.hpp"

namespace circulate::store::postgres {

/*
  Coordination store on PostgreSQL.

  Each operation runs in a SERIALIZABLE transaction on a pooled connection.
  Two callers racing to create the same key cannot both succeed: one of them
  fails with a serialization error and is re-run against the committed state.
*/
class PgStore final : public TransactionalStore {
 public:
  PgStore(const std::string& conninfo, std::size_t max_connections, util::ClockFn clock = util::Now);

 protected:
  void Execute(const std::function<void(StoreTransaction&)>& fn) override;

 private:
  static void Bootstrap(const std::string& conninfo);

  std::shared_ptr<PgPool> pool_;
  util::ClockFn           clock_;
};

} // namespace circulate::store::postgres
