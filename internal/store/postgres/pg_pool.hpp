#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

namespace circulate::store::postgres {

/*
  PgPool

  Bounded connection pool used by PgStore.

  - Each transaction gets its own connection.
  - libpqxx connections are NOT thread-safe, never shared between threads.
  - Prepared statements are installed per connection, so the schema must
    exist before the first Acquire().

  Lifetime:
    PgStore owns shared_ptr<PgPool>
    Execute() holds shared_ptr<pqxx::connection> for one transaction
*/

class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  explicit PgPool(std::string conninfo, std::size_t max_connections = 16);

  // Acquire a ready-to-use connection, blocking while the pool is exhausted
  std::shared_ptr<pqxx::connection> Acquire();

 private:
  static void                       PrepareStatements(pqxx::connection& conn);
  std::shared_ptr<pqxx::connection> Wrap(pqxx::connection* conn);
  void                              Release(pqxx::connection* conn);

  std::string conninfo_;
  std::size_t max_connections_;

  std::mutex                                     mutex_;
  std::condition_variable                        cv_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                    live_connections_ = 0;
};

} // namespace circulate::store::postgres
