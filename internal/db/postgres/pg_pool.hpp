#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

namespace fieldlink::db::postgres {

/*
  PgPool

  Bounded connection pool used by PgRelation.

  Design notes:
  -------------
  - libpqxx connections are NOT thread-safe, so each lookup borrows one
    connection for its duration.
  - `prepare` runs once on every new connection; PgRelation uses it to
    install one prepared lookup statement per field.
  - Acquire() blocks when max_connections are all borrowed.

  Lifetime:
    PgRelation owns shared_ptr<PgPool>
    a lookup holds shared_ptr<pqxx::connection> until it returns
*/

class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  using PrepareFn = std::function<void(pqxx::connection&)>;

  PgPool(std::string conninfo, PrepareFn prepare, std::size_t max_connections = 8);

  // Acquire a ready-to-use connection, opening one if the pool has room.
  std::shared_ptr<pqxx::connection> Acquire();

 private:
  std::shared_ptr<pqxx::connection> Wrap(pqxx::connection* conn);
  void                              Release(pqxx::connection* conn);

  std::string conninfo_;
  PrepareFn   prepare_;
  std::size_t max_connections_;

  std::mutex                                     mutex_;
  std::condition_variable                        cv_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                    live_connections_ = 0;
};

} // namespace fieldlink::db::postgres
