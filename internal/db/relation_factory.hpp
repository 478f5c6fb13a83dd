#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include "config/config.pb.h"
#include "internal/db/api/relation.hpp"

namespace fieldlink::db {

enum class Backend {
  kSqlite,
  kPostgres,
};

struct ConnectTarget {
  Backend     backend;
  std::string address;  // sqlite path / URI, or libpq conninfo
};

/*
  Parses a relation `connect` descriptor.

    sqlite:data.db, sqlite://data.db?mode=ro, file:data.db, data.db -> SQLite
    postgres://..., postgresql://..., "host=... dbname=..."          -> Postgres

  Throws util::ConnectionError for any other scheme.
*/
ConnectTarget ParseConnect(const std::string& connect);

/*
  Opens the relation described by `config`. Connectivity failures surface
  here as util::ConnectionError.
*/
std::shared_ptr<Relation> OpenRelation(const fieldlink::runtime::config::Relation& config,
                                       std::size_t                                 max_connections);

} // namespace fieldlink::db
