#include "internal/db/relation_factory.hpp"

#include "internal/db/sqlite/sqlite_relation.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#if FIELDLINK_DB_POSTGRES
#include "internal/db/postgres/pg_relation.hpp"
#endif

namespace fieldlink::db {

using fieldlink::util::ConnectionError;

namespace {

bool StartsWith(const std::string& s, const std::string& prefix) {
  return s.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

ConnectTarget ParseConnect(const std::string& connect) {
  if (StartsWith(connect, "postgres://") || StartsWith(connect, "postgresql://") ||
      StartsWith(connect, "host=") || StartsWith(connect, "dbname=")) {
    return {Backend::kPostgres, connect};
  }

  if (StartsWith(connect, "file:")) {
    return {Backend::kSqlite, connect};
  }

  std::string path;
  if (StartsWith(connect, "sqlite://")) {
    path = connect.substr(9);
  } else if (StartsWith(connect, "sqlite:")) {
    path = connect.substr(7);
  } else if (connect.find("://") != std::string::npos) {
    throw ConnectionError("unsupported connection descriptor `" + connect + "`");
  } else {
    path = connect;
  }

  if (path.empty()) {
    throw ConnectionError("empty sqlite path in connection descriptor `" + connect + "`");
  }

  // query options such as ?mode=ro need URI parsing
  if (path.find('?') != std::string::npos) {
    return {Backend::kSqlite, "file:" + path};
  }
  return {Backend::kSqlite, path};
}

std::shared_ptr<Relation> OpenRelation(const fieldlink::runtime::config::Relation& config,
                                       std::size_t                                 max_connections) {
  const auto target = ParseConnect(config.connect());

  switch (target.backend) {
    case Backend::kSqlite:
      FIELDLINK_LOG_INFO("Opening relation", {observability::StringField("relation", config.name()),
                                               observability::StringField("backend", "sqlite")});
      return std::make_shared<sqlite::SqliteRelation>(config, target.address);

    case Backend::kPostgres:
#if FIELDLINK_DB_POSTGRES
      FIELDLINK_LOG_INFO("Opening relation", {observability::StringField("relation", config.name()),
                                               observability::StringField("backend", "postgres")});
      return std::make_shared<postgres::PgRelation>(config, target.address, max_connections);
#else
      (void)max_connections;
      throw ConnectionError("relation " + config.name() + " requests postgres but it is not enabled at build time");
#endif
  }

  throw ConnectionError("unsupported backend for relation " + config.name());
}

} // namespace fieldlink::db
