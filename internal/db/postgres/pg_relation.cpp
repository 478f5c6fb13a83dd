#include "pg_relation.hpp"

#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/sql/lookup_sql.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace fieldlink::db::postgres {

using fieldlink::util::ConnectionError;
using fieldlink::util::LookupError;

namespace {

std::string StatementName(int field_index) {
  return "lookup_" + std::to_string(field_index);
}

int FieldIndex(const fieldlink::runtime::config::Relation& config, const std::string& field) {
  for (int i = 0; i < config.fields_size(); ++i) {
    if (config.fields(i).id() == field) {
      return i;
    }
  }
  return -1;
}

} // namespace

PgRelation::PgRelation(fieldlink::runtime::config::Relation config, std::string conninfo, std::size_t max_connections)
    : db::Relation(std::move(config)) {
  const auto relation = Config();
  auto prepare = [relation](pqxx::connection& conn) {
    for (int i = 0; i < relation.fields_size(); ++i) {
      conn.prepare(StatementName(i),
                   sql::BuildLookupSql(relation, relation.fields(i).id(), sql::Placeholder::kDollar));
    }
  };

  pool_ = std::make_shared<PgPool>(std::move(conninfo), std::move(prepare), max_connections);

  // open one connection now so unreachable servers fail at startup
  try {
    pool_->Acquire();
  } catch (const std::exception& e) {
    throw ConnectionError("failed to connect to postgres database for relation " + Name() + ": " + e.what());
  }
}

PgRelation::~PgRelation() = default;

FieldValues PgRelation::Lookup(const std::string& field, const std::string& value) const {
  RequireField(field);
  const int index = FieldIndex(Config(), field);

  const auto& fields = Config().fields();
  FieldValues result;

  try {
    auto                  conn = pool_->Acquire();
    pqxx::read_transaction tx(*conn);
    auto                  rows = tx.exec_prepared(StatementName(index), value);

    for (const auto& row : rows) {
      for (int col = 0; col < fields.size(); ++col) {
        const auto& column = fields.Get(col).id();
        if (row[col].is_null()) {
          throw LookupError(ColumnError(column, "value is NULL"));
        }
        result[column].emplace(row[col].c_str());
      }
    }
    tx.commit();
  } catch (const LookupError&) {
    throw;
  } catch (const std::exception& e) {
    throw LookupError(e.what());
  }

  FIELDLINK_LOG_DEBUG("postgres lookup", {observability::StringField("relation", Name()),
                                          observability::StringField("field", field),
                                          observability::IntField("fields", static_cast<std::int64_t>(result.size()))});
  return result;
}

} // namespace fieldlink::db::postgres
