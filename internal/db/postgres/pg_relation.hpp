#pragma once

#include <memory>
#include <string>

#include "internal/db/api/relation.hpp"

namespace fieldlink::db::postgres {

class PgPool;

/*
  Relation backed by a PostgreSQL table.

  Every pooled connection carries one prepared statement per declared field,
  named "lookup_<index>".
*/
class PgRelation final : public db::Relation {
 public:
  PgRelation(fieldlink::runtime::config::Relation config, std::string conninfo, std::size_t max_connections);
  ~PgRelation() override;

  FieldValues Lookup(const std::string& field, const std::string& value) const override;

 private:
  std::shared_ptr<PgPool> pool_;
};

} // namespace fieldlink::db::postgres
