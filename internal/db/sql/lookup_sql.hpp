#pragma once

#include <string>
#include <string_view>

#include "config/config.pb.h"

namespace fieldlink::db::sql {

/*
  Lookup statement builder.

  Postgres: $1
  SQLite:   ?

  Produces

    SELECT (q1) AS "f1", ..., (qn) AS "fn" FROM <table> WHERE (<q of field>) = <param>

  Result columns follow the relation's field declaration order.
*/

enum class Placeholder {
  kQuestionMark,
  kDollar,
};

std::string QuoteIdentifier(std::string_view identifier);

std::string BuildLookupSql(const fieldlink::runtime::config::Relation& relation,
                           const std::string&                          field,
                           Placeholder                                 placeholder);

} // namespace fieldlink::db::sql
