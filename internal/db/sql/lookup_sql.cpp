#include "internal/db/sql/lookup_sql.hpp"

#include "internal/util/errors.hpp"

namespace fieldlink::db::sql {

std::string QuoteIdentifier(std::string_view identifier) {
  std::string quoted;
  quoted.reserve(identifier.size() + 2);
  quoted.push_back('"');
  for (char c : identifier) {
    if (c == '"') {
      quoted.push_back('"');
    }
    quoted.push_back(c);
  }
  quoted.push_back('"');
  return quoted;
}

std::string BuildLookupSql(const fieldlink::runtime::config::Relation& relation,
                           const std::string&                          field,
                           Placeholder                                 placeholder) {
  std::string projection;
  const std::string* condition = nullptr;

  for (const auto& f : relation.fields()) {
    if (!projection.empty()) {
      projection += ",";
    }
    projection += "(" + f.query() + ") AS " + QuoteIdentifier(f.id());
    if (f.id() == field) {
      condition = &f.query();
    }
  }

  if (!condition) {
    throw util::LookupError("relation `" + relation.name() + "` does not have field `" + field + "`");
  }

  return "SELECT " + projection + " FROM " + relation.table_name() + " WHERE (" + *condition + ") = " +
         (placeholder == Placeholder::kDollar ? "$1" : "?");
}

} // namespace fieldlink::db::sql
