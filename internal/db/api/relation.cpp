#include "internal/db/api/relation.hpp"

#include "internal/util/errors.hpp"

namespace fieldlink::db {

Relation::Relation(fieldlink::runtime::config::Relation config) : config_(std::move(config)) {
  if (config_.fields().empty()) {
    throw util::ConfigError("relation `" + config_.name() + "` does not have any field");
  }
}

bool Relation::HasField(const std::string& field) const {
  for (const auto& f : config_.fields()) {
    if (f.id() == field) {
      return true;
    }
  }
  return false;
}

void Relation::RequireField(const std::string& field) const {
  if (!HasField(field)) {
    throw util::LookupError("relation `" + config_.name() + "` does not have field `" + field + "`");
  }
}

std::string Relation::ColumnError(const std::string& column, const std::string& why) const {
  return "failed to get field `" + column + "` when querying relation " + config_.name() + ": " + why;
}

} // namespace fieldlink::db
