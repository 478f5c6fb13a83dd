#include "memory_relation.hpp"

#include "internal/util/errors.hpp"

namespace fieldlink::db::memory {

MemoryRelation::MemoryRelation(fieldlink::runtime::config::Relation config, std::vector<Row> rows)
    : db::Relation(std::move(config)), rows_(std::move(rows)) {
}

FieldValues MemoryRelation::Lookup(const std::string& field, const std::string& value) const {
  ++lookups_;
  RequireField(field);

  {
    std::lock_guard lock(mutex_);
    auto it = failures_.find(value);
    if (it != failures_.end()) {
      throw util::LookupError(it->second);
    }
  }

  FieldValues result;
  for (const auto& row : rows_) {
    auto match = row.find(field);
    if (match == row.end() || match->second != value) {
      continue;
    }

    for (const auto& f : Config().fields()) {
      auto column = row.find(f.id());
      if (column == row.end()) {
        throw util::LookupError(ColumnError(f.id(), "value is NULL"));
      }
      result[f.id()].insert(column->second);
    }
  }
  return result;
}

void MemoryRelation::FailOn(const std::string& value, const std::string& message) {
  std::lock_guard lock(mutex_);
  failures_[value] = message;
}

} // namespace fieldlink::db::memory
