#pragma once

#include <atomic>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "internal/db/api/relation.hpp"

namespace fieldlink::db::memory {

/*
  Relation over rows held in memory.

  A row maps field id -> value. Lookup(field, value) matches rows whose
  `field` equals `value`; the relation's `query` expressions are ignored.
  Counts lookups so callers can observe traversal behavior.
*/
class MemoryRelation final : public db::Relation {
 public:
  using Row = std::map<std::string, std::string>;

  MemoryRelation(fieldlink::runtime::config::Relation config, std::vector<Row> rows);

  FieldValues Lookup(const std::string& field, const std::string& value) const override;

  // Subsequent lookups of `value` throw LookupError with `message`.
  void FailOn(const std::string& value, const std::string& message);

  std::size_t LookupCount() const {
    return lookups_.load();
  }

 private:
  std::vector<Row> rows_;

  mutable std::atomic<std::size_t>   lookups_{0};
  mutable std::mutex                 mutex_;
  std::map<std::string, std::string> failures_;
};

} // namespace fieldlink::db::memory
