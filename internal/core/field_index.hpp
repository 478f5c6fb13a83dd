#pragma once

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include <google/protobuf/repeated_field.h>

#include "config/config.pb.h"
#include "internal/db/api/relation.hpp"

namespace fieldlink::core {

/*
  FieldIndex

  Immutable routing table built once at startup:

    field id -> relations exposing that field (relation declaration order)

  Shared by every request without locking. Owns the relations.
*/
class FieldIndex {
 public:
  using RelationList = std::vector<std::shared_ptr<db::Relation>>;

  // Re-checks referential validity and throws util::ConfigError on
  // duplicate relation names or relation fields that were never declared.
  FieldIndex(const google::protobuf::RepeatedPtrField<fieldlink::runtime::config::Field>& fields,
             RelationList                                                                 relations);

  // nullptr when no relation exposes `field`.
  const RelationList* RelationsFor(const std::string& field) const;

  bool IsDeclared(const std::string& field) const;

  // Undeclared fields are treated as non-distinct.
  bool IsDistinct(const std::string& field) const;

  const RelationList& Relations() const {
    return relations_;
  }

 private:
  std::unordered_map<std::string, bool>         distinct_;
  RelationList                                  relations_;
  std::unordered_map<std::string, RelationList> by_field_;
};

} // namespace fieldlink::core
