#include "internal/core/field_index.hpp"

#include <unordered_set>

#include "internal/util/errors.hpp"

namespace fieldlink::core {

using fieldlink::util::ConfigError;

FieldIndex::FieldIndex(const google::protobuf::RepeatedPtrField<fieldlink::runtime::config::Field>& fields,
                       RelationList                                                                 relations)
    : relations_(std::move(relations)) {
  for (const auto& field : fields) {
    if (!distinct_.emplace(field.id(), field.distinct()).second) {
      throw ConfigError("duplicate field `" + field.id() + "`");
    }
  }

  std::unordered_set<std::string> names;
  for (const auto& relation : relations_) {
    if (!names.insert(relation->Name()).second) {
      throw ConfigError("duplicate relation name `" + relation->Name() + "`");
    }

    for (const auto& f : relation->Config().fields()) {
      if (distinct_.count(f.id()) == 0) {
        throw ConfigError("undeclared field `" + f.id() + "` used in relation `" + relation->Name() +
                          "`, you have to declare it in `fields`");
      }
      by_field_[f.id()].push_back(relation);
    }
  }
}

const FieldIndex::RelationList* FieldIndex::RelationsFor(const std::string& field) const {
  auto it = by_field_.find(field);
  if (it == by_field_.end()) {
    return nullptr;
  }
  return &it->second;
}

bool FieldIndex::IsDeclared(const std::string& field) const {
  return distinct_.count(field) != 0;
}

bool FieldIndex::IsDistinct(const std::string& field) const {
  auto it = distinct_.find(field);
  return it != distinct_.end() && it->second;
}

} // namespace fieldlink::core
