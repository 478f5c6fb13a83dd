#include "internal/core/field_index.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/memory/memory_relation.hpp"
#include "internal/util/errors.hpp"

namespace {

using fieldlink::core::FieldIndex;
using fieldlink::db::memory::MemoryRelation;
using fieldlink::runtime::config::Field;
using fieldlink::runtime::config::Relation;
using fieldlink::util::ConfigError;

google::protobuf::RepeatedPtrField<Field> MakeFields(const std::vector<std::pair<std::string, bool>>& specs) {
  google::protobuf::RepeatedPtrField<Field> fields;
  for (const auto& [id, distinct] : specs) {
    auto* field = fields.Add();
    field->set_id(id);
    field->set_distinct(distinct);
  }
  return fields;
}

std::shared_ptr<MemoryRelation> MakeRelation(const std::string& name, const std::vector<std::string>& field_ids) {
  Relation config;
  config.set_name(name);
  config.set_connect("memory");
  config.set_table_name(name);
  for (const auto& id : field_ids) {
    auto* f = config.add_fields();
    f->set_id(id);
    f->set_query(id);
  }
  return std::make_shared<MemoryRelation>(config, std::vector<MemoryRelation::Row>{});
}

void TestRelationsAreListedInDeclarationOrder() {
  const auto fields = MakeFields({{"user_id", true}, {"email", true}, {"country", false}});
  FieldIndex index(fields, {MakeRelation("users", {"user_id", "email"}), MakeRelation("accounts", {"email", "country"}),
                            MakeRelation("logins", {"user_id", "email"})});

  const auto* email = index.RelationsFor("email");
  assert(email);
  assert(email->size() == 3);
  assert((*email)[0]->Name() == "users");
  assert((*email)[1]->Name() == "accounts");
  assert((*email)[2]->Name() == "logins");

  const auto* country = index.RelationsFor("country");
  assert(country && country->size() == 1);
  assert((*country)[0]->Name() == "accounts");

  assert(index.Relations().size() == 3);
}

void TestUnknownAndUnusedFieldsHaveNoRelations() {
  const auto fields = MakeFields({{"user_id", true}, {"unused", true}});
  FieldIndex index(fields, {MakeRelation("users", {"user_id"})});

  assert(index.RelationsFor("bogus_field") == nullptr);
  assert(index.RelationsFor("unused") == nullptr);
  assert(index.IsDeclared("unused"));
  assert(!index.IsDeclared("bogus_field"));
}

void TestDistinctFlags() {
  const auto fields = MakeFields({{"user_id", true}, {"country", false}});
  FieldIndex index(fields, {MakeRelation("users", {"user_id", "country"})});

  assert(index.IsDistinct("user_id"));
  assert(!index.IsDistinct("country"));
  assert(!index.IsDistinct("bogus_field"));
}

void TestUndeclaredRelationFieldFailsConstruction() {
  const auto fields = MakeFields({{"user_id", true}});
  bool       threw  = false;
  try {
    FieldIndex index(fields, {MakeRelation("users", {"user_id", "phone"})});
  } catch (const ConfigError& e) {
    threw = std::string(e.what()).find("undeclared field `phone`") != std::string::npos;
  }
  assert(threw);
}

void TestDuplicateRelationNameFailsConstruction() {
  const auto fields = MakeFields({{"user_id", true}});
  bool       threw  = false;
  try {
    FieldIndex index(fields, {MakeRelation("users", {"user_id"}), MakeRelation("users", {"user_id"})});
  } catch (const ConfigError&) {
    threw = true;
  }
  assert(threw);
}

void TestRelationWithoutFieldsCannotBeBuilt() {
  Relation config;
  config.set_name("empty");
  bool threw = false;
  try {
    MemoryRelation relation(config, {});
  } catch (const ConfigError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestRelationsAreListedInDeclarationOrder();
  TestUnknownAndUnusedFieldsHaveNoRelations();
  TestDistinctFlags();
  TestUndeclaredRelationFieldFailsConstruction();
  TestDuplicateRelationNameFailsConstruction();
  TestRelationWithoutFieldsCannotBeBuilt();

  std::cout << "fieldlink_unit_field_index: pass\n";
  return 0;
}
