#pragma once

#include <memory>
#include <string>

#include "internal/db/api/relation.hpp"

namespace fieldlink::db::sqlite {

class SqliteDB;

/*
  Relation backed by one SQLite database file.

  The handle is opened at construction; statements are prepared per lookup.
*/
class SqliteRelation final : public db::Relation {
 public:
  SqliteRelation(fieldlink::runtime::config::Relation config, const std::string& path);
  ~SqliteRelation() override;

  FieldValues Lookup(const std::string& field, const std::string& value) const override;

 private:
  std::unique_ptr<SqliteDB> db_;
};

} // namespace fieldlink::db::sqlite
