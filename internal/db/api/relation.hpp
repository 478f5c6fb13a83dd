#pragma once

#include <map>
#include <set>
#include <string>

#include "config/config.pb.h"

namespace fieldlink::db {

/*
  field id -> values produced by one lookup.

  Every matched row contributes, so one lookup may yield several values for
  the same field.
*/
using FieldValues = std::map<std::string, std::set<std::string>>;

/*
  Relation abstraction.

  Wraps one external data source and answers single-field lookups:

    Lookup(field, value) -> every declared field of every row where
                            <field expression> = value

  Construction is eager. Backends connect in their constructor and throw
  util::ConnectionError when the source is unreachable.

  Lookup() is called concurrently by many requests and must be thread-safe.
  Failures are reported as util::LookupError.
*/
class Relation {
 public:
  explicit Relation(fieldlink::runtime::config::Relation config);
  virtual ~Relation() = default;

  Relation(const Relation&)            = delete;
  Relation& operator=(const Relation&) = delete;

  const std::string& Name() const {
    return config_.name();
  }

  const fieldlink::runtime::config::Relation& Config() const {
    return config_;
  }

  bool HasField(const std::string& field) const;

  virtual FieldValues Lookup(const std::string& field, const std::string& value) const = 0;

 protected:
  // Throws LookupError when `field` is not declared by this relation.
  void RequireField(const std::string& field) const;

  // Error text shared by backends for NULL / unreadable columns.
  std::string ColumnError(const std::string& column, const std::string& why) const;

 private:
  fieldlink::runtime::config::Relation config_;
};

} // namespace fieldlink::db
