#include "sqlite_relation.hpp"

#include <sqlite3.h>

#include "internal/db/sql/lookup_sql.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace fieldlink::db::sqlite {

using fieldlink::util::ConnectionError;
using fieldlink::util::LookupError;

namespace {

// Holds the connection mutex so sqlite3_errmsg() reports this lookup's error.
class DbLock {
 public:
  explicit DbLock(sqlite3* db) : mutex_(sqlite3_db_mutex(db)) {
    sqlite3_mutex_enter(mutex_);
  }
  ~DbLock() {
    sqlite3_mutex_leave(mutex_);
  }

  DbLock(const DbLock&)            = delete;
  DbLock& operator=(const DbLock&) = delete;

 private:
  sqlite3_mutex* mutex_;
};

} // namespace

SqliteRelation::SqliteRelation(fieldlink::runtime::config::Relation config, const std::string& path)
    : db::Relation(std::move(config)) {
  try {
    db_ = std::make_unique<SqliteDB>(path);
  } catch (const std::exception& e) {
    throw ConnectionError("failed to connect to sqlite database `" + Config().connect() + "` for relation " + Name() +
                          ": " + e.what());
  }
}

SqliteRelation::~SqliteRelation() = default;

FieldValues SqliteRelation::Lookup(const std::string& field, const std::string& value) const {
  RequireField(field);

  const auto sql = sql::BuildLookupSql(Config(), field, sql::Placeholder::kQuestionMark);
  FIELDLINK_LOG_DEBUG("SQL", {observability::StringField("relation", Name()), observability::StringField("sql", sql)});

  auto*  handle = db_->Handle();
  DbLock lock(handle);

  Statement stmt;
  try {
    stmt = db_->Prepare(sql);
  } catch (const std::exception& e) {
    throw LookupError(e.what());
  }

  if (sqlite3_bind_text(stmt.get(), 1, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT) != SQLITE_OK) {
    throw LookupError(std::string("sqlite bind: ") + sqlite3_errmsg(handle));
  }

  const auto& fields = Config().fields();
  FieldValues result;

  int rc;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    for (int col = 0; col < fields.size(); ++col) {
      const auto& column = fields.Get(col).id();
      if (sqlite3_column_type(stmt.get(), col) == SQLITE_NULL) {
        throw LookupError(ColumnError(column, "value is NULL"));
      }
      const auto* text = sqlite3_column_text(stmt.get(), col);
      if (!text) {
        // zero-length blobs have no text pointer
        if (sqlite3_column_bytes(stmt.get(), col) == 0 && sqlite3_errcode(handle) != SQLITE_NOMEM) {
          result[column].insert(std::string());
          continue;
        }
        throw LookupError(ColumnError(column, sqlite3_errmsg(handle)));
      }
      result[column].emplace(reinterpret_cast<const char*>(text),
                             static_cast<std::size_t>(sqlite3_column_bytes(stmt.get(), col)));
    }
  }

  if (rc != SQLITE_DONE) {
    throw LookupError(std::string("sqlite step: ") + sqlite3_errmsg(handle));
  }

  return result;
}

} // namespace fieldlink::db::sqlite
