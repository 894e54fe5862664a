#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "sqlite_db.hpp"

namespace dbtarget::db::sqlite {

SqliteTransaction::SqliteTransaction(SqliteDB& db) : db_(db) {
  db_.Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (finished_ || !db_.IsOpen()) return;
  try {
    db_.Exec("ROLLBACK;");
  } catch (const util::DatabaseError& e) {
    DBTARGET_LOG_WARN("sqlite rollback failed", {observability::StringField("db", db_.Identifier()),
                                                  observability::StringField("error", e.what())});
  }
}

void SqliteTransaction::Commit() {
  db_.Exec("COMMIT;");
  finished_ = true;
}

void SqliteTransaction::Rollback() {
  finished_ = true;
  db_.Exec("ROLLBACK;");
}

} // namespace dbtarget::db::sqlite
