#include "sqlite_db.hpp"

#include "internal/util/errors.hpp"
#include "sqlite_tx.hpp"

namespace dbtarget::db::sqlite {

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw util::DatabaseError(std::string(what) + ": " + sqlite3_errmsg(db), rc);
  }
}

SqliteDB::SqliteDB(std::string target, OpenOptions options) : target_(std::move(target)), options_(options) {
  int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
  if (options_.uri) flags |= SQLITE_OPEN_URI;

  int rc = sqlite3_open_v2(target_.c_str(), &db_, flags, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw util::ConnectionError("cannot open " + target_ + ": " + msg);
  }

  try {
    Configure();
  } catch (const util::DatabaseError& e) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw util::ConnectionError("cannot configure " + target_ + ": " + e.what());
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::EnsureOpen() const {
  if (!db_) {
    throw util::DatabaseError("connection to " + target_ + " is closed", SQLITE_MISUSE);
  }
}

void SqliteDB::Exec(const std::string& sql) {
  EnsureOpen();
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw util::DatabaseError(msg, rc);
  }
}

SqliteDB::Statement SqliteDB::Prepare(const std::string& sql) {
  EnsureOpen();
  sqlite3_stmt* stmt = nullptr;
  int           rc   = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
  ThrowIf(rc, db_, "sqlite prepare");
  return Statement(stmt);
}

void SqliteDB::Bind(sqlite3_stmt* stmt, const sql::Params& params) {
  int idx = 1;
  for (const auto& param : params) {
    int rc = SQLITE_OK;
    if (std::holds_alternative<std::nullptr_t>(param)) {
      rc = sqlite3_bind_null(stmt, idx);
    } else if (const auto* i = std::get_if<std::int64_t>(&param)) {
      rc = sqlite3_bind_int64(stmt, idx, static_cast<sqlite3_int64>(*i));
    } else if (const auto* d = std::get_if<double>(&param)) {
      rc = sqlite3_bind_double(stmt, idx, *d);
    } else {
      const auto& s = std::get<std::string>(param);
      rc            = sqlite3_bind_text(stmt, idx, s.c_str(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
    }
    ThrowIf(rc, db_, "sqlite bind");
    ++idx;
  }
}

std::int64_t SqliteDB::Execute(const std::string& sql, const sql::Params& params) {
  auto stmt = Prepare(sql);
  Bind(stmt.get(), params);

  int rc = sqlite3_step(stmt.get());
  while (rc == SQLITE_ROW) rc = sqlite3_step(stmt.get());
  if (rc != SQLITE_DONE) {
    throw util::DatabaseError(std::string("sqlite step: ") + sqlite3_errmsg(db_), rc);
  }
  return sqlite3_changes(db_);
}

std::vector<sql::Row> SqliteDB::Query(const std::string& sql, const sql::Params& params) {
  auto stmt = Prepare(sql);
  Bind(stmt.get(), params);

  std::vector<sql::Row> rows;
  const int             columns = sqlite3_column_count(stmt.get());

  int rc = SQLITE_OK;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    sql::Row row;
    for (int col = 0; col < columns; ++col) {
      std::string name = sqlite3_column_name(stmt.get(), col);
      switch (sqlite3_column_type(stmt.get(), col)) {
        case SQLITE_INTEGER:
          row.Set(std::move(name), static_cast<std::int64_t>(sqlite3_column_int64(stmt.get(), col)));
          break;
        case SQLITE_FLOAT:
          row.Set(std::move(name), sqlite3_column_double(stmt.get(), col));
          break;
        case SQLITE_TEXT:
        case SQLITE_BLOB: {
          const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt.get(), col));
          const int   size = sqlite3_column_bytes(stmt.get(), col);
          row.Set(std::move(name), text ? std::string(text, size) : std::string());
          break;
        }
        default:
          row.Set(std::move(name), nullptr);
          break;
      }
    }
    rows.push_back(std::move(row));
  }

  if (rc != SQLITE_DONE) {
    throw util::DatabaseError(std::string("sqlite step: ") + sqlite3_errmsg(db_), rc);
  }
  return rows;
}

std::unique_ptr<Transaction> SqliteDB::Begin() {
  EnsureOpen();
  return std::make_unique<SqliteTransaction>(*this);
}

void SqliteDB::Close() {
  if (!db_) return;
  int rc = sqlite3_close(db_);
  ThrowIf(rc, db_, "sqlite close");
  db_ = nullptr;
}

bool SqliteDB::IsOpen() const {
  return db_ != nullptr;
}

std::int64_t SqliteDB::TotalChanges() const {
  EnsureOpen();
  return sqlite3_total_changes(db_);
}

std::string SqliteDB::Identifier() const {
  return target_;
}

void SqliteDB::Configure() {
  if (options_.wal) {
    // WAL enables concurrent readers while writer holds lock
    Exec("PRAGMA journal_mode=WAL;");

    // NORMAL is a good tradeoff; use FULL if you want stronger durability
    Exec("PRAGMA synchronous=NORMAL;");
  }

  // foreign keys are OFF by default in sqlite
  Exec("PRAGMA foreign_keys=ON;");

  // wait for locks instead of failing immediately
  ThrowIf(sqlite3_busy_timeout(db_, options_.busy_timeout_ms), db_, "busy_timeout");

  Exec("PRAGMA temp_store=MEMORY;");
}

} // namespace dbtarget::db::sqlite
