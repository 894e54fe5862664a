#pragma once

#include <sqlite3.h>

#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/connection.hpp"

namespace dbtarget::db::sqlite {

struct OpenOptions {
  // interpret target as a file: URI (needed for shared-cache memory stores)
  bool uri = false;
  // journal_mode=WAL + synchronous=NORMAL; only meaningful for files
  bool wal = false;
  int  busy_timeout_ms = 5000;
};

/*
  Thin RAII wrapper around sqlite3*.

  Opening failures throw util::ConnectionError, statement failures
  util::DatabaseError carrying the sqlite result code.
*/
class SqliteDB final : public db::Connection {
 public:
  explicit SqliteDB(std::string target, OpenOptions options = {});
  ~SqliteDB() override;

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  void                         Exec(const std::string& sql) override;
  std::int64_t                 Execute(const std::string& sql, const sql::Params& params = {}) override;
  std::vector<sql::Row>        Query(const std::string& sql, const sql::Params& params = {}) override;
  std::unique_ptr<Transaction> Begin() override;
  void                         Close() override;
  bool                         IsOpen() const override;
  std::int64_t                 TotalChanges() const override;
  std::string                  Identifier() const override;

 private:
  struct StatementDeleter {
    void operator()(sqlite3_stmt* stmt) const {
      sqlite3_finalize(stmt);
    }
  };
  using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

  Statement Prepare(const std::string& sql);
  void      Bind(sqlite3_stmt* stmt, const sql::Params& params);
  void      EnsureOpen() const;

  // Configure recommended PRAGMAs (WAL, foreign keys, busy timeout)
  void Configure();

  sqlite3*    db_ = nullptr;
  std::string target_;
  OpenOptions options_;
};

} // namespace dbtarget::db::sqlite
