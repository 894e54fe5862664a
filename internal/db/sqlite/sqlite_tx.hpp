#pragma once

#include "internal/db/api/transaction.hpp"

namespace dbtarget::db::sqlite {

class SqliteDB;

/*
  SQLite transaction wrapper.

  Uses BEGIN IMMEDIATE:
    - grabs write lock early
    - avoids deadlock-y behavior later

  DDL is transactional in sqlite, so a migration step and its
  SchemaVersions row commit or vanish together.
*/
class SqliteTransaction final : public db::Transaction {
public:
  explicit SqliteTransaction(SqliteDB& db);
  ~SqliteTransaction() override;

  void Commit() override;
  void Rollback() override;
  bool IsFinished() const override { return finished_; }

private:
  SqliteDB& db_;
  bool finished_ = false;
};

} // namespace dbtarget::db::sqlite
