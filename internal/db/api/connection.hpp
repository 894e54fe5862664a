#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/transaction.hpp"
#include "internal/db/sql/sql_params.hpp"
#include "internal/db/sql/sql_row.hpp"

namespace dbtarget::db {

/*
  Relational engine capability: open session on one store.

  Contract:
    - Exec runs one or more parameterless statements.
    - Execute runs one statement with positional params and returns the
      number of rows it changed.
    - Query materializes every result row.
    - Begin starts a write transaction; at most one may be active.
    - Close releases the session. Any later call throws.

  Statement failures throw util::DatabaseError.
  Handles are not shared between concurrent writers (single owner).
*/
class Connection {
 public:
  virtual ~Connection() = default;

  virtual void Exec(const std::string& sql) = 0;

  virtual std::int64_t Execute(const std::string& sql, const sql::Params& params = {}) = 0;

  virtual std::vector<sql::Row> Query(const std::string& sql, const sql::Params& params = {}) = 0;

  virtual std::unique_ptr<Transaction> Begin() = 0;

  virtual void Close() = 0;

  virtual bool IsOpen() const = 0;

  // rows changed by INSERT/UPDATE/DELETE since the session was opened
  virtual std::int64_t TotalChanges() const = 0;

  // what the session was opened on (path, URI or ":memory:")
  virtual std::string Identifier() const = 0;
};

using ConnectionPtr = std::shared_ptr<Connection>;

// Deferred connection acquisition. Throws util::ConnectionError.
using ConnectionFactory = std::function<ConnectionPtr()>;

} // namespace dbtarget::db
