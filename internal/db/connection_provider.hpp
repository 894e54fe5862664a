#pragma once

#include <memory>
#include <string>

#include "internal/db/api/connection.hpp"

namespace dbtarget::db {

enum class ConnectionMode {
  // private in-memory store, destroyed with the handle; identifier ignored
  kIsolated,
  // named in-memory store visible to every handle opened on the identifier
  kShared,
  // on-disk database at the identifier path
  kFile,
};

/*
  ConnectionProvider

  Produces handles on the sqlite engine.

  Shared-mode lifetime policy: REFERENCE COUNTED.
    The named store lives while at least one handle on the identifier is
    open. Closing the last one releases it; a later Open() on the same
    identifier starts from an empty store. Callers that need the data to
    outlive a handle keep one handle open (or pin it, see Pinned()).
*/
class ConnectionProvider {
 public:
  struct Options {
    bool wal             = true;
    int  busy_timeout_ms = 5000;
  };

  ConnectionProvider() = default;
  explicit ConnectionProvider(Options options) : options_(options) {
  }

  // Throws util::ConnectionError when the engine cannot allocate/locate storage.
  ConnectionPtr Open(ConnectionMode mode, const std::string& identifier) const;

  // Deferred Open() for components that take a ConnectionFactory.
  ConnectionFactory Factory(ConnectionMode mode, std::string identifier) const;

  // Decorator that forwards everything except Close(), which becomes a no-op.
  static ConnectionPtr WrapNonClosing(ConnectionPtr inner);

  // Factory that always yields the same physical connection, protected
  // from the caller's Close(). The real owner closes `inner` itself.
  static ConnectionFactory Pinned(ConnectionPtr inner);

  static std::string SharedUri(const std::string& identifier);

 private:
  Options options_;
};

/*
  Non-closing delegator.

  Lets external code believe it controls the handle's lifetime (the
  migration runner closes its connection after every step) while the
  real owner keeps it alive.
*/
class NonClosingConnection final : public Connection {
 public:
  explicit NonClosingConnection(ConnectionPtr inner) : inner_(std::move(inner)) {
  }

  void Exec(const std::string& sql) override {
    inner_->Exec(sql);
  }
  std::int64_t Execute(const std::string& sql, const sql::Params& params = {}) override {
    return inner_->Execute(sql, params);
  }
  std::vector<sql::Row> Query(const std::string& sql, const sql::Params& params = {}) override {
    return inner_->Query(sql, params);
  }
  std::unique_ptr<Transaction> Begin() override {
    return inner_->Begin();
  }
  void Close() override {
  }
  bool IsOpen() const override {
    return inner_->IsOpen();
  }
  std::int64_t TotalChanges() const override {
    return inner_->TotalChanges();
  }
  std::string Identifier() const override {
    return inner_->Identifier();
  }

 private:
  ConnectionPtr inner_;
};

} // namespace dbtarget::db
