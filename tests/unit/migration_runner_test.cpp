#include "internal/migrations/migration_runner.hpp"

#include <cassert>
#include <cstdint>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/connection_provider.hpp"
#include "internal/migrations/schema_migrations.hpp"
#include "internal/util/errors.hpp"

namespace {

using dbtarget::db::ConnectionMode;
using dbtarget::db::ConnectionProvider;
using dbtarget::migrations::MigrationRunner;
using dbtarget::migrations::MigrationStep;

bool HasObject(dbtarget::db::Connection& conn, const std::string& type, const std::string& name) {
  return !conn.Query("SELECT name FROM sqlite_master WHERE type = ? AND name = ?;", {type, name}).empty();
}

bool HasColumn(dbtarget::db::Connection& conn, const std::string& table, const std::string& column) {
  for (const auto& row : conn.Query("PRAGMA table_info(" + table + ");")) {
    const auto* name = row.Find("name");
    if (name && std::get<std::string>(*name) == column) return true;
  }
  return false;
}

// Forwards to a real connection; Close() reports a failure after releasing it.
class CloseFailsConnection : public dbtarget::db::Connection {
 public:
  explicit CloseFailsConnection(dbtarget::db::ConnectionPtr inner) : inner_(std::move(inner)) {
  }

  void Exec(const std::string& sql) override {
    inner_->Exec(sql);
  }
  std::int64_t Execute(const std::string& sql, const dbtarget::db::sql::Params& params = {}) override {
    return inner_->Execute(sql, params);
  }
  std::vector<dbtarget::db::sql::Row> Query(const std::string& sql, const dbtarget::db::sql::Params& params = {}) override {
    return inner_->Query(sql, params);
  }
  std::unique_ptr<dbtarget::db::Transaction> Begin() override {
    return inner_->Begin();
  }
  void Close() override {
    inner_->Close();
    throw std::runtime_error("close hook failed");
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
  dbtarget::db::ConnectionPtr inner_;
};

std::size_t VersionCount(dbtarget::db::Connection& conn, const std::string& ns) {
  return conn.Query("SELECT StepId FROM SchemaVersions WHERE Namespace = ?;", {ns}).size();
}

void TestUpCreatesSchemaAndRecordsVersions() {
  auto conn    = ConnectionProvider().Open(ConnectionMode::kIsolated, "");
  auto factory = ConnectionProvider::Pinned(conn);
  auto runner  = dbtarget::migrations::MakeSchemaRunner();

  assert(runner.MigrateUp(factory) == 3);
  assert(HasObject(*conn, "table", "LogLines"));
  assert(HasObject(*conn, "table", "Metrics"));
  assert(HasColumn(*conn, "LogLines", "Exception"));
  assert(!HasObject(*conn, "index", "IX_LogLines_Host"));
  assert(VersionCount(*conn, "core") == 3);
  assert(VersionCount(*conn, "index") == 0);

  auto history = runner.History(factory);
  assert(history.size() == 3);
  assert(history.front().ns == "core");
  assert(history.front().description == "create LogLines");

  conn->Close();
}

void TestUpIsIdempotent() {
  auto conn    = ConnectionProvider().Open(ConnectionMode::kIsolated, "");
  auto factory = ConnectionProvider::Pinned(conn);
  auto runner  = dbtarget::migrations::MakeSchemaRunner();

  runner.MigrateUp(factory, true);
  const auto changes = conn->TotalChanges();

  assert(runner.MigrateUp(factory, true) == 0);
  assert(conn->TotalChanges() == changes);

  conn->Close();
}

void TestIndexStepsToggleIndependently() {
  auto conn    = ConnectionProvider().Open(ConnectionMode::kIsolated, "");
  auto factory = ConnectionProvider::Pinned(conn);
  auto runner  = dbtarget::migrations::MakeSchemaRunner();

  assert(runner.MigrateUp(factory, true) == 5);
  assert(HasObject(*conn, "index", "IX_LogLines_Timestamp_Level"));
  assert(HasObject(*conn, "index", "IX_LogLines_Host"));
  assert(HasObject(*conn, "index", "IX_Metrics_Path_Timestamp"));
  assert(VersionCount(*conn, "index") == 2);

  // latest index step reverted, latest core step reverted with it
  assert(runner.MigrateDown(factory, true) == 2);
  assert(!HasObject(*conn, "index", "IX_Metrics_Path_Timestamp"));
  assert(HasObject(*conn, "index", "IX_LogLines_Host"));
  assert(!HasColumn(*conn, "LogLines", "Exception"));

  // re-applying only core leaves the index namespace untouched
  assert(runner.MigrateUp(factory) == 1);
  assert(VersionCount(*conn, "core") == 3);
  assert(VersionCount(*conn, "index") == 1);

  // index-only round trip does not change the core version
  assert(runner.MigrateUp(factory, true) == 1);
  assert(VersionCount(*conn, "core") == 3);
  assert(VersionCount(*conn, "index") == 2);

  conn->Close();
}

void TestDownUntilEmpty() {
  auto conn    = ConnectionProvider().Open(ConnectionMode::kIsolated, "");
  auto factory = ConnectionProvider::Pinned(conn);
  auto runner  = dbtarget::migrations::MakeSchemaRunner();

  runner.MigrateUp(factory);
  assert(runner.MigrateDown(factory) == 1);
  assert(HasObject(*conn, "table", "Metrics"));
  assert(runner.MigrateDown(factory) == 1);
  assert(!HasObject(*conn, "table", "Metrics"));
  assert(runner.MigrateDown(factory) == 1);
  assert(!HasObject(*conn, "table", "LogLines"));

  assert(runner.MigrateDown(factory) == 0);
  assert(runner.MigrateDown(factory, true) == 0);
  assert(runner.History(factory).empty());

  conn->Close();
}

void TestDuplicateIdsAreRejected() {
  bool threw = false;
  try {
    MigrationRunner runner({dbtarget::migrations::SqlStep(1, "a", {"SELECT 1;"}, {"SELECT 1;"})},
                           {dbtarget::migrations::SqlStep(1, "b", {"SELECT 1;"}, {"SELECT 1;"})});
  } catch (const dbtarget::util::DuplicateMigrationId& e) {
    threw = true;
    assert(e.StepId() == 1);
  }
  assert(threw);

  threw = false;
  try {
    auto core = dbtarget::migrations::CoreSteps();
    core.push_back(dbtarget::migrations::SqlStep(2, "again", {"SELECT 1;"}, {"SELECT 1;"}));
    MigrationRunner runner(core, {});
  } catch (const dbtarget::util::DuplicateMigrationId& e) {
    threw = true;
    assert(e.StepId() == 2);
  }
  assert(threw);
}

void TestFailedStepIsRolledBackAndRetryable() {
  auto conn    = ConnectionProvider().Open(ConnectionMode::kIsolated, "");
  auto factory = ConnectionProvider::Pinned(conn);

  auto fail = std::make_shared<bool>(true);

  MigrationStep flaky;
  flaky.id          = 2;
  flaky.description = "flaky";
  flaky.up          = [fail](dbtarget::db::Connection& c) {
    c.Exec("CREATE TABLE Partial (Id INTEGER);");
    if (*fail) throw std::runtime_error("disk on fire");
  };
  flaky.down = [](dbtarget::db::Connection& c) { c.Exec("DROP TABLE Partial;"); };

  MigrationRunner runner({dbtarget::migrations::SqlStep(1, "first", {"CREATE TABLE First (Id INTEGER);"}, {"DROP TABLE First;"}),
                          flaky,
                          dbtarget::migrations::SqlStep(3, "third", {"CREATE TABLE Third (Id INTEGER);"}, {"DROP TABLE Third;"})},
                         {});

  bool threw = false;
  try {
    runner.MigrateUp(factory);
  } catch (const dbtarget::util::MigrationFailed& e) {
    threw = true;
    assert(e.StepId() == 2);
    assert(e.Cause() == "disk on fire");
  }
  assert(threw);

  assert(HasObject(*conn, "table", "First"));
  assert(!HasObject(*conn, "table", "Partial"));
  assert(!HasObject(*conn, "table", "Third"));
  assert(VersionCount(*conn, "core") == 1);

  *fail = false;
  assert(runner.MigrateUp(factory) == 2);
  assert(HasObject(*conn, "table", "Partial"));
  assert(HasObject(*conn, "table", "Third"));
  assert(VersionCount(*conn, "core") == 3);

  conn->Close();
}

void TestPlainIsolatedFactoryLosesSchemaBetweenSteps() {
  auto factory = ConnectionProvider().Factory(ConnectionMode::kIsolated, "");
  auto runner  = dbtarget::migrations::MakeSchemaRunner();

  // step 3 alters a table that died with step 1's connection
  bool threw = false;
  try {
    runner.MigrateUp(factory);
  } catch (const dbtarget::util::MigrationFailed& e) {
    threw = true;
    assert(e.StepId() == 3);
  }
  assert(threw);
}

void TestSharedFactoryKeepsSchemaWhileOwnerHoldsHandle() {
  ConnectionProvider provider;
  auto               owner   = provider.Open(ConnectionMode::kShared, "runner-shared");
  auto               factory = provider.Factory(ConnectionMode::kShared, "runner-shared");
  auto               runner  = dbtarget::migrations::MakeSchemaRunner();

  assert(runner.MigrateUp(factory, true) == 5);
  assert(HasObject(*owner, "table", "LogLines"));
  assert(runner.History(factory).size() == 5);

  owner->Close();
}

void TestCoreDownRevertsDependentIndexes() {
  auto conn    = ConnectionProvider().Open(ConnectionMode::kIsolated, "");
  auto factory = ConnectionProvider::Pinned(conn);
  auto runner  = dbtarget::migrations::MakeSchemaRunner();

  assert(runner.MigrateUp(factory, true) == 5);

  // core 3 has no index on top of it
  assert(runner.MigrateDown(factory) == 1);
  assert(VersionCount(*conn, "index") == 2);

  // core 2 drops Metrics, so index 101 goes first
  assert(runner.MigrateDown(factory) == 2);
  assert(!HasObject(*conn, "table", "Metrics"));
  assert(!HasObject(*conn, "index", "IX_Metrics_Path_Timestamp"));
  assert(VersionCount(*conn, "index") == 1);
  assert(HasObject(*conn, "index", "IX_LogLines_Host"));

  // index 101 is pending again and gets rebuilt
  assert(runner.MigrateUp(factory, true) == 3);
  assert(HasObject(*conn, "table", "Metrics"));
  assert(HasObject(*conn, "index", "IX_Metrics_Path_Timestamp"));
  assert(VersionCount(*conn, "core") == 3);
  assert(VersionCount(*conn, "index") == 2);

  // down to empty leaves no index rows behind
  while (runner.MigrateDown(factory) > 0) {
  }
  assert(VersionCount(*conn, "core") == 0);
  assert(VersionCount(*conn, "index") == 0);
  assert(!HasObject(*conn, "table", "LogLines"));

  conn->Close();
}

void TestIndexDependencyMustBeKnown() {
  auto index       = dbtarget::migrations::SqlStep(100, "orphan", {"SELECT 1;"}, {"SELECT 1;"});
  index.depends_on = 42;

  bool threw = false;
  try {
    MigrationRunner runner(dbtarget::migrations::CoreSteps(), {index});
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestCloseFailureDoesNotAbortRun() {
  auto conn    = ConnectionProvider().Open(ConnectionMode::kShared, "runner-close-fails");
  auto factory = [] {
    return std::make_shared<CloseFailsConnection>(ConnectionProvider().Open(ConnectionMode::kShared, "runner-close-fails"));
  };
  auto runner = dbtarget::migrations::MakeSchemaRunner();

  assert(runner.MigrateUp(factory, true) == 5);
  assert(HasObject(*conn, "table", "LogLines"));
  assert(runner.MigrateDown(factory, true) == 2);
  assert(runner.History(factory).size() == 3);

  conn->Close();
}

} // namespace

int main() {
  TestUpCreatesSchemaAndRecordsVersions();
  TestUpIsIdempotent();
  TestIndexStepsToggleIndependently();
  TestDownUntilEmpty();
  TestDuplicateIdsAreRejected();
  TestFailedStepIsRolledBackAndRetryable();
  TestPlainIsolatedFactoryLosesSchemaBetweenSteps();
  TestSharedFactoryKeepsSchemaWhileOwnerHoldsHandle();
  TestCoreDownRevertsDependentIndexes();
  TestIndexDependencyMustBeKnown();
  TestCloseFailureDoesNotAbortRun();

  std::cout << "dbtarget_unit_migration_runner: pass\n";
  return 0;
}
