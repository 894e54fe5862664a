#include "internal/migrations/migration_runner.hpp"

#include <set>
#include <stdexcept>

#include "internal/db/sql/sql_queries.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace dbtarget::migrations {

using observability::IntField;
using observability::StringField;

namespace {

/*
  One acquisition from the factory. Closing on scope exit mirrors what a
  migration processor does between steps; a pinned factory turns it into
  a no-op.
*/
class ConnectionLease {
 public:
  ConnectionLease(const db::ConnectionFactory& factory, spdlog::logger& logger) : logger_(logger) {
    if (!factory) {
      throw util::ConnectionError("migration runner has no connection factory");
    }
    conn_ = factory();
    if (!conn_) {
      throw util::ConnectionError("connection factory returned no connection");
    }
  }

  ~ConnectionLease() {
    try {
      conn_->Close();
    } catch (const std::exception& e) {
      observability::Log(logger_, spdlog::level::warn, "closing migration connection failed", {StringField("error", e.what())});
    }
  }

  ConnectionLease(const ConnectionLease&)            = delete;
  ConnectionLease& operator=(const ConnectionLease&) = delete;

  db::Connection& operator*() const {
    return *conn_;
  }
  db::Connection* operator->() const {
    return conn_.get();
  }

 private:
  spdlog::logger&   logger_;
  db::ConnectionPtr conn_;
};

std::set<std::int64_t> AppliedIds(db::Connection& conn, const char* ns) {
  conn.Exec(db::sql::CREATE_SCHEMA_VERSIONS);

  std::set<std::int64_t> ids;
  for (const auto& row : conn.Query(db::sql::SELECT_SCHEMA_VERSIONS_IN_NAMESPACE, {std::string(ns)})) {
    const auto* value = row.Find("StepId");
    if (value && std::holds_alternative<std::int64_t>(*value)) {
      ids.insert(std::get<std::int64_t>(*value));
    }
  }
  return ids;
}

template <typename T>
T CellOr(const db::sql::Row& row, const char* column, T fallback) {
  const auto* value = row.Find(column);
  if (value) {
    if (const auto* typed = std::get_if<T>(value)) return *typed;
  }
  return fallback;
}

} // namespace

MigrationStep SqlStep(std::int64_t id, std::string description, std::vector<std::string> up_sql, std::vector<std::string> down_sql) {
  MigrationStep step;
  step.id          = id;
  step.description = std::move(description);
  step.up          = [statements = std::move(up_sql)](db::Connection& conn) {
    for (const auto& sql : statements) conn.Exec(sql);
  };
  step.down = [statements = std::move(down_sql)](db::Connection& conn) {
    for (const auto& sql : statements) conn.Exec(sql);
  };
  return step;
}

MigrationRunner::MigrationRunner(std::vector<MigrationStep> core_steps, std::vector<MigrationStep> index_steps,
                                 std::shared_ptr<spdlog::logger> logger)
    : core_steps_(std::move(core_steps)),
      index_steps_(std::move(index_steps)),
      logger_(observability::DiagnosticLogger(std::move(logger))) {
  std::set<std::int64_t> seen;
  for (const auto* steps : {&core_steps_, &index_steps_}) {
    for (const auto& step : *steps) {
      if (!seen.insert(step.id).second) {
        throw util::DuplicateMigrationId(step.id);
      }
      if (!step.up || !step.down) {
        throw std::invalid_argument("migration " + std::to_string(step.id) + " needs both up and down");
      }
    }
  }

  for (const auto& step : index_steps_) {
    if (step.depends_on == 0) continue;
    bool known = false;
    for (const auto& core : core_steps_) {
      if (core.id == step.depends_on) known = true;
    }
    if (!known) {
      throw std::invalid_argument("index migration " + std::to_string(step.id) + " depends on unknown core step " +
                                  std::to_string(step.depends_on));
    }
  }
}

// ------------------------------------------------------------
// Up
// ------------------------------------------------------------

std::size_t MigrationRunner::MigrateUp(const db::ConnectionFactory& factory, bool include_index) {
  std::size_t applied = ApplyPending(factory, core_steps_, kCoreNamespace);
  if (include_index) {
    applied += ApplyPending(factory, index_steps_, kIndexNamespace);
  }
  return applied;
}

std::size_t MigrationRunner::ApplyPending(const db::ConnectionFactory& factory, const std::vector<MigrationStep>& steps, const char* ns) {
  std::set<std::int64_t> done;
  {
    ConnectionLease conn(factory, *logger_);
    done = AppliedIds(*conn, ns);
  }

  std::size_t applied = 0;
  for (const auto& step : steps) {
    if (done.count(step.id)) {
      continue;
    }

    ConnectionLease conn(factory, *logger_);
    try {
      auto tx = conn->Begin();
      conn->Exec(db::sql::CREATE_SCHEMA_VERSIONS);
      step.up(*conn);
      conn->Execute(db::sql::INSERT_SCHEMA_VERSION,
                    {step.id, std::string(ns), step.description, util::ToUnixMillis(util::Now())});
      tx->Commit();
    } catch (const std::exception& e) {
      observability::Log(*logger_, spdlog::level::err, "migration up failed",
                         {StringField("namespace", ns), IntField("step", step.id), StringField("error", e.what())});
      throw util::MigrationFailed(step.id, e.what());
    }

    ++applied;
    observability::Log(*logger_, spdlog::level::info, "migration applied",
                       {StringField("namespace", ns), IntField("step", step.id), StringField("description", step.description)});
  }

  if (applied == 0) {
    observability::Log(*logger_, spdlog::level::debug, "schema up to date", {StringField("namespace", ns)});
  }
  return applied;
}

// ------------------------------------------------------------
// Down
// ------------------------------------------------------------

std::size_t MigrationRunner::MigrateDown(const db::ConnectionFactory& factory, bool include_index) {
  std::size_t reverted = 0;

  // indexes sit on core tables, so they go first
  if (include_index) {
    if (const auto* step = LatestApplied(factory, index_steps_, kIndexNamespace)) {
      RevertStep(factory, *step, kIndexNamespace);
      ++reverted;
    }
  }

  if (const auto* step = LatestApplied(factory, core_steps_, kCoreNamespace)) {
    // dropping a table drops its indexes; keep the index namespace truthful
    reverted += RevertDependents(factory, step->id);
    RevertStep(factory, *step, kCoreNamespace);
    ++reverted;
  }
  return reverted;
}

const MigrationStep* MigrationRunner::LatestApplied(const db::ConnectionFactory& factory, const std::vector<MigrationStep>& steps,
                                                    const char* ns) const {
  std::set<std::int64_t> done;
  {
    ConnectionLease conn(factory, *logger_);
    done = AppliedIds(*conn, ns);
  }

  for (auto it = steps.rbegin(); it != steps.rend(); ++it) {
    if (done.count(it->id)) return &*it;
  }

  observability::Log(*logger_, spdlog::level::debug, "nothing to revert", {StringField("namespace", ns)});
  return nullptr;
}

std::size_t MigrationRunner::RevertDependents(const db::ConnectionFactory& factory, std::int64_t core_step_id) {
  std::set<std::int64_t> done;
  {
    ConnectionLease conn(factory, *logger_);
    done = AppliedIds(*conn, kIndexNamespace);
  }

  std::size_t reverted = 0;
  for (auto it = index_steps_.rbegin(); it != index_steps_.rend(); ++it) {
    if (it->depends_on != core_step_id || !done.count(it->id)) continue;

    observability::Log(*logger_, spdlog::level::info, "reverting dependent index step",
                       {IntField("step", it->id), IntField("core_step", core_step_id)});
    RevertStep(factory, *it, kIndexNamespace);
    ++reverted;
  }
  return reverted;
}

void MigrationRunner::RevertStep(const db::ConnectionFactory& factory, const MigrationStep& step, const char* ns) {
  ConnectionLease conn(factory, *logger_);
  try {
    auto tx = conn->Begin();
    step.down(*conn);
    conn->Execute(db::sql::DELETE_SCHEMA_VERSION, {std::string(ns), step.id});
    tx->Commit();
  } catch (const std::exception& e) {
    observability::Log(*logger_, spdlog::level::err, "migration down failed",
                       {StringField("namespace", ns), IntField("step", step.id), StringField("error", e.what())});
    throw util::MigrationFailed(step.id, e.what());
  }

  observability::Log(*logger_, spdlog::level::info, "migration reverted",
                     {StringField("namespace", ns), IntField("step", step.id), StringField("description", step.description)});
}

// ------------------------------------------------------------
// History
// ------------------------------------------------------------

std::vector<SchemaVersionEntry> MigrationRunner::History(const db::ConnectionFactory& factory) const {
  ConnectionLease conn(factory, *logger_);
  conn->Exec(db::sql::CREATE_SCHEMA_VERSIONS);

  std::vector<SchemaVersionEntry> entries;
  for (const auto& row : conn->Query(db::sql::SELECT_SCHEMA_VERSIONS)) {
    SchemaVersionEntry entry;
    entry.step_id     = CellOr<std::int64_t>(row, "StepId", 0);
    entry.ns          = CellOr<std::string>(row, "Namespace", "");
    entry.description = CellOr<std::string>(row, "Description", "");
    entry.applied_at  = util::TimePoint{} + std::chrono::milliseconds(CellOr<std::int64_t>(row, "AppliedAt", 0));
    entries.push_back(std::move(entry));
  }
  return entries;
}

} // namespace dbtarget::migrations
