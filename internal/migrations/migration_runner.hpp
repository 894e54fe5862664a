#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/logger.h>

#include "internal/db/api/connection.hpp"
#include "internal/util/time.hpp"

namespace dbtarget::migrations {

/*
  A reversible schema change. `up` and `down` run inside the same
  transaction that records / removes the step's SchemaVersions row.
*/
struct MigrationStep {
  std::int64_t                             id = 0;
  std::string                              description;
  std::function<void(db::Connection&)> up;
  std::function<void(db::Connection&)> down;

  // index steps only: the core step whose tables this step indexes (0 = none).
  // Reverting that core step reverts this one first.
  std::int64_t depends_on = 0;
};

// Step made of plain SQL statements.
MigrationStep SqlStep(std::int64_t id, std::string description, std::vector<std::string> up_sql, std::vector<std::string> down_sql);

struct SchemaVersionEntry {
  std::int64_t    step_id = 0;
  std::string     ns;
  std::string     description;
  util::TimePoint applied_at{};
};

/*
  MigrationRunner

  Applies / reverts two independently versioned step lists:
    core  - the table schema, tracked in namespace "core"
    index - read-optimization indexes, tracked in namespace "index"

  Connection handling:
    Every step acquires a connection from the factory and closes it when the
    step finishes. Pass ConnectionProvider::Pinned() to keep one physical
    connection (required for in-memory stores).

  Failure:
    A throwing step is rolled back and unrecorded, later steps are not
    attempted, and util::MigrationFailed{step, cause} propagates.

  Thread Safety: not thread-safe. The caller must hold the store exclusively
  for the duration of a run.
*/
class MigrationRunner {
 public:
  static constexpr const char* kCoreNamespace  = "core";
  static constexpr const char* kIndexNamespace = "index";

  // Throws util::DuplicateMigrationId when two steps share an id,
  // std::invalid_argument when an index step depends on an unknown core step.
  MigrationRunner(std::vector<MigrationStep> core_steps, std::vector<MigrationStep> index_steps,
                  std::shared_ptr<spdlog::logger> logger = nullptr);

  // Returns the number of steps applied by this call.
  std::size_t MigrateUp(const db::ConnectionFactory& factory, bool include_index = false);

  // Reverts the latest core step (and the latest index step when asked).
  // Applied index steps that depend on the reverted core step are reverted
  // before it. Returns the number of steps reverted; zero when nothing is applied.
  std::size_t MigrateDown(const db::ConnectionFactory& factory, bool include_index = false);

  std::vector<SchemaVersionEntry> History(const db::ConnectionFactory& factory) const;

  const std::vector<MigrationStep>& CoreSteps() const {
    return core_steps_;
  }
  const std::vector<MigrationStep>& IndexSteps() const {
    return index_steps_;
  }

 private:
  std::size_t ApplyPending(const db::ConnectionFactory& factory, const std::vector<MigrationStep>& steps, const char* ns);
  const MigrationStep* LatestApplied(const db::ConnectionFactory& factory, const std::vector<MigrationStep>& steps, const char* ns) const;
  std::size_t          RevertDependents(const db::ConnectionFactory& factory, std::int64_t core_step_id);
  void                 RevertStep(const db::ConnectionFactory& factory, const MigrationStep& step, const char* ns);

  std::vector<MigrationStep>      core_steps_;
  std::vector<MigrationStep>      index_steps_;
  std::shared_ptr<spdlog::logger> logger_;
};

} // namespace dbtarget::migrations
