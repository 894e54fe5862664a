#pragma once

#include <memory>
#include <vector>

#include "internal/migrations/migration_runner.hpp"

namespace dbtarget::migrations {

/*
  The persisted schema of the target.

  Core steps (namespace "core"):
    1  LogLines table
    2  Metrics table
    3  LogLines.Exception column

  Index steps (namespace "index"), toggled independently:
    100  LogLines read index   (depends on core 1)
    101  Metrics read index    (depends on core 2)

  Level / Type integer codes stored in these tables are defined in
  codec/row_codec.hpp; changing them requires a new core step.
*/
std::vector<MigrationStep> CoreSteps();
std::vector<MigrationStep> IndexSteps();

MigrationRunner MakeSchemaRunner(std::shared_ptr<spdlog::logger> logger = nullptr);

} // namespace dbtarget::migrations
