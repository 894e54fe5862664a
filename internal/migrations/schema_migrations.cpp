#include "internal/migrations/schema_migrations.hpp"

namespace dbtarget::migrations {

std::vector<MigrationStep> CoreSteps() {
  std::vector<MigrationStep> steps;

  steps.push_back(SqlStep(1, "create LogLines",
                          {"CREATE TABLE LogLines ("
                           " Id INTEGER PRIMARY KEY AUTOINCREMENT,"
                           " Host TEXT NOT NULL,"
                           " Path TEXT NOT NULL DEFAULT '',"
                           " Message TEXT NOT NULL,"
                           " Level INTEGER NOT NULL,"
                           " Tags TEXT NOT NULL DEFAULT '{}',"
                           " Timestamp INTEGER NOT NULL);"},
                          {"DROP TABLE LogLines;"}));

  steps.push_back(SqlStep(2, "create Metrics",
                          {"CREATE TABLE Metrics ("
                           " Id INTEGER PRIMARY KEY AUTOINCREMENT,"
                           " Host TEXT NOT NULL,"
                           " Path TEXT NOT NULL,"
                           " Level INTEGER NOT NULL,"
                           " Type INTEGER NOT NULL,"
                           " Value REAL NOT NULL,"
                           " Timestamp INTEGER NOT NULL);"},
                          {"DROP TABLE Metrics;"}));

  steps.push_back(SqlStep(3, "add LogLines.Exception",
                          {"ALTER TABLE LogLines ADD COLUMN Exception TEXT;"},
                          {"ALTER TABLE LogLines DROP COLUMN Exception;"}));

  return steps;
}

std::vector<MigrationStep> IndexSteps() {
  std::vector<MigrationStep> steps;

  auto log_lines = SqlStep(100, "index LogLines for reading",
                           {"CREATE INDEX IX_LogLines_Timestamp_Level ON LogLines(Timestamp, Level);",
                            "CREATE INDEX IX_LogLines_Host ON LogLines(Host);"},
                           {"DROP INDEX IF EXISTS IX_LogLines_Host;", "DROP INDEX IF EXISTS IX_LogLines_Timestamp_Level;"});
  log_lines.depends_on = 1;
  steps.push_back(std::move(log_lines));

  auto metrics = SqlStep(101, "index Metrics for reading",
                         {"CREATE INDEX IX_Metrics_Path_Timestamp ON Metrics(Path, Timestamp);"},
                         {"DROP INDEX IF EXISTS IX_Metrics_Path_Timestamp;"});
  metrics.depends_on = 2;
  steps.push_back(std::move(metrics));

  return steps;
}

MigrationRunner MakeSchemaRunner(std::shared_ptr<spdlog::logger> logger) {
  return MigrationRunner(CoreSteps(), IndexSteps(), std::move(logger));
}

} // namespace dbtarget::migrations
