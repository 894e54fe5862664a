#pragma once

namespace dbtarget::db::sql {

/*
  Canonical SQL used by the target, the codec and the migration runner.

  IMPORTANT:
  Parameter order of the INSERT statements is the column order the codec
  emits (codec::EncodeLog / codec::EncodeMetric).
*/

// per-row isolation inside a batch transaction
static constexpr const char* SAVEPOINT_ROW   = "SAVEPOINT row_write;";
static constexpr const char* RELEASE_ROW     = "RELEASE row_write;";
static constexpr const char* ROLLBACK_TO_ROW = "ROLLBACK TO row_write;";

static constexpr const char* INSERT_LOG_LINE =
    "INSERT INTO LogLines(Host,Path,Message,Level,Tags,Timestamp,Exception)"
    " VALUES(?,?,?,?,?,?,?);";

static constexpr const char* INSERT_METRIC =
    "INSERT INTO Metrics(Host,Path,Level,Type,Value,Timestamp)"
    " VALUES(?,?,?,?,?,?);";

static constexpr const char* SELECT_LOG_LINES =
    "SELECT Host,Path,Message,Level,Tags,Timestamp,Exception"
    " FROM LogLines ORDER BY Id;";

static constexpr const char* SELECT_METRICS =
    "SELECT Host,Path,Level,Type,Value,Timestamp"
    " FROM Metrics ORDER BY Id;";

static constexpr const char* COUNT_LOG_LINES = "SELECT COUNT(*) AS Count FROM LogLines;";
static constexpr const char* COUNT_METRICS   = "SELECT COUNT(*) AS Count FROM Metrics;";

// schema version bookkeeping

static constexpr const char* CREATE_SCHEMA_VERSIONS =
    "CREATE TABLE IF NOT EXISTS SchemaVersions ("
    " StepId INTEGER NOT NULL,"
    " Namespace TEXT NOT NULL,"
    " Description TEXT NOT NULL DEFAULT '',"
    " AppliedAt INTEGER NOT NULL,"
    " PRIMARY KEY (Namespace, StepId));";

static constexpr const char* INSERT_SCHEMA_VERSION =
    "INSERT INTO SchemaVersions(StepId,Namespace,Description,AppliedAt)"
    " VALUES(?,?,?,?);";

static constexpr const char* DELETE_SCHEMA_VERSION =
    "DELETE FROM SchemaVersions WHERE Namespace=? AND StepId=?;";

static constexpr const char* SELECT_SCHEMA_VERSIONS_IN_NAMESPACE =
    "SELECT StepId FROM SchemaVersions WHERE Namespace=?;";

static constexpr const char* SELECT_SCHEMA_VERSIONS =
    "SELECT StepId,Namespace,Description,AppliedAt"
    " FROM SchemaVersions ORDER BY AppliedAt, Namespace, StepId;";

} // namespace dbtarget::db::sql
