#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace dbtarget::util {

/*
  Central error types.

  Lifecycle calls on the target (Flush/Shutdown) translate these into
  db::Result codes; everything else propagates them as exceptions.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Storage could not be opened or allocated. Never retried internally.
class ConnectionError : public std::runtime_error {
 public:
  explicit ConnectionError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// A statement failed against an open connection.
class DatabaseError : public std::runtime_error {
 public:
  DatabaseError(const std::string& msg, int code) : std::runtime_error(msg), code_(code) {
  }

  int Code() const {
    return code_;
  }

 private:
  int code_;
};

class DuplicateMigrationId : public std::logic_error {
 public:
  explicit DuplicateMigrationId(std::int64_t step_id)
      : std::logic_error("duplicate migration id " + std::to_string(step_id)), step_id_(step_id) {
  }

  std::int64_t StepId() const {
    return step_id_;
  }

 private:
  std::int64_t step_id_;
};

class MigrationFailed : public std::runtime_error {
 public:
  MigrationFailed(std::int64_t step_id, const std::string& cause)
      : std::runtime_error("migration " + std::to_string(step_id) + " failed: " + cause), step_id_(step_id), cause_(cause) {
  }

  std::int64_t StepId() const {
    return step_id_;
  }
  const std::string& Cause() const {
    return cause_;
  }

 private:
  std::int64_t step_id_;
  std::string  cause_;
};

class TypeMismatch : public std::runtime_error {
 public:
  TypeMismatch(const std::string& column, const std::string& requested, const std::string& actual)
      : std::runtime_error("column " + column + ": requested " + requested + " but stored " + actual),
        column_(column),
        requested_(requested),
        actual_(actual) {
  }

  const std::string& Column() const {
    return column_;
  }
  const std::string& Requested() const {
    return requested_;
  }
  const std::string& Actual() const {
    return actual_;
  }

 private:
  std::string column_;
  std::string requested_;
  std::string actual_;
};

class UnknownMetricKind : public std::invalid_argument {
 public:
  explicit UnknownMetricKind(std::int64_t value) : std::invalid_argument("unknown metric kind " + std::to_string(value)) {
  }
};

class UnknownLogLevel : public std::invalid_argument {
 public:
  explicit UnknownLogLevel(std::int64_t value) : std::invalid_argument("unknown log level " + std::to_string(value)) {
  }
};

// Metric values must be finite.
class InvalidMetricValue : public std::invalid_argument {
 public:
  InvalidMetricValue(const std::string& path, double value)
      : std::invalid_argument("metric " + path + " has non-finite value " + std::to_string(value)) {
  }
};

class InitializationFailed : public std::runtime_error {
 public:
  explicit InitializationFailed(const std::string& cause) : std::runtime_error("target initialization failed: " + cause) {
  }
};

class TargetClosed : public std::runtime_error {
 public:
  explicit TargetClosed(const std::string& target_name) : std::runtime_error("target " + target_name + " is closed") {
  }
};

} // namespace dbtarget::util
