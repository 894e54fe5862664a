#pragma once

#include <map>
#include <string>

#include "internal/model/log_level.hpp"
#include "internal/util/time.hpp"

namespace dbtarget::model {

/*
  A single log line handed over by a producer.

  Immutable once submitted; consumed exactly once by the target.
  An empty host is stamped with the local host name when encoded.
*/
struct LogRecord {
  util::TimePoint                    timestamp{};
  LogLevel                           level = LogLevel::kInfo;
  std::string                        message;
  std::string                        host;
  std::string                        path;
  std::map<std::string, std::string> tags;
  std::string                        exception;
};

// Producer helper: stamps now and this host.
LogRecord LogLine(std::string message, LogLevel level = LogLevel::kInfo);

} // namespace dbtarget::model
