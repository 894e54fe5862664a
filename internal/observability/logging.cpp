#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <sstream>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

namespace dbtarget::observability {
namespace {

std::string ResolveLevel(const dbtarget::runtime::config::RuntimeConfig& config) {
  if (const char* level = std::getenv("DBTARGET_LOG_LEVEL")) {
    return level;
  }

  if (!config.logging().level().empty()) {
    return config.logging().level();
  }

  return "info";
}

std::string ResolvePattern(const dbtarget::runtime::config::RuntimeConfig& config) {
  if (const char* pattern = std::getenv("DBTARGET_LOG_PATTERN")) {
    return pattern;
  }

  if (!config.logging().pattern().empty()) {
    return config.logging().pattern();
  }

  return "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";
}

std::string SerializeFields(std::initializer_list<LogField> fields) {
  std::ostringstream out;
  bool first = true;
  for (const auto& field : fields) {
    if (!first) {
      out << ' ';
    }
    first = false;
    out << field.key << '=' << field.value;
  }
  return out.str();
}

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

void InitializeLogging(const dbtarget::runtime::config::RuntimeConfig& config) {
  auto logger = spdlog::get("dbtarget");
  if (!logger) {
    logger = spdlog::stdout_color_mt("dbtarget");
  }
  logger->set_pattern(ResolvePattern(config));
  logger->set_level(spdlog::level::from_str(ResolveLevel(config)));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

std::shared_ptr<spdlog::logger> DiagnosticLogger(std::shared_ptr<spdlog::logger> preferred) {
  if (preferred) {
    return preferred;
  }
  return spdlog::default_logger();
}

void Log(spdlog::logger& logger, spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto serialized_fields = SerializeFields(fields);

  if (!serialized_fields.empty()) {
    logger.log(level, "{} {}", message, serialized_fields);
    return;
  }
  logger.log(level, "{}", message);
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  Log(*spdlog::default_logger_raw(), level, message, fields);
}

} // namespace dbtarget::observability
