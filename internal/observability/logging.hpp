#pragma once

#include <spdlog/common.h>
#include <spdlog/logger.h>

#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>

namespace dbtarget::runtime::config {
class RuntimeConfig;
}

namespace dbtarget::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);

void InitializeLogging(const dbtarget::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

/*
  Diagnostic channel handed to the target and the migration runner.
  Falls back to the process default logger.
*/
std::shared_ptr<spdlog::logger> DiagnosticLogger(std::shared_ptr<spdlog::logger> preferred = nullptr);

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});
void Log(spdlog::logger& logger, spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogDebug(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::debug, message, fields);
}

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace dbtarget::observability

#define DBTARGET_LOG_DEBUG(message, ...) ::dbtarget::observability::LogDebug((message), ##__VA_ARGS__)
#define DBTARGET_LOG_INFO(message, ...) ::dbtarget::observability::LogInfo((message), ##__VA_ARGS__)
#define DBTARGET_LOG_WARN(message, ...) ::dbtarget::observability::LogWarn((message), ##__VA_ARGS__)
#define DBTARGET_LOG_ERROR(message, ...) ::dbtarget::observability::LogError((message), ##__VA_ARGS__)
