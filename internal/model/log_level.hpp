#pragma once

#include <cstdint>
#include <string_view>

namespace dbtarget::model {

// Ordered severity. Persisted codes live in codec::LevelToCode.
enum class LogLevel : std::uint8_t {
  kVerbose = 1,
  kDebug   = 2,
  kInfo    = 3,
  kWarn    = 4,
  kError   = 5,
  kFatal   = 6,
};

constexpr std::string_view ToString(LogLevel level) {
  switch (level) {
    case LogLevel::kVerbose:
      return "verbose";
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
    case LogLevel::kFatal:
      return "fatal";
    default:
      return "unknown";
  }
}

} // namespace dbtarget::model
