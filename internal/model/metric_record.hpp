#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "internal/model/log_level.hpp"
#include "internal/util/time.hpp"

namespace dbtarget::model {

enum class MetricKind : std::uint8_t {
  kCounter   = 1,
  kGauge     = 2,
  kTimer     = 3,
  kHistogram = 4,
  kMeter     = 5,
};

constexpr std::string_view ToString(MetricKind kind) {
  switch (kind) {
    case MetricKind::kCounter:
      return "counter";
    case MetricKind::kGauge:
      return "gauge";
    case MetricKind::kTimer:
      return "timer";
    case MetricKind::kHistogram:
      return "histogram";
    case MetricKind::kMeter:
      return "meter";
    default:
      return "unknown";
  }
}

/*
  A metric point. path is a dotted hierarchical name ("web01.app.signin").
*/
struct MetricRecord {
  std::string     path;
  double          value = 0.0;
  MetricKind      kind  = MetricKind::kCounter;
  LogLevel        level = LogLevel::kInfo;
  util::TimePoint timestamp{};
  std::string     host;
};

MetricRecord CounterValue(std::string path, double value);
MetricRecord GaugeValue(std::string path, double value);

} // namespace dbtarget::model
