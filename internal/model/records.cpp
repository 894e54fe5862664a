#include "internal/model/log_record.hpp"
#include "internal/model/metric_record.hpp"
#include "internal/util/host.hpp"

namespace dbtarget::model {

namespace {

MetricRecord MakeMetric(std::string path, double value, MetricKind kind) {
  MetricRecord metric;
  metric.path      = std::move(path);
  metric.value     = value;
  metric.kind      = kind;
  metric.timestamp = util::Now();
  metric.host      = util::LocalHostName();
  return metric;
}

} // namespace

LogRecord LogLine(std::string message, LogLevel level) {
  LogRecord line;
  line.timestamp = util::Now();
  line.level     = level;
  line.message   = std::move(message);
  line.host      = util::LocalHostName();
  return line;
}

MetricRecord CounterValue(std::string path, double value) {
  return MakeMetric(std::move(path), value, MetricKind::kCounter);
}

MetricRecord GaugeValue(std::string path, double value) {
  return MakeMetric(std::move(path), value, MetricKind::kGauge);
}

} // namespace dbtarget::model
