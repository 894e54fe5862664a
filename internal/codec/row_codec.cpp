#include "internal/codec/row_codec.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <cmath>
#include <stdexcept>

#include "internal/util/host.hpp"

namespace dbtarget::codec {

using model::LogLevel;
using model::MetricKind;

namespace {

struct LevelCode {
  LogLevel     level;
  std::int16_t code;
};

struct KindCode {
  MetricKind   kind;
  std::int16_t code;
};

constexpr LevelCode kLevelCodes[] = {
    {LogLevel::kVerbose, 1}, {LogLevel::kDebug, 2}, {LogLevel::kInfo, 3},
    {LogLevel::kWarn, 4},    {LogLevel::kError, 5}, {LogLevel::kFatal, 6},
};

constexpr KindCode kKindCodes[] = {
    {MetricKind::kCounter, 1}, {MetricKind::kGauge, 2}, {MetricKind::kTimer, 3},
    {MetricKind::kHistogram, 4}, {MetricKind::kMeter, 5},
};

const std::string& HostOrLocal(const std::string& host) {
  return host.empty() ? util::LocalHostName() : host;
}

} // namespace

// ------------------------------------------------------------
// Code tables
// ------------------------------------------------------------

std::int16_t LevelToCode(LogLevel level) {
  for (const auto& entry : kLevelCodes) {
    if (entry.level == level) return entry.code;
  }
  throw util::UnknownLogLevel(static_cast<std::int64_t>(level));
}

LogLevel LevelFromCode(std::int64_t code) {
  for (const auto& entry : kLevelCodes) {
    if (entry.code == code) return entry.level;
  }
  throw util::UnknownLogLevel(code);
}

std::int16_t KindToCode(MetricKind kind) {
  for (const auto& entry : kKindCodes) {
    if (entry.kind == kind) return entry.code;
  }
  throw util::UnknownMetricKind(static_cast<std::int64_t>(kind));
}

MetricKind KindFromCode(std::int64_t code) {
  for (const auto& entry : kKindCodes) {
    if (entry.code == code) return entry.kind;
  }
  throw util::UnknownMetricKind(code);
}

// ------------------------------------------------------------
// Tags
// ------------------------------------------------------------

std::string EncodeTags(const std::map<std::string, std::string>& tags) {
  google::protobuf::Struct object;
  for (const auto& [key, value] : tags) {
    (*object.mutable_fields())[key].set_string_value(value);
  }

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(object, &json);
  if (!status.ok()) {
    throw std::runtime_error("cannot encode tags: " + std::string(status.message()));
  }
  return json;
}

std::map<std::string, std::string> DecodeTags(const std::string& json) {
  std::map<std::string, std::string> tags;
  if (json.empty()) return tags;

  google::protobuf::Struct object;
  auto                     status = google::protobuf::util::JsonStringToMessage(json, &object);
  if (!status.ok()) {
    throw util::TypeMismatch("Tags", "json object", "text");
  }

  for (const auto& [key, value] : object.fields()) {
    if (value.kind_case() == google::protobuf::Value::kStringValue) {
      tags[key] = value.string_value();
      continue;
    }
    std::string rendered;
    if (google::protobuf::util::MessageToJsonString(value, &rendered).ok()) {
      tags[key] = rendered;
    }
  }
  return tags;
}

// ------------------------------------------------------------
// Encode
// ------------------------------------------------------------

db::sql::Row EncodeLog(const model::LogRecord& record) {
  db::sql::Row row;
  row.Set("Host", HostOrLocal(record.host));
  row.Set("Path", record.path);
  row.Set("Message", record.message);
  row.Set("Level", static_cast<std::int64_t>(LevelToCode(record.level)));
  row.Set("Tags", EncodeTags(record.tags));
  row.Set("Timestamp", util::ToUnixNanos(record.timestamp));
  if (record.exception.empty()) {
    row.Set("Exception", nullptr);
  } else {
    row.Set("Exception", record.exception);
  }
  return row;
}

db::sql::Row EncodeMetric(const model::MetricRecord& record) {
  if (!std::isfinite(record.value)) {
    throw util::InvalidMetricValue(record.path, record.value);
  }

  db::sql::Row row;
  row.Set("Host", HostOrLocal(record.host));
  row.Set("Path", record.path);
  row.Set("Level", static_cast<std::int64_t>(LevelToCode(record.level)));
  row.Set("Type", static_cast<std::int64_t>(KindToCode(record.kind)));
  row.Set("Value", record.value);
  row.Set("Timestamp", util::ToUnixNanos(record.timestamp));
  return row;
}

// ------------------------------------------------------------
// Decode
// ------------------------------------------------------------

model::LogRecord DecodeLog(const db::sql::Row& row) {
  model::LogRecord record;
  record.host      = Get<std::string>(row, "Host");
  record.path      = Get<std::string>(row, "Path");
  record.message   = Get<std::string>(row, "Message");
  record.level     = LevelFromCode(Get<std::int64_t>(row, "Level"));
  record.tags      = DecodeTags(Get<std::string>(row, "Tags"));
  record.timestamp = util::FromUnixNanos(Get<std::int64_t>(row, "Timestamp"));
  if (!row.IsNull("Exception")) {
    record.exception = Get<std::string>(row, "Exception");
  }
  return record;
}

model::MetricRecord DecodeMetric(const db::sql::Row& row) {
  model::MetricRecord record;
  record.host      = Get<std::string>(row, "Host");
  record.path      = Get<std::string>(row, "Path");
  record.level     = LevelFromCode(Get<std::int64_t>(row, "Level"));
  record.kind      = KindFromCode(Get<std::int64_t>(row, "Type"));
  record.value     = Get<double>(row, "Value");
  record.timestamp = util::FromUnixNanos(Get<std::int64_t>(row, "Timestamp"));
  return record;
}

} // namespace dbtarget::codec
