#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <type_traits>

#include "internal/db/sql/sql_row.hpp"
#include "internal/model/log_record.hpp"
#include "internal/model/metric_record.hpp"
#include "internal/util/errors.hpp"

namespace dbtarget::codec {

/*
  Row codec: domain record <-> StoredRow. Stateless.

  Persisted integer codes (fixed; a change needs a migration step):

    Level   Verbose=1 Debug=2 Info=3 Warn=4 Error=5 Fatal=6
    Type    Counter=1 Gauge=2 Timer=3 Histogram=4 Meter=5

  Encoded rows carry their columns in the parameter order of
  sql::INSERT_LOG_LINE / sql::INSERT_METRIC.
*/

// Throws util::UnknownLogLevel for values outside the table.
std::int16_t    LevelToCode(model::LogLevel level);
model::LogLevel LevelFromCode(std::int64_t code);

// Throws util::UnknownMetricKind for values outside the table.
std::int16_t      KindToCode(model::MetricKind kind);
model::MetricKind KindFromCode(std::int64_t code);

db::sql::Row EncodeLog(const model::LogRecord& record);
// Throws util::InvalidMetricValue for NaN or infinite values.
db::sql::Row EncodeMetric(const model::MetricRecord& record);

model::LogRecord    DecodeLog(const db::sql::Row& row);
model::MetricRecord DecodeMetric(const db::sql::Row& row);

// Tags persist as a flat JSON object of strings.
std::string                        EncodeTags(const std::map<std::string, std::string>& tags);
std::map<std::string, std::string> DecodeTags(const std::string& json);

template <typename T>
constexpr std::string_view TypeNameOf();

template <>
constexpr std::string_view TypeNameOf<std::int64_t>() {
  return "integer";
}
template <>
constexpr std::string_view TypeNameOf<double>() {
  return "real";
}
template <>
constexpr std::string_view TypeNameOf<std::string>() {
  return "text";
}

/*
  Typed column read.

  Throws util::NotFound when the column is absent and util::TypeMismatch
  (column, requested, stored) when the stored value has another type.
  An integer read as real is widened; nothing else converts.
*/
template <typename T>
T Get(const db::sql::Row& row, std::string_view column) {
  const auto* value = row.Find(column);
  if (!value) {
    throw util::NotFound("column " + std::string(column) + " not in row");
  }

  if (const auto* typed = std::get_if<T>(value)) {
    return *typed;
  }

  if constexpr (std::is_same_v<T, double>) {
    if (const auto* integer = std::get_if<std::int64_t>(value)) {
      return static_cast<double>(*integer);
    }
  }

  throw util::TypeMismatch(std::string(column), std::string(TypeNameOf<T>()), std::string(db::sql::TypeName(*value)));
}

} // namespace dbtarget::codec
