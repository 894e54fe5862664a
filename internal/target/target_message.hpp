#pragma once

#include <future>
#include <memory>
#include <variant>

#include "internal/db/api/result.hpp"
#include "internal/db/sql/sql_row.hpp"

namespace dbtarget::target {

enum class RowFamily {
  kLogLines,
  kMetrics,
};

// An encoded row waiting for the writer.
struct WriteRow {
  RowFamily    family;
  db::sql::Row row;
};

// Barrier: acknowledged once every earlier message is durable.
struct FlushRequest {
  std::shared_ptr<std::promise<db::Result>> done;
};

// Final barrier: flush, close the connection, stop the writer.
struct ShutdownRequest {
  std::shared_ptr<std::promise<db::Result>> done;
};

using TargetMessage = std::variant<WriteRow, FlushRequest, ShutdownRequest>;

} // namespace dbtarget::target
