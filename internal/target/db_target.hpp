#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <spdlog/logger.h>

#include "internal/db/api/connection.hpp"
#include "internal/db/api/result.hpp"
#include "internal/migrations/migration_runner.hpp"
#include "internal/model/log_record.hpp"
#include "internal/model/metric_record.hpp"
#include "internal/target/mailbox.hpp"

namespace dbtarget::target {

enum class TargetState : std::uint8_t {
  kUninitialized = 0,
  kMigrating     = 1,
  kReady         = 2,
  kDraining      = 3,
  kClosed        = 4,
};

constexpr std::string_view ToString(TargetState state) {
  switch (state) {
    case TargetState::kUninitialized:
      return "uninitialized";
    case TargetState::kMigrating:
      return "migrating";
    case TargetState::kReady:
      return "ready";
    case TargetState::kDraining:
      return "draining";
    case TargetState::kClosed:
      return "closed";
  }
  return "unknown";
}

struct DbTargetConf {
  // diagnostics only
  std::string name = "dbtarget";

  // called once by Start(); the returned handle becomes the writer's
  db::ConnectionFactory connect;

  std::size_t max_batch_size     = 512;
  bool        include_read_index = false;

  // diagnostic channel; default logger when null
  std::shared_ptr<spdlog::logger> diagnostics;

  // schema to bring current on Start(); the shipped schema when null
  std::shared_ptr<migrations::MigrationRunner> runner;
};

/*
  DbTarget

  Persists log lines and metric points through one serialized writer.

    Uninitialized --Start()--> Migrating --> Ready --Shutdown()--> Draining --> Closed

  Start() acquires the connection, migrates the schema through a pinned
  (non-closing) view of it and launches the writer thread. Producers may
  call SubmitLog/SubmitMetric/Flush/Shutdown from any thread; all of it is
  funneled through the mailbox, so rows land in submission order.

  Delivery: a submitted record is only guaranteed durable once a later
  Flush() returned OK. Each batch is one transaction with a savepoint per
  row: a row the store rejects is dropped alone, a failure of the batch
  itself (begin/commit) drops the batch. Either is logged and reported to
  the next Flush()/Shutdown() caller.
*/
class DbTarget {
 public:
  explicit DbTarget(DbTargetConf conf);
  ~DbTarget();

  DbTarget(const DbTarget&)            = delete;
  DbTarget& operator=(const DbTarget&) = delete;

  // Throws util::InitializationFailed; the target is Closed afterwards.
  void Start();

  // Encode and enqueue. Throws util::TargetClosed once Shutdown() was called,
  // util::InvalidState before Start(), codec errors (util::InvalidMetricValue,
  // util::UnknownMetricKind, util::UnknownLogLevel) for unencodable records;
  // a rejected record is never enqueued.
  void SubmitLog(const model::LogRecord& record);
  void SubmitMetric(const model::MetricRecord& record);

  // Resolves after every message enqueued before the call is durable.
  // Dropping the future does not cancel the writer's work.
  std::future<db::Result> FlushAsync();
  db::Result              Flush();

  // Drains, closes the connection, joins the writer. OK when already closed.
  db::Result Shutdown();

  TargetState State() const;

  const std::string& Name() const {
    return conf_.name;
  }

  std::uint64_t RowsWritten() const {
    return rows_written_.load();
  }

 private:
  void       Submit(WriteRow write);
  void       Run();
  void       WritePending(std::vector<WriteRow>& pending);
  bool       WriteRowIsolated(const WriteRow& write);
  void       RecordWriteError(const std::string& message);
  db::Result TakeWriteError();
  db::Result CloseConnection();

  DbTargetConf                    conf_;
  std::shared_ptr<spdlog::logger> logger_;

  mutable std::mutex             state_mutex_;
  TargetState                    state_ = TargetState::kUninitialized;
  std::shared_future<db::Result> shutdown_result_;

  Mailbox     mailbox_;
  std::thread writer_;

  // touched by the writer thread only once Ready
  db::ConnectionPtr          conn_;
  std::optional<std::string> write_error_;

  std::atomic<std::uint64_t> rows_written_{0};
};

} // namespace dbtarget::target
