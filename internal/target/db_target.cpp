#include "internal/target/db_target.hpp"

#include "internal/codec/row_codec.hpp"
#include "internal/db/connection_provider.hpp"
#include "internal/db/sql/sql_queries.hpp"
#include "internal/migrations/schema_migrations.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace dbtarget::target {

using observability::IntField;
using observability::StringField;

DbTarget::DbTarget(DbTargetConf conf)
    : conf_(std::move(conf)), logger_(observability::DiagnosticLogger(conf_.diagnostics)) {
  if (conf_.max_batch_size == 0) conf_.max_batch_size = 1;
}

DbTarget::~DbTarget() {
  TargetState state;
  {
    std::lock_guard lock(state_mutex_);
    state = state_;
  }

  if (state == TargetState::kReady || state == TargetState::kDraining) {
    auto result = Shutdown();
    if (!result) {
      observability::Log(*logger_, spdlog::level::err, "target shutdown on destruction failed",
                         {StringField("target", conf_.name), StringField("error", result.message)});
    }
  }
  if (writer_.joinable()) writer_.join();
}

// ------------------------------------------------------------
// Lifecycle
// ------------------------------------------------------------

void DbTarget::Start() {
  {
    std::lock_guard lock(state_mutex_);
    if (state_ != TargetState::kUninitialized) {
      throw util::InvalidState("target " + conf_.name + " already started (" + std::string(ToString(state_)) + ")");
    }
    state_ = TargetState::kMigrating;
  }

  db::ConnectionPtr conn;
  try {
    if (!conf_.connect) {
      throw util::ConnectionError("no connection factory configured");
    }
    conn = conf_.connect();
    if (!conn) {
      throw util::ConnectionError("connection factory returned no connection");
    }

    auto runner = conf_.runner;
    if (!runner) {
      runner = std::make_shared<migrations::MigrationRunner>(migrations::MakeSchemaRunner(logger_));
    }

    // the runner closes its connection after every step; keep ours alive
    runner->MigrateUp(db::ConnectionProvider::Pinned(conn), conf_.include_read_index);
  } catch (const std::exception& e) {
    if (conn) {
      try {
        conn->Close();
      } catch (const std::exception& close_error) {
        observability::Log(*logger_, spdlog::level::warn, "closing connection after failed start",
                           {StringField("target", conf_.name), StringField("error", close_error.what())});
      }
    }
    {
      std::lock_guard lock(state_mutex_);
      state_ = TargetState::kClosed;
    }
    observability::Log(*logger_, spdlog::level::err, "target failed to start",
                       {StringField("target", conf_.name), StringField("error", e.what())});
    throw util::InitializationFailed(e.what());
  }

  conn_   = std::move(conn);
  writer_ = std::thread(&DbTarget::Run, this);
  {
    std::lock_guard lock(state_mutex_);
    state_ = TargetState::kReady;
  }

  observability::Log(*logger_, spdlog::level::info, "target ready",
                     {StringField("target", conf_.name), StringField("db", conn_->Identifier()),
                      IntField("max_batch_size", static_cast<std::int64_t>(conf_.max_batch_size))});
}

db::Result DbTarget::Shutdown() {
  std::shared_future<db::Result> pending;
  bool                           initiator = false;
  {
    std::lock_guard lock(state_mutex_);
    switch (state_) {
      case TargetState::kClosed:
        return db::Result::Ok();

      case TargetState::kUninitialized:
        state_ = TargetState::kClosed;
        return db::Result::Ok();

      case TargetState::kMigrating:
        return db::Result::Err(db::ErrorCode::NotStarted, "target " + conf_.name + " is still migrating");

      case TargetState::kDraining:
        pending = shutdown_result_;
        break;

      case TargetState::kReady: {
        state_       = TargetState::kDraining;
        auto promise = std::make_shared<std::promise<db::Result>>();
        shutdown_result_ = promise->get_future().share();
        mailbox_.Post(ShutdownRequest{promise});
        mailbox_.Seal();
        pending   = shutdown_result_;
        initiator = true;
        break;
      }
    }
  }

  auto result = pending.get();

  if (initiator) {
    if (writer_.joinable()) writer_.join();
    std::lock_guard lock(state_mutex_);
    state_ = TargetState::kClosed;
    observability::Log(*logger_, result ? spdlog::level::info : spdlog::level::err, "target closed",
                       {StringField("target", conf_.name), IntField("rows_written", static_cast<std::int64_t>(rows_written_.load())),
                        StringField("error", result.message)});
  }
  return result;
}

TargetState DbTarget::State() const {
  std::lock_guard lock(state_mutex_);
  return state_;
}

// ------------------------------------------------------------
// Producer side
// ------------------------------------------------------------

void DbTarget::SubmitLog(const model::LogRecord& record) {
  Submit(WriteRow{RowFamily::kLogLines, codec::EncodeLog(record)});
}

void DbTarget::SubmitMetric(const model::MetricRecord& record) {
  Submit(WriteRow{RowFamily::kMetrics, codec::EncodeMetric(record)});
}

void DbTarget::Submit(WriteRow write) {
  std::lock_guard lock(state_mutex_);
  if (state_ == TargetState::kDraining || state_ == TargetState::kClosed) {
    throw util::TargetClosed(conf_.name);
  }
  if (state_ != TargetState::kReady) {
    throw util::InvalidState("target " + conf_.name + " is not started");
  }
  // the mailbox is sealed only after leaving Ready
  if (!mailbox_.Post(std::move(write))) {
    throw util::TargetClosed(conf_.name);
  }
}

std::future<db::Result> DbTarget::FlushAsync() {
  auto promise = std::make_shared<std::promise<db::Result>>();
  auto future  = promise->get_future();

  std::lock_guard lock(state_mutex_);
  switch (state_) {
    case TargetState::kReady:
      if (mailbox_.Post(FlushRequest{promise})) break;
      [[fallthrough]];
    case TargetState::kDraining:
    case TargetState::kClosed:
      promise->set_value(db::Result::Err(db::ErrorCode::TargetClosed, "target " + conf_.name + " is closed"));
      break;
    default:
      promise->set_value(db::Result::Err(db::ErrorCode::NotStarted, "target " + conf_.name + " is not started"));
      break;
  }
  return future;
}

db::Result DbTarget::Flush() {
  return FlushAsync().get();
}

// ------------------------------------------------------------
// Writer
// ------------------------------------------------------------

void DbTarget::Run() {
  std::vector<WriteRow> pending;
  pending.reserve(conf_.max_batch_size);

  for (;;) {
    auto batch = mailbox_.TakeBatch(conf_.max_batch_size);
    if (batch.empty()) {
      // sealed without a shutdown marker; nothing left to acknowledge
      WritePending(pending);
      return;
    }

    for (auto& message : batch) {
      if (auto* write = std::get_if<WriteRow>(&message)) {
        pending.push_back(std::move(*write));
        continue;
      }

      WritePending(pending);

      if (auto* flush = std::get_if<FlushRequest>(&message)) {
        flush->done->set_value(TakeWriteError());
        continue;
      }

      auto& shutdown = std::get<ShutdownRequest>(message);
      auto  result   = TakeWriteError();
      auto  closed   = CloseConnection();
      if (result && !closed) result = closed;
      shutdown.done->set_value(std::move(result));
      return;
    }

    WritePending(pending);
  }
}

void DbTarget::WritePending(std::vector<WriteRow>& pending) {
  if (pending.empty()) return;

  const auto   rows    = static_cast<std::int64_t>(pending.size());
  std::int64_t written = 0;
  try {
    auto tx = conn_->Begin();
    for (const auto& write : pending) {
      if (WriteRowIsolated(write)) ++written;
    }
    tx->Commit();
    rows_written_ += static_cast<std::uint64_t>(written);
    observability::Log(*logger_, spdlog::level::debug, "batch written",
                       {StringField("target", conf_.name), IntField("rows", written), IntField("rejected", rows - written)});
  } catch (const std::exception& e) {
    observability::Log(*logger_, spdlog::level::err, "batch write failed",
                       {StringField("target", conf_.name), IntField("rows", rows), StringField("error", e.what())});
    RecordWriteError(e.what());
  }
  pending.clear();
}

// A rejected row is rolled back to its own savepoint; the rest of the batch commits.
bool DbTarget::WriteRowIsolated(const WriteRow& write) {
  const char* sql = write.family == RowFamily::kLogLines ? db::sql::INSERT_LOG_LINE : db::sql::INSERT_METRIC;

  conn_->Exec(db::sql::SAVEPOINT_ROW);
  try {
    conn_->Execute(sql, write.row.Values());
  } catch (const util::DatabaseError& e) {
    conn_->Exec(db::sql::ROLLBACK_TO_ROW);
    conn_->Exec(db::sql::RELEASE_ROW);
    observability::Log(*logger_, spdlog::level::err, "row rejected",
                       {StringField("target", conf_.name), StringField("table", write.family == RowFamily::kLogLines ? "LogLines" : "Metrics"),
                        StringField("error", e.what())});
    RecordWriteError(e.what());
    return false;
  }
  conn_->Exec(db::sql::RELEASE_ROW);
  return true;
}

void DbTarget::RecordWriteError(const std::string& message) {
  if (!write_error_) write_error_ = message;
}

db::Result DbTarget::TakeWriteError() {
  if (!write_error_) return db::Result::Ok();
  auto result = db::Result::Err(db::ErrorCode::WriteFailed, *write_error_);
  write_error_.reset();
  return result;
}

db::Result DbTarget::CloseConnection() {
  try {
    conn_->Close();
  } catch (const std::exception& e) {
    observability::Log(*logger_, spdlog::level::err, "closing target connection failed",
                       {StringField("target", conf_.name), StringField("error", e.what())});
    return db::Result::Err(db::ErrorCode::CloseFailed, e.what());
  }
  return db::Result::Ok();
}

} // namespace dbtarget::target
