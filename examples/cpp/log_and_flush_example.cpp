#include <cstdint>
#include <iostream>
#include <string>

#include "internal/codec/row_codec.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/db/connection_provider.hpp"
#include "internal/db/sql/sql_queries.hpp"
#include "internal/factory.hpp"
#include "internal/model/log_record.hpp"
#include "internal/model/metric_record.hpp"
#include "internal/observability/logging.hpp"

namespace {

constexpr const char* kConfig = R"(
logging:
  level: info
database:
  memory:
    name: example-store
    shared: true
migrations:
  include_read_index: true
target:
  name: example
  max_batch_size: 64
)";

} // namespace

int main() {
  auto config = dbtarget::config::ConfigLoader::ParseYaml(kConfig);
  dbtarget::observability::InitializeLogging(config);

  // A second handle on the shared store keeps it alive after the target
  // closes and lets us read back what was written.
  dbtarget::db::ConnectionProvider provider;
  auto reader = provider.Open(dbtarget::db::ConnectionMode::kShared, config.database().memory().name());

  auto target = dbtarget::factory::BuildTarget(config);
  try {
    target->Start();
  } catch (const std::exception& e) {
    std::cerr << "Start failed: " << e.what() << '\n';
    return 1;
  }

  auto line = dbtarget::model::LogLine("hello world");
  line.path = "example.main";
  line.tags = {{"user", "haf"}};
  target->SubmitLog(line);

  target->SubmitMetric(dbtarget::model::CounterValue("app.signin", 3.0));
  target->SubmitMetric(dbtarget::model::GaugeValue("app.sessions", 42.0));

  auto flushed = target->Flush();
  if (!flushed) {
    std::cerr << "Flush failed: " << flushed.message << '\n';
    return 1;
  }

  for (const auto& row : reader->Query(dbtarget::db::sql::SELECT_LOG_LINES)) {
    auto record = dbtarget::codec::DecodeLog(row);
    std::cout << "log    " << record.host << " " << record.path << " [" << dbtarget::model::ToString(record.level) << "] " << record.message
              << '\n';
  }
  for (const auto& row : reader->Query(dbtarget::db::sql::SELECT_METRICS)) {
    auto record = dbtarget::codec::DecodeMetric(row);
    std::cout << "metric " << record.host << " " << record.path << " " << dbtarget::model::ToString(record.kind) << " = " << record.value
              << '\n';
  }

  auto closed = target->Shutdown();
  reader->Close();
  dbtarget::observability::ShutdownLogging();
  if (!closed) {
    std::cerr << "Shutdown failed: " << closed.message << '\n';
    return 1;
  }
  return 0;
}
