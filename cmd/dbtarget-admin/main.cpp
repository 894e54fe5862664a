#include <cstdint>
#include <iostream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/db/connection_provider.hpp"
#include "internal/factory.hpp"
#include "internal/migrations/schema_migrations.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

using dbtarget::observability::IntField;
using dbtarget::observability::StringField;

static void Usage() {
  std::cout << "Usage:\n"
            << "  dbtarget-admin <config.yaml> migrate-up [--index]\n"
            << "  dbtarget-admin <config.yaml> migrate-down [--index]\n"
            << "  dbtarget-admin <config.yaml> status\n";
}

static void PrintHistory(const dbtarget::migrations::MigrationRunner& runner, const dbtarget::db::ConnectionFactory& factory) {
  auto history = runner.History(factory);
  if (history.empty()) {
    std::cout << "no migrations applied\n";
    return;
  }
  for (const auto& entry : history) {
    std::cout << entry.ns << "\t" << entry.step_id << "\t" << dbtarget::util::ToUnixMillis(entry.applied_at) << "\t" << entry.description << "\n";
  }
}

int main(int argc, char** argv) {
  if (argc < 3 || argc > 4) {
    Usage();
    return 1;
  }

  std::string config_path = argv[1];
  std::string cmd         = argv[2];
  bool        with_index  = false;
  if (argc == 4) {
    if (std::string(argv[3]) != "--index") {
      Usage();
      return 1;
    }
    with_index = true;
  }

  try {
    auto config = dbtarget::config::ConfigLoader::LoadFromYaml(config_path);
    dbtarget::observability::InitializeLogging(config);

    // one physical connection for the whole run so in-memory stores survive
    auto conn    = dbtarget::factory::BuildConnectionFactory(config.database())();
    auto factory = dbtarget::db::ConnectionProvider::Pinned(conn);
    auto runner  = dbtarget::migrations::MakeSchemaRunner();

    int rc = 0;
    if (cmd == "migrate-up") {
      auto applied = runner.MigrateUp(factory, with_index || config.migrations().include_read_index());
      DBTARGET_LOG_INFO("migrate-up finished", {IntField("applied", static_cast<std::int64_t>(applied))});
      PrintHistory(runner, factory);
    } else if (cmd == "migrate-down") {
      auto reverted = runner.MigrateDown(factory, with_index);
      DBTARGET_LOG_INFO("migrate-down finished", {IntField("reverted", static_cast<std::int64_t>(reverted))});
      PrintHistory(runner, factory);
    } else if (cmd == "status") {
      PrintHistory(runner, factory);
    } else {
      Usage();
      rc = 1;
    }

    conn->Close();
    dbtarget::observability::ShutdownLogging();
    return rc;
  } catch (const std::exception& e) {
    DBTARGET_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    dbtarget::observability::ShutdownLogging();
    return 2;
  }
}
