#include "factory.hpp"

#include <stdexcept>
#include <string>
#include <utility>

#include "internal/config/config_loader.hpp"
#include "internal/db/connection_provider.hpp"
#include "internal/migrations/schema_migrations.hpp"

namespace dbtarget::factory {

namespace {

constexpr int kDefaultBusyTimeoutMs = 5000;

} // namespace

db::ConnectionFactory BuildConnectionFactory(const dbtarget::runtime::config::DatabaseConfig& database) {
  if (database.has_memory()) {
    const auto&            memory = database.memory();
    db::ConnectionProvider provider;
    if (memory.shared()) {
      return provider.Factory(db::ConnectionMode::kShared, memory.name());
    }
    return provider.Factory(db::ConnectionMode::kIsolated, memory.name());
  }

  if (database.has_sqlite()) {
    const auto&                     sqlite = database.sqlite();
    db::ConnectionProvider::Options options;
    options.wal             = sqlite.wal_mode();
    options.busy_timeout_ms = sqlite.busy_timeout_ms() > 0 ? static_cast<int>(sqlite.busy_timeout_ms()) : kDefaultBusyTimeoutMs;
    return db::ConnectionProvider(options).Factory(db::ConnectionMode::kFile, sqlite.path());
  }

  throw std::invalid_argument("database backend not configured (expected memory or sqlite)");
}

std::unique_ptr<target::DbTarget> BuildTarget(const dbtarget::runtime::config::RuntimeConfig& config,
                                              std::shared_ptr<spdlog::logger>               diagnostics) {
  target::DbTargetConf conf;
  conf.name               = config.target().name().empty() ? dbtarget::config::ConfigLoader::kDefaultTargetName : config.target().name();
  conf.max_batch_size     = config.target().max_batch_size() > 0 ? config.target().max_batch_size() : dbtarget::config::ConfigLoader::kDefaultMaxBatchSize;
  conf.include_read_index = config.migrations().include_read_index();
  conf.connect            = BuildConnectionFactory(config.database());
  conf.diagnostics        = diagnostics;
  conf.runner             = std::make_shared<migrations::MigrationRunner>(migrations::MakeSchemaRunner(std::move(diagnostics)));

  return std::make_unique<target::DbTarget>(std::move(conf));
}

} // namespace dbtarget::factory
