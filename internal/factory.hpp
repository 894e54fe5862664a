#pragma once

#include <memory>

#include <spdlog/logger.h>

#include "config/config.pb.h"

#include "internal/db/api/connection.hpp"
#include "internal/target/db_target.hpp"

namespace dbtarget::factory {

/*
  Composition root.

  The ONLY place that maps configuration onto concrete connection modes.
  Everything above it deals in db::ConnectionFactory and DbTarget.
*/

// memory.shared -> named shared store, memory -> isolated store, sqlite -> file.
// Throws std::invalid_argument when no backend is configured.
db::ConnectionFactory BuildConnectionFactory(const dbtarget::runtime::config::DatabaseConfig& database);

// Unstarted target wired from config; the caller runs Start().
std::unique_ptr<target::DbTarget> BuildTarget(const dbtarget::runtime::config::RuntimeConfig& config,
                                              std::shared_ptr<spdlog::logger>               diagnostics = nullptr);

} // namespace dbtarget::factory
