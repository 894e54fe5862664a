#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/factory.hpp"

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "dbtarget_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(database:
  sqlite:
    path: "C:\\logs\\\"quoted\"\\target.sqlite"
    wal_mode: true
)");

  auto config = dbtarget::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\logs\\\"quoted\"\\target.sqlite");
  assert(config.database().sqlite().wal_mode());
}

void TestQuotedNumbersStayStrings() {
  auto config = dbtarget::config::ConfigLoader::ParseYaml(R"(database:
  memory:
    name: "5000"
    shared: true
target:
  name: "line1\nline2☃"
)");

  assert(config.database().memory().name() == "5000");
  assert(config.database().memory().shared());
  assert(config.target().name() == std::string("line1\nline2☃"));
}

void TestDefaultsAreApplied() {
  auto config = dbtarget::config::ConfigLoader::ParseYaml(R"(database:
  memory:
    name: defaults
)");

  assert(config.target().name() == dbtarget::config::ConfigLoader::kDefaultTargetName);
  assert(config.target().max_batch_size() == dbtarget::config::ConfigLoader::kDefaultMaxBatchSize);
  assert(!config.migrations().include_read_index());
  assert(!config.database().memory().shared());
}

void TestFullConfig() {
  auto config = dbtarget::config::ConfigLoader::ParseYaml(R"(logging:
  level: debug
  pattern: "%v"
database:
  sqlite:
    path: /var/lib/dbtarget/logs.sqlite
    wal_mode: true
    busy_timeout_ms: 250
migrations:
  include_read_index: true
target:
  name: web01
  max_batch_size: 32
)");

  assert(config.logging().level() == "debug");
  assert(config.logging().pattern() == "%v");
  assert(config.database().sqlite().busy_timeout_ms() == 250);
  assert(config.migrations().include_read_index());
  assert(config.target().name() == "web01");
  assert(config.target().max_batch_size() == 32);
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(unknown_field: 123
database:
  sqlite:
    path: "/tmp/data"
)");

  bool threw = false;
  try {
    (void)dbtarget::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingDatabaseIsRejected() {
  bool threw = false;
  try {
    (void)dbtarget::config::ConfigLoader::ParseYaml(R"(target:
  name: nowhere
)");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw && "a database backend is required");

  threw = false;
  try {
    (void)dbtarget::config::ConfigLoader::ParseYaml(R"(database:
  sqlite:
    wal_mode: true
)");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw && "sqlite needs a path");
}

void TestConnectionFactoryFollowsMemoryConfig() {
  auto config = dbtarget::config::ConfigLoader::ParseYaml(R"(database:
  memory:
    name: config-shared
    shared: true
)");

  auto factory = dbtarget::factory::BuildConnectionFactory(config.database());
  auto first   = factory();
  auto second  = factory();

  first->Exec("CREATE TABLE Probe (Id INTEGER);");
  auto rows = second->Query("SELECT name FROM sqlite_master WHERE name = 'Probe';");
  assert(rows.size() == 1);

  second->Close();
  first->Close();
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)dbtarget::config::ConfigLoader::LoadFromYaml("/nonexistent/dbtarget.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestScalarEscapingForQuotedAndBackslashValues();
  TestQuotedNumbersStayStrings();
  TestDefaultsAreApplied();
  TestFullConfig();
  TestUnknownFieldsAreRejected();
  TestMissingDatabaseIsRejected();
  TestConnectionFactoryFollowsMemoryConfig();
  TestMissingFileIsReported();

  std::cout << "dbtarget_unit_config_loader: pass\n";
  return 0;
}
