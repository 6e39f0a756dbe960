#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

namespace rc = progress::runtime::config;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "progress_engine_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool Rejected(const std::string& yaml) {
  try {
    (void)progress::config::ConfigLoader::LoadFromYamlString(yaml);
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(server:
  bind_address: "0.0.0.0:50061"
database:
  sqlite:
    path: "C:\\progress\\\"quoted\"\\db.sqlite"
    wal_mode: true
)");

  auto config = progress::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\progress\\\"quoted\"\\db.sqlite");
  assert(config.database().sqlite().wal_mode());
}

void TestScalarEscapingForNewlineAndUnicode() {
  const auto yaml_path = WriteYaml("newline_unicode",
                                   R"(server:
  bind_address: "line1\nline2☃"
database:
  memory: {}
)");

  auto config = progress::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == std::string("line1\nline2☃"));
  assert(config.database().has_memory());
}

void TestUnknownFieldsAreRejected() {
  bool threw = Rejected(R"(server:
  bind_address: "0.0.0.0:50061"
unknown_field: 123
database:
  memory: {}
)");
  assert(threw && "ConfigLoader must reject unknown fields.");

  threw = Rejected(R"(engine:
  weight_tolerence: 0.5
)");
  assert(threw && "misspelled engine keys must not be ignored");
}

void TestDefaultsAreApplied() {
  auto config = progress::config::ConfigLoader::LoadFromYamlString(R"(database:
  memory: {}
)");
  assert(config.server().bind_address() == "0.0.0.0:50061");
  assert(config.engine().weight_tolerance() == 0.01);
  assert(config.engine().reconciliation_tolerance_hours() == 0.01);
  assert(config.engine().rollup_refresh() == rc::ROLLUP_REFRESH_EAGER);
  assert(!config.engine().seed_default_templates());
  assert(config.engine().max_clock_skew_ms() == 300000);
}

void TestEngineSettingsAreParsed() {
  auto config = progress::config::ConfigLoader::LoadFromYamlString(R"(engine:
  weight_tolerance: 0.05
  rollup_refresh: ROLLUP_REFRESH_ON_READ
  seed_default_templates: true
  max_clock_skew_ms: 60000
database:
  postgres:
    connection_uri: "postgresql://progress@localhost/progress"
    max_connections: 4
)");
  assert(config.engine().weight_tolerance() == 0.05);
  assert(config.engine().rollup_refresh() == rc::ROLLUP_REFRESH_ON_READ);
  assert(config.engine().seed_default_templates());
  assert(config.engine().max_clock_skew_ms() == 60000);
  assert(config.database().postgres().max_connections() == 4);
}

void TestInvalidSettingsAreRejected() {
  assert(Rejected(R"(database:
  sqlite:
    wal_mode: true
)") && "sqlite needs a path");

  assert(Rejected(R"(database:
  postgres:
    max_connections: 2
)") && "postgres needs a connection uri");

  assert(Rejected(R"(engine:
  weight_tolerance: 1.5
)") && "a tolerance of a whole percent point or more is not a tolerance");

  assert(Rejected(R"(engine:
  rollup_refresh: SOMETIMES
)"));
}

} // namespace

int main() {
  TestScalarEscapingForQuotedAndBackslashValues();
  TestScalarEscapingForNewlineAndUnicode();
  TestUnknownFieldsAreRejected();
  TestDefaultsAreApplied();
  TestEngineSettingsAreParsed();
  TestInvalidSettingsAreRejected();

  std::cout << "progress_engine_unit_config_loader: pass\n";
  return 0;
}
