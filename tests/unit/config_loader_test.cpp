#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"

namespace {

std::filesystem::path WriteFile(const std::string& file_name, const std::string& content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "aiknowsys_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / file_name;
  std::ofstream out(file_path);
  out << content;
  out.close();

  return file_path;
}

void TestDefaultsFillUnsetFields() {
  const auto yaml_path = WriteFile("partial.yaml",
                                   R"(logging:
  level: debug
storage:
  adapter: sqlite
)");

  auto config = aiknowsys::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "debug");
  assert(config.storage().adapter() == "sqlite");
  assert(config.storage().rebuild() == "if_stale");
  assert(config.patterns().min_frequency() == 3);
  assert(config.patterns().window_days() == 30);
  assert(config.patterns().similarity_threshold() == 0.4);
  assert(config.tracing().service_name() == "aiknowsys");
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteFile("quoted_backslash.yaml",
                                   R"(logging:
  pattern: "C:\\logs\\\"quoted\"\\%v"
patterns:
  similarity_threshold: 0.5
  min_frequency: 2
tracing:
  enabled: true
  endpoint: "localhost:4317"
)");

  auto config = aiknowsys::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().pattern() == "C:\\logs\\\"quoted\"\\%v");
  assert(config.patterns().similarity_threshold() == 0.5);
  assert(config.patterns().min_frequency() == 2);
  assert(config.tracing().enabled());
  assert(config.tracing().endpoint() == "localhost:4317");
}

void TestQuotedNumbersStayStrings() {
  const auto yaml_path = WriteFile("quoted_number.yaml",
                                   R"(tracing:
  service_name: "1234"
)");

  auto config = aiknowsys::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.tracing().service_name() == "1234");
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteFile("unknown_field.yaml",
                                   R"(logging:
  level: info
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)aiknowsys::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileThrows() {
  bool threw = false;
  try {
    (void)aiknowsys::config::ConfigLoader::LoadFromYaml("/nonexistent/aiknowsys.yaml");
  } catch (const aiknowsys::util::ValidationError& e) {
    threw = std::string(e.what()).find("/nonexistent/aiknowsys.yaml") != std::string::npos;
  }
  assert(threw);
}

void TestProjectConfig() {
  const auto good = WriteFile("good.config", R"({"databasePath": "db/kb.db", "projectId": "Acme/Widget", "extra": 1})");
  auto       config = aiknowsys::config::ConfigLoader::LoadProjectConfig(good);
  assert(config.has_value());
  assert(config->database_path() == "db/kb.db");
  assert(config->project_id() == "Acme/Widget");

  const auto bad = WriteFile("bad.config", "{ not json");
  assert(!aiknowsys::config::ConfigLoader::LoadProjectConfig(bad).has_value());
  assert(!aiknowsys::config::ConfigLoader::LoadProjectConfig("/nonexistent/.aiknowsys.config").has_value());
}

} // namespace

int main() {
  TestDefaultsFillUnsetFields();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestQuotedNumbersStayStrings();
  TestUnknownFieldsAreRejected();
  TestMissingFileThrows();
  TestProjectConfig();

  std::cout << "aiknowsys_unit_config_loader: pass\n";
  return 0;
}
