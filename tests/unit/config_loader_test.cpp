#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "roster_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestSqliteBackendWithEscapedPath() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(logging:
  level: debug
database:
  sqlite:
    path: "C:\\roster\\\"quoted\"\\db.sqlite"
    wal_mode: true
addressing:
  program_namespace: "roster.test"
)");

  auto config = roster::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "C:\\roster\\\"quoted\"\\db.sqlite");
  assert(config.database().sqlite().wal_mode());
  assert(config.logging().level() == "debug");
  assert(config.addressing().program_namespace() == "roster.test");
}

void TestEmptyMemoryBlockSelectsMemoryBackend() {
  const auto yaml_path = WriteYaml("memory_backend",
                                   R"(database:
  memory:
)");

  auto config = roster::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().has_memory());
  assert(!config.database().has_sqlite());
}

void TestNamespaceDefaultsWhenOmitted() {
  const auto yaml_path = WriteYaml("namespace_default",
                                   R"(logging:
  level: info
)");

  auto config = roster::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.addressing().program_namespace() == "roster.v1");
}

void TestQuotedNumericStaysString() {
  const auto yaml_path = WriteYaml("quoted_numeric",
                                   R"(addressing:
  program_namespace: "12345"
)");

  auto config = roster::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.addressing().program_namespace() == "12345");
}

void TestSqliteWithoutPathIsRejected() {
  const auto yaml_path = WriteYaml("sqlite_no_path",
                                   R"(database:
  sqlite:
    wal_mode: false
)");

  bool threw = false;
  try {
    (void)roster::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw && "ConfigLoader must require a sqlite path.");
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(database:
  memory:
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)roster::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)roster::config::ConfigLoader::LoadFromYaml("/nonexistent/roster.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestSqliteBackendWithEscapedPath();
  TestEmptyMemoryBlockSelectsMemoryBackend();
  TestNamespaceDefaultsWhenOmitted();
  TestQuotedNumericStaysString();
  TestSqliteWithoutPathIsRejected();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsReported();

  std::cout << "roster_unit_config_loader: pass\n";
  return 0;
}
