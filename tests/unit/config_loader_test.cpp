#include "internal/config/config_loader.hpp"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>

#include "internal/observability/logging.hpp"

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "jwlmerge_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool Rejects(const std::string& test_name, const std::string& yaml_content) {
  const auto yaml_path = WriteYaml(test_name, yaml_content);
  try {
    (void)jwlmerge::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(workspace:
  temp_root: "C:\\jwlmerge\\\"quoted\"\\tmp"
output:
  directory: "/srv/backups"
)");

  auto config = jwlmerge::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.workspace().temp_root() == "C:\\jwlmerge\\\"quoted\"\\tmp");
  assert(config.output().directory() == "/srv/backups");
}

void TestScalarEscapingForNewlineAndUnicode() {
  const auto yaml_path = WriteYaml("newline_unicode",
                                   R"(logging:
  pattern: "line1\nline2☃ %v"
)");

  auto config = jwlmerge::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().pattern() == std::string("line1\nline2☃ %v"));
}

void TestUnknownFieldsAreRejected() {
  bool threw = Rejects("unknown_field", R"(logging:
  level: debug
unknown_field: 123
)");

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestUnsetFieldsTakeDefaults() {
  const auto yaml_path = WriteYaml("partial",
                                   R"(archive:
  compression_level: 0
store:
  busy_timeout_ms: 250
)");

  auto config = jwlmerge::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.archive().compression_level() == 0);
  assert(config.archive().max_entry_bytes() == (1ull << 30));
  assert(config.store().busy_timeout_ms() == 250);
  assert(config.store().default_database_name() == "userData.db");
  assert(config.store().manifest_name() == "manifest.json");
  assert(config.logging().level() == "info");
  assert(config.output().directory() == ".");
  assert(config.workspace().temp_root().empty());
}

void TestEmptyFileIsAllDefaults() {
  auto config   = jwlmerge::config::ConfigLoader::LoadFromYaml(WriteYaml("empty", "").string());
  auto defaults = jwlmerge::config::ConfigLoader::Defaults();
  assert(config.SerializeAsString() == defaults.SerializeAsString());
  assert(defaults.archive().compression_level() == 6);
  assert(defaults.store().busy_timeout_ms() == 5000);
}

void TestOutOfRangeValuesAreRejected() {
  assert(Rejects("level_range", "archive:\n  compression_level: 12\n"));
  assert(Rejects("log_level", "logging:\n  level: chatty\n"));
  assert(Rejects("db_name", "store:\n  default_database_name: ../userData.db\n"));
  assert(Rejects("entry_limit", "archive:\n  max_entry_bytes: 0\n"));
}

void TestLogLevelResolution() {
  auto config = jwlmerge::config::ConfigLoader::Defaults();
  config.mutable_logging()->set_level("debug");

  unsetenv("JWLMERGE_LOG_LEVEL");
  unsetenv("JWLMERGE_ENVIRONMENT");
  assert(jwlmerge::observability::ResolveLogLevel(config) == "debug");

  setenv("JWLMERGE_ENVIRONMENT", "production", 1);
  assert(jwlmerge::observability::ResolveLogLevel(config) == "warn");

  setenv("JWLMERGE_LOG_LEVEL", "ERROR", 1);
  assert(jwlmerge::observability::ResolveLogLevel(config) == "error");

  unsetenv("JWLMERGE_LOG_LEVEL");
  unsetenv("JWLMERGE_ENVIRONMENT");
}

void TestFileLogLevelResolution() {
  auto config = jwlmerge::config::ConfigLoader::Defaults();
  assert(config.logging().file_directory() == "logs");
  assert(config.logging().file_level() == "debug");

  unsetenv("JWLMERGE_LOG_LEVEL");
  unsetenv("JWLMERGE_ENVIRONMENT");
  assert(jwlmerge::observability::FileLoggingEnabled(config));
  assert(jwlmerge::observability::ResolveFileLogLevel(config) == "debug");
  assert(jwlmerge::observability::ResolveLogLevel(config) == "info");

  setenv("JWLMERGE_ENVIRONMENT", "production", 1);
  assert(!jwlmerge::observability::FileLoggingEnabled(config));

  setenv("JWLMERGE_LOG_LEVEL", "debug", 1);
  assert(jwlmerge::observability::FileLoggingEnabled(config));
  assert(jwlmerge::observability::ResolveFileLogLevel(config) == "debug");

  unsetenv("JWLMERGE_LOG_LEVEL");
  unsetenv("JWLMERGE_ENVIRONMENT");

  config.mutable_logging()->set_file_level("off");
  assert(!jwlmerge::observability::FileLoggingEnabled(config));

  assert(Rejects("file_level", "logging:\n  file_level: loud\n"));
}

void TestDebugLinesReachLogFile() {
  unsetenv("JWLMERGE_LOG_LEVEL");
  unsetenv("JWLMERGE_ENVIRONMENT");

  const auto dir = std::filesystem::temp_directory_path() / "jwlmerge_config_loader_tests" / "logs";
  std::filesystem::remove_all(dir);

  auto config = jwlmerge::config::ConfigLoader::Defaults();
  config.mutable_logging()->set_level("warn");
  config.mutable_logging()->set_file_directory(dir.string());

  const auto log_file = jwlmerge::observability::InitializeLogging(config);
  assert(!log_file.empty());
  assert(log_file.parent_path() == dir);
  assert(log_file.filename().string().rfind("jwlmerge_", 0) == 0);
  assert(log_file.extension() == ".log");
  // console is at warn, but the file sink still asks for debug records
  assert(jwlmerge::observability::ShouldLog(spdlog::level::debug));

  JWLMERGE_LOG_DEBUG("Inserted row", {jwlmerge::observability::StringField("table", "Note"),
                                      jwlmerge::observability::IntField("new_id", 7)});
  jwlmerge::observability::ShutdownLogging();

  assert(std::filesystem::is_regular_file(log_file));
  std::ifstream     in(log_file);
  const std::string contents((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  assert(contents.find("[debug] Inserted row table=Note new_id=7") != std::string::npos);
  assert(contents.find("Logging initialized") != std::string::npos);

  std::filesystem::remove_all(dir);
}

} // namespace

int main() {
  TestScalarEscapingForQuotedAndBackslashValues();
  TestScalarEscapingForNewlineAndUnicode();
  TestUnknownFieldsAreRejected();
  TestUnsetFieldsTakeDefaults();
  TestEmptyFileIsAllDefaults();
  TestOutOfRangeValuesAreRejected();
  TestLogLevelResolution();
  TestFileLogLevelResolution();
  TestDebugLinesReachLogFile();

  std::cout << "jwlmerge_unit_config_loader: pass\n";
  return 0;
}
