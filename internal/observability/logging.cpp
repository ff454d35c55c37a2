#include "internal/observability/logging.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"
#include "internal/util/time.hpp"

namespace jwlmerge::observability {
namespace {

constexpr const char* kLoggerName = "jwlmerge";

std::string Lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

bool IsProduction() {
  const char* environment = std::getenv("JWLMERGE_ENVIRONMENT");
  return environment != nullptr && Lower(environment) == "production";
}

std::string ExplicitLevel() {
  const char* level = std::getenv("JWLMERGE_LOG_LEVEL");
  return level != nullptr ? Lower(level) : std::string();
}

std::string ResolvePattern(const jwlmerge::runtime::config::RuntimeConfig& config) {
  if (const char* pattern = std::getenv("JWLMERGE_LOG_PATTERN")) {
    return pattern;
  }

  if (!config.logging().pattern().empty()) {
    return config.logging().pattern();
  }

  return "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";
}

std::string SerializeFields(std::initializer_list<LogField> fields) {
  std::ostringstream out;
  bool first = true;
  for (const auto& field : fields) {
    if (!first) {
      out << ' ';
    }
    first = false;
    out << field.key << '=' << field.value;
  }
  return out.str();
}

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

std::string ResolveLogLevel(const jwlmerge::runtime::config::RuntimeConfig& config) {
  if (const auto level = ExplicitLevel(); !level.empty()) {
    return level;
  }

  // production keeps the console quiet unless a level is asked for explicitly
  if (IsProduction()) {
    return "warn";
  }

  if (!config.logging().level().empty()) {
    return Lower(config.logging().level());
  }

  return "info";
}

std::string ResolveFileLogLevel(const jwlmerge::runtime::config::RuntimeConfig& config) {
  if (const auto level = ExplicitLevel(); !level.empty()) {
    return level;
  }

  if (IsProduction()) {
    return "info";
  }

  if (!config.logging().file_level().empty()) {
    return Lower(config.logging().file_level());
  }

  return "debug";
}

bool FileLoggingEnabled(const jwlmerge::runtime::config::RuntimeConfig& config) {
  if (config.logging().file_directory().empty() || ResolveFileLogLevel(config) == "off") {
    return false;
  }
  return !IsProduction() || ExplicitLevel() == "debug";
}

std::filesystem::path InitializeLogging(const jwlmerge::runtime::config::RuntimeConfig& config) {
  const auto pattern            = ResolvePattern(config);
  const auto console_level_name = ResolveLogLevel(config);
  const auto console_level      = spdlog::level::from_str(console_level_name);

  auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  console->set_level(console_level);

  std::vector<spdlog::sink_ptr> sinks{console};
  auto                          logger_level = console_level;

  std::filesystem::path log_file;
  const auto            file_level_name = ResolveFileLogLevel(config);
  if (FileLoggingEnabled(config)) {
    const std::filesystem::path directory = config.logging().file_directory();
    std::error_code             ec;
    std::filesystem::create_directories(directory, ec);
    if (ec) {
      throw std::runtime_error("cannot create log directory " + directory.string() + ": " + ec.message());
    }
    log_file = directory / ("jwlmerge_" + util::CompactLocalStamp(util::Now()) + ".log");

    std::shared_ptr<spdlog::sinks::basic_file_sink_mt> file;
    try {
      file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file.string());
    } catch (const spdlog::spdlog_ex& e) {
      throw std::runtime_error("cannot open log file " + log_file.string() + ": " + e.what());
    }
    const auto file_level = spdlog::level::from_str(file_level_name);
    file->set_level(file_level);
    sinks.push_back(file);
    logger_level = std::min(logger_level, file_level);
  }

  // rebuilt on every call so a later config can add or drop the file sink
  spdlog::drop(kLoggerName);
  auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
  logger->set_pattern(pattern);
  logger->set_level(logger_level);
  spdlog::register_logger(logger);
  spdlog::set_default_logger(logger);
  spdlog::flush_on(spdlog::level::warn);

  JWLMERGE_LOG_INFO("Logging initialized", {StringField("console_level", console_level_name),
                                            StringField("file_level", log_file.empty() ? "none" : file_level_name),
                                            StringField("file", log_file.empty() ? "none" : log_file.string())});
  return log_file;
}

void ShutdownLogging() {
  spdlog::shutdown();
}

bool ShouldLog(spdlog::level::level_enum level) {
  auto logger = spdlog::default_logger_raw();
  return logger != nullptr && logger->should_log(level);
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto serialized_fields = SerializeFields(fields);

  if (!serialized_fields.empty()) {
    spdlog::log(level, "{} {}", message, serialized_fields);
    return;
  }
  spdlog::log(level, "{}", message);
}

} // namespace jwlmerge::observability
