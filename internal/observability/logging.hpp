#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <filesystem>
#include <initializer_list>
#include <string>
#include <string_view>

namespace jwlmerge::runtime::config {
class RuntimeConfig;
}

namespace jwlmerge::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

/*
  Console sink always; a per-run file sink under logging.file_directory
  outside production (or in production with JWLMERGE_LOG_LEVEL=debug).
  The two sinks filter at their own levels.

  Safe to call more than once; later calls replace the logger.
  Returns the log file path, empty when no file is written.
*/
std::filesystem::path InitializeLogging(const jwlmerge::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

// Levels the config and environment resolve to (exposed for tests).
std::string ResolveLogLevel(const jwlmerge::runtime::config::RuntimeConfig& config);
std::string ResolveFileLogLevel(const jwlmerge::runtime::config::RuntimeConfig& config);
bool        FileLoggingEnabled(const jwlmerge::runtime::config::RuntimeConfig& config);

bool ShouldLog(spdlog::level::level_enum level);

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogDebug(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::debug, message, fields);
}

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace jwlmerge::observability

// Debug fields are often built from whole rows; skip building them unless debug is on.
#define JWLMERGE_LOG_DEBUG(message, ...)                                          \
  do {                                                                            \
    if (::jwlmerge::observability::ShouldLog(spdlog::level::debug)) {             \
      ::jwlmerge::observability::LogDebug((message), ##__VA_ARGS__);              \
    }                                                                             \
  } while (0)
#define JWLMERGE_LOG_INFO(message, ...) ::jwlmerge::observability::LogInfo((message), ##__VA_ARGS__)
#define JWLMERGE_LOG_WARN(message, ...) ::jwlmerge::observability::LogWarn((message), ##__VA_ARGS__)
#define JWLMERGE_LOG_ERROR(message, ...) ::jwlmerge::observability::LogError((message), ##__VA_ARGS__)
