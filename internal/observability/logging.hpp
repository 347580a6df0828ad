#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace eafkit::runtime::config {
class RuntimeConfig;
}

namespace eafkit::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

enum class LogSink {
  Stdout,
  Stderr,
};

/*
  Installs the process wide "eafkit" logger.

  Level and pattern: EAFKIT_LOG_LEVEL / EAFKIT_LOG_PATTERN, then config,
  then built-in defaults. Without a call, spdlog's default logger is used.
*/
void InitializeLogging(const eafkit::runtime::config::RuntimeConfig& config, LogSink sink = LogSink::Stdout);
void ShutdownLogging();

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

} // namespace eafkit::observability

#define EAFKIT_LOG_DEBUG(message, ...) ::eafkit::observability::LogDebug((message), ##__VA_ARGS__)
#define EAFKIT_LOG_INFO(message, ...) ::eafkit::observability::LogInfo((message), ##__VA_ARGS__)
#define EAFKIT_LOG_WARN(message, ...) ::eafkit::observability::LogWarn((message), ##__VA_ARGS__)
#define EAFKIT_LOG_ERROR(message, ...) ::eafkit::observability::LogError((message), ##__VA_ARGS__)
