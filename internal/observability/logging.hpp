#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace medsync::runtime::config {
class RuntimeConfig;
}

namespace medsync::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField UintField(std::string_view key, std::uint64_t value);
LogField BoolField(std::string_view key, bool value);

void InitializeLogging(const medsync::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

/*
  Owns the logging lifecycle for a process: sinks and the periodic flusher are
  created in the constructor and flushed/torn down in the destructor.
*/
class LoggingScope {
 public:
  explicit LoggingScope(const medsync::runtime::config::RuntimeConfig& config);
  ~LoggingScope();

  LoggingScope(const LoggingScope&)            = delete;
  LoggingScope& operator=(const LoggingScope&) = delete;
};

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

} // namespace medsync::observability

#define MEDSYNC_LOG_DEBUG(message, ...) ::medsync::observability::LogDebug((message), ##__VA_ARGS__)
#define MEDSYNC_LOG_INFO(message, ...) ::medsync::observability::LogInfo((message), ##__VA_ARGS__)
#define MEDSYNC_LOG_WARN(message, ...) ::medsync::observability::LogWarn((message), ##__VA_ARGS__)
#define MEDSYNC_LOG_ERROR(message, ...) ::medsync::observability::LogError((message), ##__VA_ARGS__)
