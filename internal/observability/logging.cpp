#include "internal/observability/logging.hpp"

#include <chrono>
#include <cstdlib>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

namespace medsync::observability {
namespace {

constexpr std::size_t kLogFileMaxBytes = 16 * 1024 * 1024;
constexpr std::size_t kLogFileCount    = 3;

std::string ResolveLevel(const medsync::runtime::config::RuntimeConfig& config) {
  if (const char* level = std::getenv("MEDSYNC_LOG_LEVEL")) {
    return level;
  }

  if (!config.logging().level().empty()) {
    return config.logging().level();
  }

  return "info";
}

std::string ResolvePattern(const medsync::runtime::config::RuntimeConfig& config) {
  if (const char* pattern = std::getenv("MEDSYNC_LOG_PATTERN")) {
    return pattern;
  }

  if (!config.logging().pattern().empty()) {
    return config.logging().pattern();
  }

  return "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] [%t] %v";
}

// spdlog's periodic flusher ticks in whole seconds
std::chrono::seconds ResolveFlushInterval(const medsync::runtime::config::RuntimeConfig& config) {
  const auto ms = config.logging().flush_interval_ms();
  if (ms == 0) {
    return std::chrono::seconds(2);
  }
  return std::chrono::seconds(ms < 1000 ? 1 : ms / 1000);
}

std::string SerializeFields(std::initializer_list<LogField> fields) {
  std::ostringstream out;
  bool               first = true;
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

LogField UintField(std::string_view key, std::uint64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

void InitializeLogging(const medsync::runtime::config::RuntimeConfig& config) {
  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
  if (!config.logging().file().empty()) {
    sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(config.logging().file(), kLogFileMaxBytes, kLogFileCount));
  }

  auto logger = std::make_shared<spdlog::logger>("medsync", sinks.begin(), sinks.end());
  logger->set_pattern(ResolvePattern(config));
  logger->set_level(spdlog::level::from_str(ResolveLevel(config)));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
  spdlog::flush_every(ResolveFlushInterval(config));
}

void ShutdownLogging() {
  spdlog::shutdown();
}

LoggingScope::LoggingScope(const medsync::runtime::config::RuntimeConfig& config) {
  InitializeLogging(config);
}

LoggingScope::~LoggingScope() {
  if (auto logger = spdlog::default_logger()) {
    logger->flush();
  }
  ShutdownLogging();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto serialized_fields = SerializeFields(fields);

  if (!serialized_fields.empty()) {
    spdlog::log(level, "{} {}", message, serialized_fields);
    return;
  }
  spdlog::log(level, "{}", message);
}

} // namespace medsync::observability
