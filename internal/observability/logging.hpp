#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace relcache::runtime::config {
class RuntimeConfig;
}

namespace relcache::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// use_stderr keeps stdout free for command output (relcachectl).
void InitializeLogging(const relcache::runtime::config::RuntimeConfig& config, bool use_stderr = false);
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

} // namespace relcache::observability

#define RELCACHE_LOG_DEBUG(message, ...) ::relcache::observability::LogDebug((message), ##__VA_ARGS__)
#define RELCACHE_LOG_INFO(message, ...) ::relcache::observability::LogInfo((message), ##__VA_ARGS__)
#define RELCACHE_LOG_WARN(message, ...) ::relcache::observability::LogWarn((message), ##__VA_ARGS__)
#define RELCACHE_LOG_ERROR(message, ...) ::relcache::observability::LogError((message), ##__VA_ARGS__)
