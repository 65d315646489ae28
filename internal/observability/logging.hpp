#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace osforge::runtime::config {
class RuntimeConfig;
}

namespace osforge::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);

void InitializeLogging(const osforge::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

// Mirrors one build log line into the process log.
void LogBuildLine(std::string_view build_id, std::string_view line);

} // namespace osforge::observability

#define OSFORGE_LOG_INFO(message, ...) ::osforge::observability::LogInfo((message), ##__VA_ARGS__)
#define OSFORGE_LOG_WARN(message, ...) ::osforge::observability::LogWarn((message), ##__VA_ARGS__)
#define OSFORGE_LOG_ERROR(message, ...) ::osforge::observability::LogError((message), ##__VA_ARGS__)
