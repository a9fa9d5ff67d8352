#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace lotgate::runtime::config {
class RuntimeConfig;
}

namespace lotgate::observability {

// One key=value pair appended to a log line. Values containing spaces or
// quotes are rendered quoted.
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);
LogField DoubleField(std::string_view key, double value);

// Installs the "lotgate" logger as spdlog's default: colour stdout, plus a
// rotating file when logging.file is set. LOTGATE_LOG_LEVEL and
// LOTGATE_LOG_PATTERN override the config.
void InitializeLogging(const lotgate::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

std::string FormatFields(std::initializer_list<LogField> fields);

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogDebug(std::string_view message, std::initializer_list<LogField> fields = {}) { Log(spdlog::level::debug, message, fields); }
inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) { Log(spdlog::level::info, message, fields); }
inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) { Log(spdlog::level::warn, message, fields); }
inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) { Log(spdlog::level::err, message, fields); }

} // namespace lotgate::observability

#define LOTGATE_LOG_DEBUG(message, ...) ::lotgate::observability::LogDebug((message), ##__VA_ARGS__)
#define LOTGATE_LOG_INFO(message, ...) ::lotgate::observability::LogInfo((message), ##__VA_ARGS__)
#define LOTGATE_LOG_WARN(message, ...) ::lotgate::observability::LogWarn((message), ##__VA_ARGS__)
#define LOTGATE_LOG_ERROR(message, ...) ::lotgate::observability::LogError((message), ##__VA_ARGS__)
