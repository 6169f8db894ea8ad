#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace komorebi::runtime::config {
class RuntimeConfig;
}

namespace komorebi::observability {

// Values are escaped when logged; raw row and family bytes are safe to pass.
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// Installs the "komorebi" logger on stderr. Safe to call more than once.
void InitializeLogging(const komorebi::runtime::config::RuntimeConfig& config);
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

} // namespace komorebi::observability

#define KOMOREBI_LOG_DEBUG(message, ...) ::komorebi::observability::LogDebug((message), ##__VA_ARGS__)
#define KOMOREBI_LOG_INFO(message, ...) ::komorebi::observability::LogInfo((message), ##__VA_ARGS__)
#define KOMOREBI_LOG_WARN(message, ...) ::komorebi::observability::LogWarn((message), ##__VA_ARGS__)
#define KOMOREBI_LOG_ERROR(message, ...) ::komorebi::observability::LogError((message), ##__VA_ARGS__)
