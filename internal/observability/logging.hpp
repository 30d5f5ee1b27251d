#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace entitlement::runtime::config {
class RuntimeConfig;
}

namespace entitlement::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// Activation codes are bearer secrets: logs carry their length and last
// four characters only.
LogField RedactedField(std::string_view key, std::string_view secret);

// Throws util::InvalidConfig for an unknown level name.
spdlog::level::level_enum ParseLevel(std::string_view name);

// Installs the process logger; calling it again replaces the previous one.
void InitializeLogging(const entitlement::runtime::config::RuntimeConfig& config);
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

} // namespace entitlement::observability

#define ENTITLEMENT_LOG_DEBUG(message, ...) ::entitlement::observability::LogDebug((message), ##__VA_ARGS__)
#define ENTITLEMENT_LOG_INFO(message, ...) ::entitlement::observability::LogInfo((message), ##__VA_ARGS__)
#define ENTITLEMENT_LOG_WARN(message, ...) ::entitlement::observability::LogWarn((message), ##__VA_ARGS__)
#define ENTITLEMENT_LOG_ERROR(message, ...) ::entitlement::observability::LogError((message), ##__VA_ARGS__)
