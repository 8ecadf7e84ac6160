#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <filesystem>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>

namespace pipeline::runtime::config {
class LoggingConfig;
}

namespace pipeline::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);
LogField PathField(std::string_view key, const std::filesystem::path& value);
// Empty value when absent; otherwise the shortest decimal form.
LogField AmountField(std::string_view key, const std::optional<double>& value);

/*
  Installs the "pipeline-manager" logger as the spdlog default.
  PIPELINE_LOG_LEVEL and PIPELINE_LOG_PATTERN override the config.
  Safe to call again; the existing logger is reconfigured.
*/
void InitializeLogging(const pipeline::runtime::config::LoggingConfig& config);
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

} // namespace pipeline::observability

#define PIPELINE_LOG_DEBUG(message, ...) ::pipeline::observability::LogDebug((message), ##__VA_ARGS__)
#define PIPELINE_LOG_INFO(message, ...) ::pipeline::observability::LogInfo((message), ##__VA_ARGS__)
#define PIPELINE_LOG_WARN(message, ...) ::pipeline::observability::LogWarn((message), ##__VA_ARGS__)
#define PIPELINE_LOG_ERROR(message, ...) ::pipeline::observability::LogError((message), ##__VA_ARGS__)
