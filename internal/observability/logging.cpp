#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <sstream>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"
#include "internal/util/strings.hpp"

namespace pipeline::observability {
namespace {

constexpr const char* kLoggerName = "pipeline-manager";

constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

std::string FromEnvOr(const char* name, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(name); value && *value) {
    return value;
  }
  return configured.empty() ? fallback : configured;
}

spdlog::level::level_enum ResolveLevel(const pipeline::runtime::config::LoggingConfig& config) {
  const auto name  = util::ToLower(FromEnvOr("PIPELINE_LOG_LEVEL", config.level(), "info"));
  const auto level = spdlog::level::from_str(name);
  // from_str maps unknown names to off; a typo should not silence the store.
  if (level == spdlog::level::off && name != "off") {
    return spdlog::level::info;
  }
  return level;
}

std::string SerializeFields(std::initializer_list<LogField> fields) {
  std::ostringstream out;
  bool               first = true;
  for (const auto& field : fields) {
    if (!first) {
      out << ' ';
    }
    first = false;
    // Quote values with spaces so fields stay splittable.
    if (field.value.find(' ') != std::string::npos) {
      out << field.key << "=\"" << field.value << '"';
    } else {
      out << field.key << '=' << field.value;
    }
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

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

LogField PathField(std::string_view key, const std::filesystem::path& value) {
  return {std::string(key), value.string()};
}

LogField AmountField(std::string_view key, const std::optional<double>& value) {
  return {std::string(key), value ? util::FormatDecimal(*value) : std::string()};
}

void InitializeLogging(const pipeline::runtime::config::LoggingConfig& config) {
  auto logger = spdlog::get(kLoggerName);
  if (!logger) {
    logger = spdlog::stderr_color_mt(kLoggerName);
  }
  logger->set_pattern(FromEnvOr("PIPELINE_LOG_PATTERN", config.pattern(), kDefaultPattern));
  logger->set_level(ResolveLevel(config));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto serialized_fields = SerializeFields(fields);

  if (!serialized_fields.empty()) {
    spdlog::log(level, "{} {}", message, serialized_fields);
    return;
  }
  spdlog::log(level, "{}", message);
}

} // namespace pipeline::observability
