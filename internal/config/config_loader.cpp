#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cstdlib>
#include <stdexcept>

#include "internal/db/workbook/layout_codec.hpp"
#include "internal/db/workbook/workbook_schema.hpp"
#include "internal/util/time.hpp"

namespace pipeline::config {

using pipeline::runtime::config::ContextConfig;
using pipeline::runtime::config::RuntimeConfig;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars ("1.2") stay strings
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

static RuntimeConfig ParseYaml(const YAML::Node& yaml) {
  RuntimeConfig config;

  // An empty document is an all-defaults config.
  if (yaml.IsNull()) {
    ConfigLoader::ApplyDefaults(config);
    ConfigLoader::Validate(config);
    return config;
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields         = false;
  options.case_insensitive_enum_parsing = true;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ConfigLoader::ApplyDefaults(config);
  ConfigLoader::Validate(config);
  return config;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return ParseYaml(yaml);
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return ParseYaml(yaml);
}

// ------------------------------------------------------------
// Defaults / validation
// ------------------------------------------------------------

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  auto* logging = config.mutable_logging();
  if (logging->level().empty()) logging->set_level("info");

  auto* store = config.mutable_store();
  if (store->backend_case() == pipeline::runtime::config::StoreConfig::BACKEND_NOT_SET) {
    store->mutable_memory();
  }

  if (store->has_workbook()) {
    auto*                            workbook = store->mutable_workbook();
    const db::workbook::SchemaPolicy policy;

    if (!workbook->has_max_backups()) workbook->set_max_backups(5);
    if (!workbook->has_fsync()) workbook->set_fsync(true);
    if (workbook->current_schema_version().empty()) workbook->set_current_schema_version(policy.current_version);
    if (workbook->supported_schema_versions().empty()) {
      for (const auto& version : policy.supported_versions) {
        workbook->add_supported_schema_versions(version);
      }
    }

    auto* lock = workbook->mutable_lock();
    if (!lock->has_max_attempts()) lock->set_max_attempts(10);
    if (!lock->has_initial_backoff_ms()) lock->set_initial_backoff_ms(100);
    if (!lock->has_max_backoff_ms()) lock->set_max_backoff_ms(2000);
  }

  auto* context = config.mutable_context();
  if (context->mode() == ContextConfig::MODE_UNSPECIFIED) {
    context->set_mode(ContextConfig::LIVE);
  }
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  auto fail = [](const std::string& message) { throw std::runtime_error("Invalid configuration: " + message); };

  if (config.store().has_workbook()) {
    const auto& workbook = config.store().workbook();

    if (workbook.path().empty()) fail("store.workbook.path is required");

    const auto known = db::workbook::KnownLayoutVersions();
    for (const auto& version : workbook.supported_schema_versions()) {
      if (std::find(known.begin(), known.end(), version) == known.end()) {
        fail("unknown schema version " + version);
      }
    }

    const auto& supported = workbook.supported_schema_versions();
    if (std::find(supported.begin(), supported.end(), workbook.current_schema_version()) == supported.end()) {
      fail("current_schema_version " + workbook.current_schema_version() + " is not in supported_schema_versions");
    }

    const auto& lock = workbook.lock();
    if (lock.max_attempts() == 0) fail("store.workbook.lock.max_attempts must be positive");
    if (lock.max_backoff_ms() < lock.initial_backoff_ms()) {
      fail("store.workbook.lock.max_backoff_ms must not be below initial_backoff_ms");
    }
  }

  const auto& context = config.context();
  if (!context.fixed_time().empty() && !util::ParseIso8601(context.fixed_time())) {
    fail("context.fixed_time is not an ISO-8601 date or time: " + context.fixed_time());
  }
  if ((context.mode() == ContextConfig::SEEDED || context.mode() == ContextConfig::SEQUENTIAL) && context.fixed_time().empty()) {
    fail("context.fixed_time is required for seeded and sequential modes");
  }
}

} // namespace pipeline::config
