#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <google/protobuf/util/time_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>

#include "internal/util/errors.hpp"

namespace fleet::config {

using fleet::runtime::config::RuntimeConfig;
using google::protobuf::util::TimeUtil;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

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
      throw util::InvalidArgument("unsupported YAML node");
  }
}

static RuntimeConfig Parse(const YAML::Node& yaml) {
  google::protobuf::Value json_value;
  if (yaml.IsNull()) {
    json_value.mutable_struct_value();
  } else {
    YamlToProtoValue(yaml, &json_value);
  }

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw util::InvalidArgument("failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw util::InvalidArgument("invalid configuration: " + std::string(status.message()));
  }

  ConfigLoader::ApplyDefaults(&config);
  return config;
}

// ------------------------------------------------------------
// Defaults
// ------------------------------------------------------------

static void DefaultDuration(google::protobuf::Duration* duration, int64_t millis) {
  if (duration->seconds() <= 0 && duration->nanos() <= 0) {
    *duration = TimeUtil::MillisecondsToDuration(millis);
  }
}

static void DefaultString(std::string* value, const char* fallback) {
  if (value->empty()) *value = fallback;
}

void ConfigLoader::ApplyDefaults(RuntimeConfig* config) {
  DefaultString(config->mutable_server()->mutable_bind_address(), "0.0.0.0:50061");

  if (!config->database().has_sqlite() && !config->database().has_memory()) {
    config->mutable_database()->mutable_memory();
  }

  auto* provider = config->mutable_provider();
  DefaultString(provider->mutable_api_base_url(), "https://api.github.com");
  DefaultString(provider->mutable_web_base_url(), "https://github.com");
  DefaultString(provider->mutable_token_env(), "GITHUB_TOKEN");
  DefaultString(provider->mutable_user_agent(), "runner-fleet");
  DefaultDuration(provider->mutable_api_timeout(), 30'000);
  DefaultDuration(provider->mutable_initial_backoff(), 1'000);
  DefaultDuration(provider->mutable_max_backoff(), 60'000);
  if (provider->max_rate_limit_retries() == 0) provider->set_max_rate_limit_retries(3);

  DefaultDuration(config->mutable_compute()->mutable_command_timeout(), 600'000);

  auto* registration = config->mutable_registration();
  DefaultString(registration->mutable_runner_version(), "2.311.0");
  DefaultString(registration->mutable_runner_arch(), "linux-x64");
  DefaultDuration(registration->mutable_register_timeout(), 300'000);

  auto* dispatch = config->mutable_dispatch();
  if (dispatch->max_concurrent_operations() == 0) dispatch->set_max_concurrent_operations(10);
  if (dispatch->degraded_after_failed_batches() == 0) dispatch->set_degraded_after_failed_batches(3);
  DefaultDuration(dispatch->mutable_tick_interval(), 60'000);
  DefaultDuration(dispatch->mutable_observation_timeout(), 30'000);
  DefaultDuration(dispatch->mutable_online_timeout(), 300'000);
  DefaultDuration(dispatch->mutable_online_poll_interval(), 5'000);
  DefaultDuration(dispatch->mutable_operation_wait_timeout(), 30'000);
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw util::InvalidArgument("failed to load YAML config " + path + ": " + e.what());
  }
  return Parse(yaml);
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const YAML::Exception& e) {
    throw util::InvalidArgument(std::string("failed to parse YAML config: ") + e.what());
  }
  return Parse(yaml);
}

} // namespace fleet::config
