#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <google/protobuf/util/time_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

#include "internal/status/status.hpp"
#include "internal/util/errors.hpp"

namespace rowqueue::config {

using google::protobuf::util::TimeUtil;
using rowqueue::runtime::config::QueueConfig;
using rowqueue::runtime::config::RuntimeConfig;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar_value = node.Scalar();

  // quoted scalars stay strings
  if (node.Tag() == "!" || scalar_value.empty()) {
    value->set_string_value(scalar_value);
    return;
  }

  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (endptr && *endptr == '\0') {
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

static std::chrono::milliseconds ToMillis(const google::protobuf::Duration& duration, const char* name) {
  if (!TimeUtil::IsDurationValid(duration) || duration.seconds() < 0 || duration.nanos() < 0) {
    throw util::ValidationError(std::string("queue.") + name + " must be a non-negative duration");
  }
  const std::chrono::milliseconds millis(TimeUtil::DurationToMilliseconds(duration));
  if (millis > queue::kMaxDuration) {
    throw util::ValidationError(std::string("queue.") + name + " must not exceed " + std::to_string(queue::kMaxDuration.count()) + "h");
  }
  return millis;
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

  RuntimeConfig config;
  if (yaml.IsNull()) {
    return config;
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + to_json_status.ToString());
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + status.ToString());
  }

  return config;
}

queue::RunOptions ToRunOptions(const QueueConfig& config) {
  queue::RunOptions options;

  if (config.has_retry()) {
    if (config.retry() > static_cast<uint32_t>(status::kMaxRetry)) {
      throw util::ValidationError("queue.retry must be within 0.." + std::to_string(status::kMaxRetry));
    }
    options.retry = static_cast<int>(config.retry());
  }
  if (config.has_timeout()) {
    options.timeout = ToMillis(config.timeout(), "timeout");
  }
  if (config.has_delay()) {
    options.delay = ToMillis(config.delay(), "delay");
  }

  switch (config.interrupt_policy()) {
    case rowqueue::runtime::config::INTERRUPT_POLICY_CANCEL:
      options.interrupt_policy = queue::InterruptPolicy::kCancel;
      break;
    case rowqueue::runtime::config::INTERRUPT_POLICY_UNSPECIFIED:
    case rowqueue::runtime::config::INTERRUPT_POLICY_PENALIZE:
      options.interrupt_policy = queue::InterruptPolicy::kPenalize;
      break;
    default:
      throw util::ValidationError("queue.interrupt_policy has an unknown value");
  }

  queue::ValidateRunOptions(options);
  return options;
}

std::chrono::milliseconds IdleBackoff(const QueueConfig& config) {
  if (!config.has_idle_backoff()) {
    return std::chrono::seconds(1);
  }
  return ToMillis(config.idle_backoff(), "idle_backoff");
}

} // namespace rowqueue::config
