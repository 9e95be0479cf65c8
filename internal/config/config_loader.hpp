#pragma once

#include <chrono>
#include <string>

#include "config/config.pb.h"
#include "internal/queue/options.hpp"

namespace rowqueue::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf, so durations use the
  protobuf JSON form ("3600s", "0.25s") and unknown keys are rejected.
*/
class ConfigLoader {
 public:
  static rowqueue::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
};

// Queue section -> RunOptions; unset fields keep RunOptions defaults.
// Throws util::ValidationError.
queue::RunOptions ToRunOptions(const rowqueue::runtime::config::QueueConfig& config);

std::chrono::milliseconds IdleBackoff(const rowqueue::runtime::config::QueueConfig& config);

} // namespace rowqueue::config
