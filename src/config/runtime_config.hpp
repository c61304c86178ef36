#pragma once
#include <chrono>
#include <cstddef>
#include <string>
#include <nlohmann/json.hpp>

namespace agentflow::config {

// Runtime configuration
struct RuntimeConfig {
    std::string log_level = "info";
    std::chrono::milliseconds refresh_interval{100};     // actor / mail loop period
    std::chrono::milliseconds condition_timeout{30000};  // executable condition round trip
    size_t work_capacity = 5;                            // work items admitted per batch
    std::chrono::milliseconds work_refresh_interval{1000};
    size_t max_steps = 10000;                            // session step bound, 0 = unbounded
};

// Fields absent from the json keep their defaults
RuntimeConfig config_from_json(const nlohmann::json& j);

// Throws InvalidValueError if the file is missing or not valid json
RuntimeConfig load_config(const std::string& path);

// AGENTFLOW_LOG_LEVEL, AGENTFLOW_REFRESH_MS, AGENTFLOW_CONDITION_TIMEOUT_MS,
// AGENTFLOW_WORK_CAPACITY
void apply_env_overrides(RuntimeConfig& config);

nlohmann::json to_json(const RuntimeConfig& config);

} // namespace agentflow::config
