#include "config/runtime_config.hpp"
#include "core/errors.hpp"
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <fstream>

using json = nlohmann::json;

namespace agentflow::config {

namespace {

std::chrono::milliseconds ms_value(const json& j, const char* key, std::chrono::milliseconds fallback) {
    if (!j.contains(key)) {
        return fallback;
    }
    auto value = j[key].get<int64_t>();
    if (value < 0) {
        throw InvalidValueError(std::string("config field '") + key + "' must not be negative");
    }
    return std::chrono::milliseconds(value);
}

bool env_number(const char* name, int64_t& out) {
    const char* raw = std::getenv(name);
    if (!raw || !*raw) {
        return false;
    }
    char* end = nullptr;
    long long value = std::strtoll(raw, &end, 10);
    if (*end != '\0' || value < 0) {
        spdlog::warn("Ignoring {}={}: not a non-negative integer", name, raw);
        return false;
    }
    out = value;
    return true;
}

} // namespace

RuntimeConfig config_from_json(const json& j) {
    RuntimeConfig config;
    if (!j.is_object()) {
        throw InvalidValueError("config must be a json object");
    }

    try {
        config.log_level = j.value("log_level", config.log_level);
        config.refresh_interval = ms_value(j, "refresh_interval_ms", config.refresh_interval);
        config.condition_timeout = ms_value(j, "condition_timeout_ms", config.condition_timeout);
        config.work_capacity = j.value("work_capacity", config.work_capacity);
        config.work_refresh_interval = ms_value(j, "work_refresh_interval_ms", config.work_refresh_interval);
        config.max_steps = j.value("max_steps", config.max_steps);
    } catch (const json::exception& e) {
        throw InvalidValueError(std::string("invalid config: ") + e.what());
    }

    if (config.work_capacity == 0) {
        throw InvalidValueError("work_capacity must be at least 1");
    }
    return config;
}

RuntimeConfig load_config(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw InvalidValueError("cannot open config file: " + path);
    }

    json j;
    try {
        in >> j;
    } catch (const json::exception& e) {
        throw InvalidValueError("failed to parse config " + path + ": " + e.what());
    }

    spdlog::debug("Loaded config from {}", path);
    return config_from_json(j);
}

void apply_env_overrides(RuntimeConfig& config) {
    if (const char* level = std::getenv("AGENTFLOW_LOG_LEVEL")) {
        config.log_level = level;
    }

    int64_t value = 0;
    if (env_number("AGENTFLOW_REFRESH_MS", value)) {
        config.refresh_interval = std::chrono::milliseconds(value);
    }
    if (env_number("AGENTFLOW_CONDITION_TIMEOUT_MS", value)) {
        config.condition_timeout = std::chrono::milliseconds(value);
    }
    if (env_number("AGENTFLOW_WORK_CAPACITY", value) && value > 0) {
        config.work_capacity = static_cast<size_t>(value);
    }
}

json to_json(const RuntimeConfig& config) {
    json j;
    j["log_level"] = config.log_level;
    j["refresh_interval_ms"] = config.refresh_interval.count();
    j["condition_timeout_ms"] = config.condition_timeout.count();
    j["work_capacity"] = config.work_capacity;
    j["work_refresh_interval_ms"] = config.work_refresh_interval.count();
    j["max_steps"] = config.max_steps;
    return j;
}

} // namespace agentflow::config
