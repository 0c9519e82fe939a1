#pragma once
#include "job_queue.hpp"
#include "../../swarm/include/agent.hpp"
#include "../../swarm/include/agent_swarm.hpp"
#include "../../../shared/cpp/common/include/log.hpp"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// Everything compressord reads at startup.
struct ServiceConfig {
    int port{7000};
    std::string engine{"zlib"};   // zlib | stub
    QueueConfig queue;
    SwarmConfig swarm;
    std::vector<AgentDefinition> agents;   // built-in catalog unless configured
    std::size_t history_size{1000};
    LogLevel log_level{LogLevel::info};
};

// Missing keys keep their defaults. Throws ValidationError on bad values.
ServiceConfig service_config_from_json(const nlohmann::json& j);
ServiceConfig load_service_config(const std::string& path);
// COMPRESSOR_PORT, COMPRESSOR_ENGINE, COMPRESSOR_CONCURRENCY, COMPRESSOR_LOG_LEVEL
void apply_env_overrides(ServiceConfig& config);
