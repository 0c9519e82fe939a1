#pragma once
#include "agent.hpp"
#include <vector>
#include <nlohmann/json.hpp>

// Built-in catalog used when the configuration does not list agents.
std::vector<AgentDefinition> default_agent_catalog();

// Parses [{"id": "...", "tier": "fast", "capabilities": ["..."]}, ...].
// Throws ValidationError on malformed entries.
std::vector<AgentDefinition> agent_catalog_from_json(const nlohmann::json& j);
