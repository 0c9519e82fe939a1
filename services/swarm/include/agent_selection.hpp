#pragma once
#include "agent.hpp"
#include <optional>
#include <string>
#include <vector>

struct SelectionPolicy {
    // Consider degraded agents when no idle agent of any tier has the capability.
    bool fallback_to_degraded{true};
};

struct Selection {
    std::string agent_id;
    bool used_fallback{false};
};

// Pure selection strategy, independent of the registry and of timing.
// Idle agents with the capability are ranked by tier (cheapest first), then by
// fewest tasks completed, then by catalog order. Degraded agents are ranked the
// same way but only when the policy allows the fallback and no idle agent
// qualifies. Busy and offline agents are never selected.
std::optional<Selection> select_agent(const std::string& capability,
                                      const std::vector<Agent>& agents,
                                      const SelectionPolicy& policy);
