#include "../include/agent_selection.hpp"
#include <tuple>

namespace {
const Agent* best_with_status(const std::string& capability, const std::vector<Agent>& agents, AgentStatus status) {
    const Agent* best = nullptr;
    for (const auto& a : agents) {
        if (a.status != status || !a.has_capability(capability)) continue;
        if (!best ||
            std::make_tuple(static_cast<int>(a.tier), a.metrics.tasks_completed, a.catalog_index) <
            std::make_tuple(static_cast<int>(best->tier), best->metrics.tasks_completed, best->catalog_index)) {
            best = &a;
        }
    }
    return best;
}
}

std::optional<Selection> select_agent(const std::string& capability,
                                      const std::vector<Agent>& agents,
                                      const SelectionPolicy& policy) {
    if (const Agent* a = best_with_status(capability, agents, AgentStatus::idle)) {
        return Selection{a->id, false};
    }
    if (policy.fallback_to_degraded) {
        if (const Agent* a = best_with_status(capability, agents, AgentStatus::degraded)) {
            return Selection{a->id, true};
        }
    }
    return std::nullopt;
}
