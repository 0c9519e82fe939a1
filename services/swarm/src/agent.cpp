#include "../include/agent.hpp"
#include <algorithm>

using json = nlohmann::json;

const char* agent_tier_name(AgentTier tier) {
    switch (tier) {
        case AgentTier::fast: return "fast";
        case AgentTier::balanced: return "balanced";
        case AgentTier::deep: return "deep";
    }
    return "balanced";
}

std::optional<AgentTier> agent_tier_from_name(const std::string& name) {
    if (name == "fast") return AgentTier::fast;
    if (name == "balanced") return AgentTier::balanced;
    if (name == "deep") return AgentTier::deep;
    return std::nullopt;
}

const char* agent_status_name(AgentStatus status) {
    switch (status) {
        case AgentStatus::idle: return "idle";
        case AgentStatus::busy: return "busy";
        case AgentStatus::degraded: return "degraded";
        case AgentStatus::offline: return "offline";
    }
    return "idle";
}

const char* task_outcome_name(TaskOutcome outcome) {
    switch (outcome) {
        case TaskOutcome::success: return "success";
        case TaskOutcome::failure: return "failure";
        case TaskOutcome::cancelled: return "cancelled";
    }
    return "success";
}

bool Agent::has_capability(const std::string& capability) const {
    return std::find(capabilities.begin(), capabilities.end(), capability) != capabilities.end();
}

double Agent::uptime_seconds(std::chrono::steady_clock::time_point now) const {
    if (status == AgentStatus::offline || now < online_since) return 0.0;
    return std::chrono::duration<double>(now - online_since).count();
}

json agent_to_json(const Agent& agent, std::chrono::steady_clock::time_point now) {
    return json{
        {"id", agent.id},
        {"tier", agent_tier_name(agent.tier)},
        {"capabilities", agent.capabilities},
        {"status", agent_status_name(agent.status)},
        {"task_in_flight", agent.task_in_flight},
        {"current_task_id", agent.current_task_id.empty() ? json(nullptr) : json(agent.current_task_id)},
        {"current_job_id", agent.current_job_id.empty() ? json(nullptr) : json(agent.current_job_id)},
        {"metrics", {
            {"tasks_completed", agent.metrics.tasks_completed},
            {"tasks_failed", agent.metrics.tasks_failed},
            {"tasks_cancelled", agent.metrics.tasks_cancelled},
            {"consecutive_failures", agent.metrics.consecutive_failures},
            {"average_duration_ms", agent.metrics.average_duration_ms},
            {"uptime_seconds", agent.uptime_seconds(now)}
        }}
    };
}
