#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// Ordered by cost: cheaper tiers are preferred when several agents qualify.
enum class AgentTier { fast = 0, balanced = 1, deep = 2 };

enum class AgentStatus { idle, busy, degraded, offline };

enum class TaskOutcome { success, failure, cancelled };

const char* agent_tier_name(AgentTier tier);
std::optional<AgentTier> agent_tier_from_name(const std::string& name);
const char* agent_status_name(AgentStatus status);
const char* task_outcome_name(TaskOutcome outcome);

// One entry of the static agent catalog.
struct AgentDefinition {
    std::string id;                        // generated when empty
    AgentTier tier{AgentTier::balanced};
    std::vector<std::string> capabilities;
};

// Unit of work handed from a job to one agent. Owned by the job queue; agents
// only keep its ids.
struct Task {
    std::string id;
    std::string job_id;
    std::string capability;
    std::chrono::milliseconds timeout{0};  // 0 = no deadline
    std::optional<std::chrono::steady_clock::time_point> deadline;
};

struct AgentMetrics {
    std::uint64_t tasks_completed{0};
    std::uint64_t tasks_failed{0};
    std::uint64_t tasks_cancelled{0};
    std::uint32_t consecutive_failures{0};
    double total_duration_ms{0.0};
    double average_duration_ms{0.0};
};

struct Agent {
    std::string id;
    AgentTier tier{AgentTier::balanced};
    std::vector<std::string> capabilities;
    AgentStatus status{AgentStatus::idle};
    bool task_in_flight{false};              // set by acquire, cleared by release
    std::string current_task_id;
    std::string current_job_id;
    AgentMetrics metrics;
    std::chrono::steady_clock::time_point online_since{};
    std::chrono::steady_clock::time_point busy_since{};
    std::chrono::steady_clock::time_point degraded_since{};
    std::size_t catalog_index{0};

    bool has_capability(const std::string& capability) const;
    double uptime_seconds(std::chrono::steady_clock::time_point now) const;
};

nlohmann::json agent_to_json(const Agent& agent, std::chrono::steady_clock::time_point now);
