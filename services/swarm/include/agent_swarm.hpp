#pragma once
#include "agent.hpp"
#include "agent_selection.hpp"
#include "../../events/include/event_emitter.hpp"
#include "../../../shared/cpp/common/include/util.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

struct SwarmConfig {
    std::uint32_t failure_threshold{3};          // consecutive failures before degraded
    std::chrono::milliseconds degraded_cooldown{30000};
    bool fallback_to_degraded{true};
    double healthy_threshold{0.75};              // available fraction at or above: healthy
    double critical_threshold{0.4};              // available fraction below: critical
    SteadyClockFn clock;                         // defaults to the steady clock
};

enum class HealthLevel { healthy, degraded, critical };

const char* health_level_name(HealthLevel level);

struct SwarmHealth {
    std::size_t total{0};
    std::size_t idle{0};
    std::size_t busy{0};
    std::size_t degraded{0};
    std::size_t offline{0};
    double idle_fraction{0.0};
    double busy_fraction{0.0};
    double degraded_fraction{0.0};
    double offline_fraction{0.0};
    double average_task_duration_ms{0.0};
    std::uint64_t tasks_completed{0};
    std::uint64_t tasks_failed{0};
    HealthLevel level{HealthLevel::critical};
};

nlohmann::json health_to_json(const SwarmHealth& h);

// Registry of the tiered worker agents.
//
// Mutations (acquire, release, mark_*, reset, recover_degraded) are serialized
// by one mutex. swarm_health() reads a snapshot that is republished after every
// mutation and never takes that mutex.
class AgentSwarm {
public:
    explicit AgentSwarm(SwarmConfig config = {}, std::shared_ptr<EventEmitter> emitter = nullptr);

    AgentSwarm(const AgentSwarm&) = delete;
    AgentSwarm& operator=(const AgentSwarm&) = delete;

    // Throws AlreadyInitializedError on a second call, ValidationError on a bad catalog.
    void initialize(const std::vector<AgentDefinition>& definitions);
    bool initialized() const;

    // Empty result means no eligible agent right now; the caller keeps the job queued.
    std::optional<std::string> acquire(const std::string& capability);
    std::optional<std::string> acquire(const Task& task);

    void release(const std::string& agent_id, TaskOutcome outcome);
    void mark_offline(const std::string& agent_id);
    void mark_online(const std::string& agent_id);
    void reset(const std::string& agent_id);
    // Returns degraded agents whose cooldown expired to idle; returns how many.
    std::size_t recover_degraded();

    SwarmHealth swarm_health() const;
    bool supports(const std::string& capability) const;
    std::optional<Agent> agent(const std::string& agent_id) const;
    std::vector<Agent> agents() const;
    std::vector<Agent> agents(AgentTier tier) const;
    const SwarmConfig& config() const { return config_; }

    // Called (outside the registry lock) whenever an agent may have become selectable.
    // Listeners must not add or remove listeners themselves.
    int add_availability_listener(std::function<void()> listener);
    void remove_availability_listener(int id);

private:
    Agent& find_locked(const std::string& agent_id);
    const Agent* find_locked_const(const std::string& agent_id) const;
    void set_status_locked(Agent& agent, AgentStatus status);
    std::size_t recover_degraded_locked();
    void publish_health_locked();
    void notify_available();
    SteadyClock::time_point now() const { return config_.clock(); }

    SwarmConfig config_;
    std::shared_ptr<EventEmitter> emitter_;

    mutable std::mutex mtx_;
    std::vector<Agent> agents_;
    std::unordered_map<std::string, std::size_t> index_;
    bool initialized_{false};
    HealthLevel last_level_{HealthLevel::critical};
    std::shared_ptr<const SwarmHealth> health_;

    std::mutex listeners_mtx_;
    std::vector<std::pair<int, std::function<void()>>> listeners_;
    int next_listener_{1};
};
