#include "../include/agent_swarm.hpp"
#include "../../../shared/cpp/common/include/errors.hpp"
#include "../../../shared/cpp/common/include/log.hpp"
#include <algorithm>
#include <unordered_set>

using json = nlohmann::json;

const char* health_level_name(HealthLevel level) {
    switch (level) {
        case HealthLevel::healthy: return "healthy";
        case HealthLevel::degraded: return "degraded";
        case HealthLevel::critical: return "critical";
    }
    return "critical";
}

json health_to_json(const SwarmHealth& h) {
    return json{
        {"level", health_level_name(h.level)},
        {"total", h.total},
        {"idle", h.idle},
        {"busy", h.busy},
        {"degraded", h.degraded},
        {"offline", h.offline},
        {"idle_fraction", h.idle_fraction},
        {"busy_fraction", h.busy_fraction},
        {"degraded_fraction", h.degraded_fraction},
        {"offline_fraction", h.offline_fraction},
        {"average_task_duration_ms", h.average_task_duration_ms},
        {"tasks_completed", h.tasks_completed},
        {"tasks_failed", h.tasks_failed}
    };
}

namespace {
SwarmHealth compute_health(const std::vector<Agent>& agents, const SwarmConfig& cfg) {
    SwarmHealth h;
    h.total = agents.size();
    double duration_ms = 0.0;
    std::uint64_t timed = 0;
    for (const auto& a : agents) {
        switch (a.status) {
            case AgentStatus::idle: ++h.idle; break;
            case AgentStatus::busy: ++h.busy; break;
            case AgentStatus::degraded: ++h.degraded; break;
            case AgentStatus::offline: ++h.offline; break;
        }
        h.tasks_completed += a.metrics.tasks_completed;
        h.tasks_failed += a.metrics.tasks_failed;
        duration_ms += a.metrics.total_duration_ms;
        timed += a.metrics.tasks_completed + a.metrics.tasks_failed;
    }
    if (timed > 0) h.average_task_duration_ms = duration_ms / static_cast<double>(timed);
    if (h.total == 0) {
        h.level = HealthLevel::critical;
        return h;
    }
    const double total = static_cast<double>(h.total);
    h.idle_fraction = h.idle / total;
    h.busy_fraction = h.busy / total;
    h.degraded_fraction = h.degraded / total;
    h.offline_fraction = h.offline / total;
    const double available = h.idle_fraction + h.busy_fraction;
    if (available >= cfg.healthy_threshold) h.level = HealthLevel::healthy;
    else if (available < cfg.critical_threshold) h.level = HealthLevel::critical;
    else h.level = HealthLevel::degraded;
    return h;
}
}

AgentSwarm::AgentSwarm(SwarmConfig config, std::shared_ptr<EventEmitter> emitter)
    : config_(std::move(config)), emitter_(std::move(emitter)) {
    if (!config_.clock) config_.clock = steady_clock_fn();
    if (!emitter_) emitter_ = get_default_emitter();
    if (config_.failure_threshold == 0) config_.failure_threshold = 1;
    health_ = std::make_shared<const SwarmHealth>();
}

void AgentSwarm::initialize(const std::vector<AgentDefinition>& definitions) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (initialized_) throw AlreadyInitializedError("agent swarm already initialized");
    if (definitions.empty()) throw ValidationError("agent catalog is empty");

    std::unordered_set<std::string> ids;
    for (const auto& def : definitions) {
        if (!def.id.empty() && !ids.insert(def.id).second) {
            throw ValidationError("duplicate agent id: " + def.id);
        }
        if (def.capabilities.empty()) {
            throw ValidationError("agent " + (def.id.empty() ? std::string("(unnamed)") : def.id) +
                                  " has no capability");
        }
    }

    const auto t = now();
    std::vector<Agent> agents;
    agents.reserve(definitions.size());
    for (std::size_t i = 0; i < definitions.size(); ++i) {
        const auto& def = definitions[i];
        Agent a;
        a.id = def.id;
        if (a.id.empty()) {
            std::size_t n = i + 1;
            do {
                a.id = std::string(agent_tier_name(def.tier)) + "-" + std::to_string(n++);
            } while (ids.count(a.id));
            ids.insert(a.id);
        }
        a.tier = def.tier;
        a.capabilities = def.capabilities;
        a.status = AgentStatus::idle;
        a.online_since = t;
        a.catalog_index = i;
        agents.push_back(std::move(a));
    }

    agents_ = std::move(agents);
    index_.clear();
    for (std::size_t i = 0; i < agents_.size(); ++i) index_[agents_[i].id] = i;
    initialized_ = true;

    auto h = compute_health(agents_, config_);
    last_level_ = h.level;
    std::atomic_store(&health_, std::shared_ptr<const SwarmHealth>(std::make_shared<SwarmHealth>(h)));
    log_info("swarm", "initialized " + std::to_string(agents_.size()) + " agents");
}

bool AgentSwarm::initialized() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return initialized_;
}

std::optional<std::string> AgentSwarm::acquire(const std::string& capability) {
    Task task;
    task.id = generate_id();
    task.capability = capability;
    return acquire(task);
}

std::optional<std::string> AgentSwarm::acquire(const Task& task) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!initialized_) throw InvalidStateError("agent swarm not initialized");

    const bool recovered = recover_degraded_locked() > 0;
    auto sel = select_agent(task.capability, agents_, SelectionPolicy{config_.fallback_to_degraded});
    if (!sel) {
        if (recovered) publish_health_locked();
        log_debug("swarm", "no agent available for " + task.capability);
        return std::nullopt;
    }

    Agent& a = agents_[index_.at(sel->agent_id)];
    if (sel->used_fallback) {
        log_warn("swarm", "no idle agent for " + task.capability + ", falling back to degraded agent " + a.id);
    }
    a.task_in_flight = true;
    a.current_task_id = task.id;
    a.current_job_id = task.job_id;
    a.busy_since = now();
    set_status_locked(a, AgentStatus::busy);
    publish_health_locked();
    return a.id;
}

void AgentSwarm::release(const std::string& agent_id, TaskOutcome outcome) {
    bool available = false;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        Agent& a = find_locked(agent_id);
        if (!a.task_in_flight) {
            throw InvalidStateError("agent " + agent_id + " is " + agent_status_name(a.status) + ", not busy");
        }

        const double ms = std::chrono::duration<double, std::milli>(now() - a.busy_since).count();
        auto& m = a.metrics;
        switch (outcome) {
            case TaskOutcome::success:
                ++m.tasks_completed;
                m.consecutive_failures = 0;
                m.total_duration_ms += ms;
                break;
            case TaskOutcome::failure:
                ++m.tasks_failed;
                ++m.consecutive_failures;
                m.total_duration_ms += ms;
                break;
            case TaskOutcome::cancelled:
                ++m.tasks_cancelled;
                break;
        }
        const auto timed = m.tasks_completed + m.tasks_failed;
        if (timed > 0) m.average_duration_ms = m.total_duration_ms / static_cast<double>(timed);

        const std::string job_id = a.current_job_id;
        a.task_in_flight = false;
        a.current_task_id.clear();

        if (a.status == AgentStatus::offline) {
            a.current_job_id.clear();
            log_info("swarm", "offline agent " + a.id + " finished job " + job_id + " (" +
                     task_outcome_name(outcome) + ")");
        } else if (outcome == TaskOutcome::failure && m.consecutive_failures >= config_.failure_threshold) {
            a.degraded_since = now();
            set_status_locked(a, AgentStatus::degraded);
            a.current_job_id.clear();
            log_warn("swarm", "agent " + a.id + " degraded after " +
                     std::to_string(m.consecutive_failures) + " consecutive failures");
        } else if (outcome == TaskOutcome::cancelled && m.consecutive_failures >= config_.failure_threshold) {
            // picked as a degraded fallback; the original cooldown still applies
            set_status_locked(a, AgentStatus::degraded);
            a.current_job_id.clear();
        } else {
            set_status_locked(a, AgentStatus::idle);
            a.current_job_id.clear();
            available = true;
        }
        publish_health_locked();
    }
    if (available) notify_available();
}

void AgentSwarm::mark_offline(const std::string& agent_id) {
    std::lock_guard<std::mutex> lock(mtx_);
    Agent& a = find_locked(agent_id);
    if (a.status == AgentStatus::offline) return;
    set_status_locked(a, AgentStatus::offline);
    publish_health_locked();
    log_info("swarm", "agent " + a.id + " marked offline");
}

void AgentSwarm::mark_online(const std::string& agent_id) {
    bool available = false;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        Agent& a = find_locked(agent_id);
        if (a.status != AgentStatus::offline) {
            throw InvalidStateError("agent " + agent_id + " is " + agent_status_name(a.status) + ", not offline");
        }
        a.metrics.consecutive_failures = 0;
        a.online_since = now();
        // a task started before going offline is still running
        if (a.task_in_flight) {
            set_status_locked(a, AgentStatus::busy);
        } else {
            set_status_locked(a, AgentStatus::idle);
            available = true;
        }
        publish_health_locked();
        log_info("swarm", "agent " + a.id + " back online");
    }
    if (available) notify_available();
}

void AgentSwarm::reset(const std::string& agent_id) {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        Agent& a = find_locked(agent_id);
        if (a.status != AgentStatus::degraded) {
            throw InvalidStateError("agent " + agent_id + " is " + agent_status_name(a.status) + ", not degraded");
        }
        a.metrics.consecutive_failures = 0;
        set_status_locked(a, AgentStatus::idle);
        publish_health_locked();
    }
    notify_available();
}

std::size_t AgentSwarm::recover_degraded() {
    std::size_t n;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        n = recover_degraded_locked();
        if (n > 0) publish_health_locked();
    }
    if (n > 0) notify_available();
    return n;
}

std::size_t AgentSwarm::recover_degraded_locked() {
    std::size_t n = 0;
    const auto t = now();
    for (auto& a : agents_) {
        if (a.status != AgentStatus::degraded) continue;
        if (t - a.degraded_since < config_.degraded_cooldown) continue;
        a.metrics.consecutive_failures = 0;
        set_status_locked(a, AgentStatus::idle);
        log_info("swarm", "agent " + a.id + " recovered after cooldown");
        ++n;
    }
    return n;
}

SwarmHealth AgentSwarm::swarm_health() const {
    auto snap = std::atomic_load(&health_);
    return *snap;
}

bool AgentSwarm::supports(const std::string& capability) const {
    std::lock_guard<std::mutex> lock(mtx_);
    return std::any_of(agents_.begin(), agents_.end(),
                       [&](const Agent& a) { return a.has_capability(capability); });
}

std::optional<Agent> AgentSwarm::agent(const std::string& agent_id) const {
    std::lock_guard<std::mutex> lock(mtx_);
    const Agent* a = find_locked_const(agent_id);
    if (!a) return std::nullopt;
    return *a;
}

std::vector<Agent> AgentSwarm::agents() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return agents_;
}

std::vector<Agent> AgentSwarm::agents(AgentTier tier) const {
    std::lock_guard<std::mutex> lock(mtx_);
    std::vector<Agent> out;
    for (const auto& a : agents_) {
        if (a.tier == tier) out.push_back(a);
    }
    return out;
}

int AgentSwarm::add_availability_listener(std::function<void()> listener) {
    std::lock_guard<std::mutex> lock(listeners_mtx_);
    int id = next_listener_++;
    listeners_.emplace_back(id, std::move(listener));
    return id;
}

void AgentSwarm::remove_availability_listener(int id) {
    std::lock_guard<std::mutex> lock(listeners_mtx_);
    listeners_.erase(std::remove_if(listeners_.begin(), listeners_.end(),
                                    [&](const std::pair<int, std::function<void()>>& l) { return l.first == id; }),
                     listeners_.end());
}

Agent& AgentSwarm::find_locked(const std::string& agent_id) {
    auto it = index_.find(agent_id);
    if (it == index_.end()) throw NotFoundError("unknown agent: " + agent_id);
    return agents_[it->second];
}

const Agent* AgentSwarm::find_locked_const(const std::string& agent_id) const {
    auto it = index_.find(agent_id);
    return it == index_.end() ? nullptr : &agents_[it->second];
}

void AgentSwarm::set_status_locked(Agent& agent, AgentStatus status) {
    const AgentStatus previous = agent.status;
    agent.status = status;
    emitter_->publish(EventType::agent_status_changed, agent.current_job_id, agent.id, json{
        {"previous", agent_status_name(previous)},
        {"status", agent_status_name(status)},
        {"tier", agent_tier_name(agent.tier)},
        {"consecutive_failures", agent.metrics.consecutive_failures},
        {"tasks_completed", agent.metrics.tasks_completed},
        {"tasks_failed", agent.metrics.tasks_failed}
    });
}

void AgentSwarm::publish_health_locked() {
    auto h = compute_health(agents_, config_);
    std::atomic_store(&health_, std::shared_ptr<const SwarmHealth>(std::make_shared<SwarmHealth>(h)));
    if (h.level == last_level_) return;
    const HealthLevel previous = last_level_;
    last_level_ = h.level;
    auto payload = health_to_json(h);
    payload["previous_level"] = health_level_name(previous);
    emitter_->publish(EventType::swarm_health_changed, "", "", payload);
    log_info("swarm", std::string("health ") + health_level_name(previous) + " -> " + health_level_name(h.level));
}

void AgentSwarm::notify_available() {
    // held while calling so remove_availability_listener waits out a running listener
    std::lock_guard<std::mutex> lock(listeners_mtx_);
    for (const auto& l : listeners_) l.second();
}
