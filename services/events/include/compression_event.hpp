#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <nlohmann/json.hpp>

enum class EventType {
    job_queued,
    job_started,
    progress_updated,
    job_paused,
    job_resumed,
    job_completed,
    job_failed,
    job_cancelled,
    agent_status_changed,
    swarm_health_changed
};

struct CompressionEvent {
    EventType type{EventType::job_queued};
    std::string job_id;   // empty for agent and swarm events
    std::string agent_id; // empty when no agent is involved
    nlohmann::json payload = nlohmann::json::object();
    std::chrono::system_clock::time_point timestamp{};
    std::uint64_t sequence{0};
};

// All criteria are optional; an empty filter matches every event.
struct EventFilter {
    std::set<EventType> types;
    std::string job_id;
    std::string agent_id;

    bool matches(const CompressionEvent& ev) const;
};

const char* event_type_name(EventType type);
std::optional<EventType> event_type_from_name(const std::string& name);

nlohmann::json event_to_json(const CompressionEvent& ev);
