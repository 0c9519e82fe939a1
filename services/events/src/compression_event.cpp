#include "../include/compression_event.hpp"
#include "../../../shared/cpp/common/include/util.hpp"

using json = nlohmann::json;

bool EventFilter::matches(const CompressionEvent& ev) const {
    if (!types.empty() && !types.count(ev.type)) return false;
    if (!job_id.empty() && ev.job_id != job_id) return false;
    if (!agent_id.empty() && ev.agent_id != agent_id) return false;
    return true;
}

const char* event_type_name(EventType type) {
    switch (type) {
        case EventType::job_queued: return "job_queued";
        case EventType::job_started: return "job_started";
        case EventType::progress_updated: return "progress_updated";
        case EventType::job_paused: return "job_paused";
        case EventType::job_resumed: return "job_resumed";
        case EventType::job_completed: return "job_completed";
        case EventType::job_failed: return "job_failed";
        case EventType::job_cancelled: return "job_cancelled";
        case EventType::agent_status_changed: return "agent_status_changed";
        case EventType::swarm_health_changed: return "swarm_health_changed";
    }
    return "unknown";
}

std::optional<EventType> event_type_from_name(const std::string& name) {
    static const EventType all[] = {
        EventType::job_queued, EventType::job_started, EventType::progress_updated,
        EventType::job_paused, EventType::job_resumed, EventType::job_completed,
        EventType::job_failed, EventType::job_cancelled, EventType::agent_status_changed,
        EventType::swarm_health_changed};
    for (auto t : all) {
        if (name == event_type_name(t)) return t;
    }
    return std::nullopt;
}

json event_to_json(const CompressionEvent& ev) {
    return json{
        {"type", event_type_name(ev.type)},
        {"sequence", ev.sequence},
        {"timestamp", format_timestamp(ev.timestamp)},
        {"job_id", ev.job_id.empty() ? json(nullptr) : json(ev.job_id)},
        {"agent_id", ev.agent_id.empty() ? json(nullptr) : json(ev.agent_id)},
        {"payload", ev.payload}
    };
}
