#include "../include/service_config.hpp"
#include "../../swarm/include/agent_catalog.hpp"
#include "../../../shared/cpp/common/include/errors.hpp"
#include "../../../shared/cpp/common/include/util.hpp"
#include <cstdlib>
#include <fstream>

using json = nlohmann::json;

namespace {

std::int64_t get_int(const json& obj, const char* key, std::int64_t def, std::int64_t min_value) {
    if (!obj.contains(key)) return def;
    const auto& v = obj.at(key);
    if (!v.is_number_integer()) throw ValidationError(std::string(key) + " must be an integer");
    const auto n = v.get<std::int64_t>();
    if (n < min_value) throw ValidationError(std::string(key) + " must be >= " + std::to_string(min_value));
    return n;
}

double get_fraction(const json& obj, const char* key, double def) {
    if (!obj.contains(key)) return def;
    const auto& v = obj.at(key);
    if (!v.is_number()) throw ValidationError(std::string(key) + " must be a number");
    const double d = v.get<double>();
    if (d < 0.0 || d > 1.0) throw ValidationError(std::string(key) + " must be between 0 and 1");
    return d;
}

const json& section(const json& j, const char* key) {
    static const json empty = json::object();
    if (!j.contains(key)) return empty;
    if (!j.at(key).is_object()) throw ValidationError(std::string(key) + " must be an object");
    return j.at(key);
}

void validate_engine(const std::string& engine) {
    if (engine != "zlib" && engine != "stub") throw ValidationError("engine must be 'zlib' or 'stub', got '" + engine + "'");
}

void validate_port(std::int64_t port) {
    if (port < 1 || port > 65535) throw ValidationError("port out of range: " + std::to_string(port));
}

}

ServiceConfig service_config_from_json(const json& j) {
    if (!j.is_object()) throw ValidationError("configuration must be a JSON object");
    ServiceConfig c;

    const auto port = get_int(j, "port", c.port, 1);
    validate_port(port);
    c.port = static_cast<int>(port);

    if (j.contains("engine")) {
        if (!j.at("engine").is_string()) throw ValidationError("engine must be a string");
        c.engine = j.at("engine").get<std::string>();
        validate_engine(c.engine);
    }

    if (j.contains("log_level")) {
        if (!j.at("log_level").is_string()) throw ValidationError("log_level must be a string");
        const auto name = j.at("log_level").get<std::string>();
        if (name != "error" && name != "warn" && name != "info" && name != "debug") {
            throw ValidationError("unknown log_level '" + name + "'");
        }
        c.log_level = log_level_from_string(name);
    }

    const json& q = section(j, "queue");
    c.queue.concurrency_limit = static_cast<std::size_t>(get_int(q, "concurrency_limit", 4, 1));
    c.queue.poll_interval = std::chrono::milliseconds(get_int(q, "poll_interval_ms", 100, 1));
    c.queue.progress_coalesce = std::chrono::milliseconds(get_int(q, "progress_coalesce_ms", 250, 0));
    c.queue.default_task_timeout = std::chrono::milliseconds(get_int(q, "default_task_timeout_ms", 0, 0));
    c.queue.max_finished_jobs = static_cast<std::size_t>(get_int(q, "max_finished_jobs", 1000, 1));

    const json& s = section(j, "swarm");
    c.swarm.failure_threshold = static_cast<std::uint32_t>(get_int(s, "failure_threshold", 3, 1));
    c.swarm.degraded_cooldown = std::chrono::milliseconds(get_int(s, "degraded_cooldown_ms", 30000, 0));
    if (s.contains("fallback_to_degraded")) {
        if (!s.at("fallback_to_degraded").is_boolean()) throw ValidationError("fallback_to_degraded must be a boolean");
        c.swarm.fallback_to_degraded = s.at("fallback_to_degraded").get<bool>();
    }
    c.swarm.healthy_threshold = get_fraction(s, "healthy_threshold", 0.75);
    c.swarm.critical_threshold = get_fraction(s, "critical_threshold", 0.4);
    if (c.swarm.critical_threshold > c.swarm.healthy_threshold) {
        throw ValidationError("critical_threshold must not exceed healthy_threshold");
    }

    const json& e = section(j, "events");
    c.history_size = static_cast<std::size_t>(get_int(e, "history_size", 1000, 1));

    c.agents = j.contains("agents") ? agent_catalog_from_json(j.at("agents")) : default_agent_catalog();
    return c;
}

ServiceConfig load_service_config(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw ValidationError("cannot open config file " + path);
    json j;
    try {
        in >> j;
    } catch (const json::parse_error& e) {
        throw ValidationError("invalid JSON in " + path + ": " + e.what());
    }
    return service_config_from_json(j);
}

void apply_env_overrides(ServiceConfig& config) {
    const std::string port = getenv_or("COMPRESSOR_PORT", "");
    if (!port.empty()) {
        char* end = nullptr;
        const long n = std::strtol(port.c_str(), &end, 10);
        if (*end != '\0') throw ValidationError("COMPRESSOR_PORT is not a number: " + port);
        validate_port(n);
        config.port = static_cast<int>(n);
    }
    const std::string engine = getenv_or("COMPRESSOR_ENGINE", "");
    if (!engine.empty()) {
        validate_engine(engine);
        config.engine = engine;
    }
    const std::string limit = getenv_or("COMPRESSOR_CONCURRENCY", "");
    if (!limit.empty()) {
        char* end = nullptr;
        const long n = std::strtol(limit.c_str(), &end, 10);
        if (*end != '\0' || n < 1) throw ValidationError("COMPRESSOR_CONCURRENCY must be a positive integer: " + limit);
        config.queue.concurrency_limit = static_cast<std::size_t>(n);
    }
    const std::string level = getenv_or("COMPRESSOR_LOG_LEVEL", "");
    if (!level.empty()) config.log_level = log_level_from_string(level, config.log_level);
}
