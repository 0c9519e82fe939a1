#include "../include/job.hpp"
#include "../../../shared/cpp/common/include/errors.hpp"
#include "../../../shared/cpp/common/include/util.hpp"
#include <stdexcept>

using json = nlohmann::json;

const char* job_priority_name(JobPriority priority) {
    switch (priority) {
        case JobPriority::low: return "low";
        case JobPriority::normal: return "normal";
        case JobPriority::high: return "high";
        case JobPriority::critical: return "critical";
    }
    return "normal";
}

std::optional<JobPriority> job_priority_from_name(const std::string& name) {
    if (name == "low") return JobPriority::low;
    if (name == "normal") return JobPriority::normal;
    if (name == "high") return JobPriority::high;
    if (name == "critical") return JobPriority::critical;
    return std::nullopt;
}

const char* job_status_name(JobStatus status) {
    switch (status) {
        case JobStatus::queued: return "queued";
        case JobStatus::running: return "running";
        case JobStatus::paused: return "paused";
        case JobStatus::completed: return "completed";
        case JobStatus::failed: return "failed";
        case JobStatus::cancelled: return "cancelled";
    }
    return "queued";
}

std::optional<JobStatus> job_status_from_name(const std::string& name) {
    for (auto s : {JobStatus::queued, JobStatus::running, JobStatus::paused,
                   JobStatus::completed, JobStatus::failed, JobStatus::cancelled}) {
        if (name == job_status_name(s)) return s;
    }
    return std::nullopt;
}

bool is_terminal(JobStatus status) {
    return status == JobStatus::completed || status == JobStatus::failed || status == JobStatus::cancelled;
}

bool can_transition(JobStatus from, JobStatus to) {
    switch (from) {
        case JobStatus::queued:
            return to == JobStatus::running || to == JobStatus::cancelled;
        case JobStatus::running:
            return to == JobStatus::paused || to == JobStatus::completed ||
                   to == JobStatus::failed || to == JobStatus::cancelled;
        case JobStatus::paused:
            return to == JobStatus::running || to == JobStatus::cancelled;
        case JobStatus::completed:
        case JobStatus::failed:
        case JobStatus::cancelled:
            return false;
    }
    return false;
}

void transition(Job& job, JobStatus to) {
    if (!can_transition(job.status, to)) {
        throw InvalidTransition("job " + job.id + ": " + job_status_name(job.status) + " -> " +
                                job_status_name(to) + " not allowed");
    }
    job.status = to;
}

std::string default_output_path(JobType type, const std::string& input_path) {
    switch (type) {
        case JobType::compress:
            return input_path + ".gz";
        case JobType::decompress: {
            const std::string ext = ".gz";
            if (input_path.size() > ext.size() &&
                input_path.compare(input_path.size() - ext.size(), ext.size(), ext) == 0) {
                return input_path.substr(0, input_path.size() - ext.size());
            }
            return input_path + ".out";
        }
        case JobType::verify:
        case JobType::compress_data:
        case JobType::decompress_data:
            return std::string();
    }
    return std::string();
}

std::string default_capability(JobType type) {
    switch (type) {
        case JobType::compress_data: return job_type_name(JobType::compress);
        case JobType::decompress_data: return job_type_name(JobType::decompress);
        default: return job_type_name(type);
    }
}

json job_to_json(const Job& job) {
    auto ts = [](const std::optional<std::chrono::system_clock::time_point>& tp) {
        return tp ? json(format_timestamp(*tp)) : json(nullptr);
    };
    json result = nullptr;
    if (job.result) {
        result = {
            {"original_size", job.result->original_size},
            {"output_size", job.result->output_size},
            {"compression_ratio", job.result->compression_ratio},
            {"elapsed_seconds", job.result->elapsed_seconds}
        };
    }
    return json{
        {"id", job.id},
        {"job_type", job_type_name(job.type)},
        {"priority", job_priority_name(job.priority)},
        {"status", job_status_name(job.status)},
        {"capability", job.capability},
        {"config", {
            {"level", job.config.level},
            {"input_path", job.config.input_path},
            {"output_path", job.config.output_path},
            {"input_bytes", job.config.input_data ? json(job.config.input_data->size()) : json(nullptr)},
            {"options", job.config.options}
        }},
        {"progress", {
            {"percent", job.progress.percent},
            {"bytes_processed", job.progress.bytes_processed},
            {"bytes_total", job.progress.bytes_total},
            {"current_ratio", job.progress.current_ratio},
            {"phase", job.progress.phase},
            {"estimated_completion", ts(job.progress.estimated_completion)}
        }},
        {"created_at", format_timestamp(job.created_at)},
        {"started_at", ts(job.started_at)},
        {"finished_at", ts(job.finished_at)},
        {"agent_id", job.agent_id.empty() ? json(nullptr) : json(job.agent_id)},
        {"error", job.error ? json(*job.error) : json(nullptr)},
        {"result", result},
        {"output_available", job.output_data != nullptr},
        {"user_id", job.user_id.empty() ? json(nullptr) : json(job.user_id)},
        {"tags", job.tags}
    };
}

std::pair<JobRequest, JobPriority> job_request_from_json(const json& j) {
    if (!j.is_object()) throw ValidationError("request body must be a JSON object");
    JobRequest req;
    JobPriority priority = JobPriority::normal;
    try {
        const auto type_name = j.value("job_type", std::string("compress"));
        auto type = job_type_from_name(type_name);
        if (!type) throw ValidationError("unknown job_type '" + type_name + "'");
        req.type = *type;

        const auto priority_name = j.value("priority", std::string("normal"));
        auto p = job_priority_from_name(priority_name);
        if (!p) throw ValidationError("unknown priority '" + priority_name + "'");
        priority = *p;

        req.capability = j.value("capability", std::string());
        req.timeout = std::chrono::milliseconds(j.value("timeout_ms", 0LL));
        req.user_id = j.value("user_id", std::string());
        if (j.contains("tags")) req.tags = j.at("tags").get<std::map<std::string, std::string>>();

        const json cfg = j.value("config", json::object());
        req.config.level = cfg.value("level", 6);
        req.config.input_path = cfg.value("input_path", std::string());
        req.config.output_path = cfg.value("output_path", std::string());
        if (cfg.contains("options")) req.config.options = cfg.at("options").get<std::map<std::string, std::string>>();
    } catch (const json::exception& e) {
        throw ValidationError(std::string("malformed job request: ") + e.what());
    }
    return {req, priority};
}

namespace {
long long param_int(const std::map<std::string, std::string>& params, const std::string& key, long long def) {
    auto it = params.find(key);
    if (it == params.end() || it->second.empty()) return def;
    try {
        std::size_t used = 0;
        long long v = std::stoll(it->second, &used);
        if (used != it->second.size()) throw std::invalid_argument(key);
        return v;
    } catch (const std::exception&) {
        throw ValidationError(key + " must be an integer, got '" + it->second + "'");
    }
}

std::string param_or(const std::map<std::string, std::string>& params, const std::string& key, const std::string& def) {
    auto it = params.find(key);
    return it == params.end() || it->second.empty() ? def : it->second;
}
}

std::pair<JobRequest, JobPriority> data_job_request_from_params(const std::map<std::string, std::string>& params,
                                                                std::string body) {
    JobRequest req;
    const auto type_name = param_or(params, "job_type", "compress_data");
    auto type = job_type_from_name(type_name);
    if (!type || !is_data_job(*type)) throw ValidationError("job_type must be compress_data or decompress_data");
    req.type = *type;

    const auto priority_name = param_or(params, "priority", "normal");
    auto priority = job_priority_from_name(priority_name);
    if (!priority) throw ValidationError("unknown priority '" + priority_name + "'");

    const long long level = param_int(params, "level", 6);
    if (level < 0 || level > 9) throw ValidationError("level must be between 0 and 9, got " + std::to_string(level));
    req.config.level = static_cast<int>(level);
    req.capability = param_or(params, "capability", "");
    req.timeout = std::chrono::milliseconds(param_int(params, "timeout_ms", 0));
    req.user_id = param_or(params, "user_id", "");
    req.config.input_data = std::make_shared<std::string>(std::move(body));
    return {req, *priority};
}
