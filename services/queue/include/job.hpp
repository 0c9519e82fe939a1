#pragma once
#include "../../engine/include/engine_adapter.hpp"
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <nlohmann/json.hpp>

// Strict total order: critical > high > normal > low.
enum class JobPriority { low = 0, normal = 1, high = 2, critical = 3 };

enum class JobStatus { queued, running, paused, completed, failed, cancelled };

const char* job_priority_name(JobPriority priority);
std::optional<JobPriority> job_priority_from_name(const std::string& name);
const char* job_status_name(JobStatus status);
std::optional<JobStatus> job_status_from_name(const std::string& name);

bool is_terminal(JobStatus status);
bool can_transition(JobStatus from, JobStatus to);

// What a caller asks for; the queue turns it into a Job.
struct JobRequest {
    JobType type{JobType::compress};
    CompressionConfig config;
    std::string capability;                  // defaults to default_capability(type)
    std::chrono::milliseconds timeout{0};    // 0 = queue default
    std::string user_id;                     // optional submitter
    std::map<std::string, std::string> tags;
};

struct JobProgress {
    double percent{0.0};
    std::uint64_t bytes_processed{0};
    std::uint64_t bytes_total{0};
    double current_ratio{1.0};
    std::string phase{"pending"};
    std::optional<std::chrono::system_clock::time_point> estimated_completion;
};

struct JobResult {
    std::uint64_t original_size{0};
    std::uint64_t output_size{0};
    double compression_ratio{1.0};
    double elapsed_seconds{0.0};
};

struct Job {
    std::string id;
    JobType type{JobType::compress};
    JobPriority priority{JobPriority::normal};
    JobStatus status{JobStatus::queued};
    CompressionConfig config;
    std::string capability;
    JobProgress progress;
    std::chrono::system_clock::time_point created_at{};
    std::optional<std::chrono::system_clock::time_point> started_at;
    std::optional<std::chrono::system_clock::time_point> finished_at;
    std::string agent_id;                    // lookup key into the swarm, empty when unassigned
    std::optional<std::string> error;
    std::optional<JobResult> result;
    std::shared_ptr<const std::string> output_data;  // completed data jobs
    std::string user_id;
    std::map<std::string, std::string> tags;
    std::chrono::milliseconds task_timeout{0};
    std::uint64_t submit_order{0};
};

// Moves job to `to` or throws InvalidTransition.
void transition(Job& job, JobStatus to);

// Output path used when the request leaves it empty. Empty for verify and data jobs.
std::string default_output_path(JobType type, const std::string& input_path);

// Data jobs share the capability of their file counterpart.
std::string default_capability(JobType type);

nlohmann::json job_to_json(const Job& job);

// Parses a submit body:
// {"job_type", "priority", "capability", "timeout_ms", "user_id", "tags",
//  "config": {"level", "input_path", "output_path", "options"}}
// Data job buffers do not travel in JSON; the caller attaches config.input_data.
// Throws ValidationError. Range checks on the values are left to JobQueue::submit.
std::pair<JobRequest, JobPriority> job_request_from_json(const nlohmann::json& j);

// Builds a data job from query parameters and a raw request body:
// job_type (compress_data|decompress_data), priority, level, capability, timeout_ms, user_id.
// Throws ValidationError.
std::pair<JobRequest, JobPriority> data_job_request_from_params(const std::map<std::string, std::string>& params,
                                                                std::string body);
