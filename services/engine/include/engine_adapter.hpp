#pragma once
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>

// File jobs read input_path; data jobs work on an in-memory buffer.
enum class JobType { compress, decompress, verify, compress_data, decompress_data };

const char* job_type_name(JobType type);
std::optional<JobType> job_type_from_name(const std::string& name);
bool is_data_job(JobType type);

struct CompressionConfig {
    int level{6};              // 0-9
    std::string input_path;
    std::string output_path;   // derived from input_path when empty
    std::shared_ptr<const std::string> input_data;  // data jobs only
    std::map<std::string, std::string> options;
};

struct EngineProgress {
    double percent{0.0};
    std::uint64_t bytes_processed{0};
    std::uint64_t bytes_total{0};
    double current_ratio{1.0};
    std::string phase{"pending"};
};

enum class EngineOutcome { running, completed, failed, cancelled };

struct EnginePoll {
    EngineOutcome outcome{EngineOutcome::running};
    EngineProgress progress;
    std::string error;            // set when outcome == failed
    std::uint64_t output_bytes{0};
    std::shared_ptr<const std::string> output_data;  // completed data jobs
};

using EngineHandle = std::uint64_t;

// Narrow interface to a compression implementation. One handle per started
// run; the caller polls it until a terminal outcome and then releases it.
class EngineAdapter {
public:
    virtual ~EngineAdapter() = default;

    virtual std::string name() const = 0;

    // Throws EngineError when the run cannot be started.
    virtual EngineHandle start(JobType type, const CompressionConfig& config) = 0;
    // Throws EngineError for an unknown handle.
    virtual EnginePoll poll(EngineHandle handle) = 0;
    // Best-effort; the run reports `cancelled` on a later poll.
    virtual void cancel(EngineHandle handle) = 0;
    virtual void suspend(EngineHandle handle) = 0;
    virtual void resume(EngineHandle handle) = 0;
    // Frees the run. May block until a cancelled run has stopped.
    virtual void release(EngineHandle handle) = 0;
};
