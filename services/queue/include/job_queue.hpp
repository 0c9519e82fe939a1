#pragma once
#include "job.hpp"
#include "priority_queue.hpp"
#include "../../engine/include/engine_adapter.hpp"
#include "../../events/include/event_emitter.hpp"
#include "../../swarm/include/agent_swarm.hpp"
#include "../../../shared/cpp/common/include/util.hpp"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

struct QueueConfig {
    std::size_t concurrency_limit{4};            // running + paused jobs
    std::chrono::milliseconds poll_interval{100};
    std::chrono::milliseconds progress_coalesce{250};
    std::chrono::milliseconds default_task_timeout{0};  // 0 = no deadline
    std::size_t max_finished_jobs{1000};
    SteadyClockFn clock;                         // defaults to the steady clock
};

struct QueueStats {
    std::map<JobStatus, std::size_t> by_status;
    std::map<JobPriority, std::size_t> queued_by_priority;
    std::size_t active{0};
    std::size_t queued{0};
    std::size_t total{0};
    std::size_t concurrency_limit{0};
};

nlohmann::json stats_to_json(const QueueStats& stats);

// Owns every Job and drives it through an engine on an agent from the swarm.
//
// All job state lives under one mutex. Engine polls happen outside it, and
// engine handles are released outside it because release may block. tick()
// is what the scheduler thread runs; tests may call it directly instead of
// start()ing the thread.
class JobQueue {
public:
    JobQueue(QueueConfig config, std::shared_ptr<AgentSwarm> swarm, std::shared_ptr<EngineAdapter> engine,
             std::shared_ptr<EventEmitter> emitter = nullptr);
    ~JobQueue();

    JobQueue(const JobQueue&) = delete;
    JobQueue& operator=(const JobQueue&) = delete;

    void start();
    void stop();

    // Throws ValidationError; nothing is created on failure.
    std::string submit(const JobRequest& request, JobPriority priority = JobPriority::normal);
    // Throw NotFoundError for unknown ids and InvalidStateError when the job's state does not allow it.
    void cancel(const std::string& job_id);
    void pause(const std::string& job_id);
    void resume(const std::string& job_id);

    std::optional<Job> get(const std::string& job_id) const;
    // Newest first; limit 0 means all. An empty user_id matches every job.
    std::vector<Job> list(std::optional<JobStatus> status = std::nullopt, std::size_t limit = 100,
                          const std::string& user_id = std::string()) const;
    QueueStats stats() const;
    std::size_t queued_count() const;
    std::size_t size() const;

    void tick();
    // Returns false when the update was ignored (unknown or no longer running job).
    bool ingest_progress(const std::string& job_id, const EngineProgress& progress);
    void wake();

    const QueueConfig& config() const { return config_; }

private:
    struct ActiveRun {
        EngineHandle handle{0};
        Task task;
        SteadyClock::time_point started{};
        std::optional<SteadyClock::time_point> paused_since;
        SteadyClock::duration paused_total{};
        std::optional<SteadyClock::time_point> last_emit;
        double emitted_percent{-1.0};
        bool emitted_final{false};
    };

    Job& find_locked(const std::string& job_id);
    bool ingest_locked(Job& job, ActiveRun& run, const EngineProgress& progress);
    void finish_locked(Job& job, const EnginePoll& result);
    void fail_locked(Job& job, const std::string& error);
    void retire_locked(Job& job);
    void release_agent_locked(const Job& job, TaskOutcome outcome);
    void cancel_engine_locked(EngineHandle handle);
    void schedule_locked();
    void release_retired();
    double active_seconds(const ActiveRun& run) const;
    void run_loop();
    SteadyClock::time_point now() const { return config_.clock(); }

    QueueConfig config_;
    std::shared_ptr<AgentSwarm> swarm_;
    std::shared_ptr<EngineAdapter> engine_;
    std::shared_ptr<EventEmitter> emitter_;
    int listener_id_{0};

    mutable std::mutex mtx_;
    std::unordered_map<std::string, Job> jobs_;
    std::unordered_map<std::string, ActiveRun> active_;
    InMemoryPriorityQueue pending_;
    std::deque<std::string> finished_;
    std::vector<EngineHandle> retired_;
    std::uint64_t submit_counter_{0};

    std::mutex wake_mtx_;
    std::condition_variable wake_cv_;
    bool woken_{false};
    bool stopping_{false};
    std::thread thread_;
};
