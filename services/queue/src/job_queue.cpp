#include "../include/job_queue.hpp"
#include "../../../shared/cpp/common/include/errors.hpp"
#include "../../../shared/cpp/common/include/log.hpp"
#include <algorithm>
#include <set>

using json = nlohmann::json;

json stats_to_json(const QueueStats& stats) {
    json by_status = json::object();
    for (const auto& kv : stats.by_status) by_status[job_status_name(kv.first)] = kv.second;
    json by_priority = json::object();
    for (const auto& kv : stats.queued_by_priority) by_priority[job_priority_name(kv.first)] = kv.second;
    return json{
        {"by_status", by_status},
        {"queued_by_priority", by_priority},
        {"active", stats.active},
        {"queued", stats.queued},
        {"total", stats.total},
        {"concurrency_limit", stats.concurrency_limit}
    };
}

JobQueue::JobQueue(QueueConfig config, std::shared_ptr<AgentSwarm> swarm, std::shared_ptr<EngineAdapter> engine,
                   std::shared_ptr<EventEmitter> emitter)
    : config_(std::move(config)), swarm_(std::move(swarm)), engine_(std::move(engine)), emitter_(std::move(emitter)) {
    if (!swarm_ || !engine_) throw ValidationError("job queue needs an agent swarm and an engine");
    if (config_.concurrency_limit == 0) throw ValidationError("concurrency_limit must be positive");
    if (config_.max_finished_jobs == 0) config_.max_finished_jobs = 1;
    if (!config_.clock) config_.clock = steady_clock_fn();
    if (!emitter_) emitter_ = get_default_emitter();
    listener_id_ = swarm_->add_availability_listener([this] { wake(); });
}

JobQueue::~JobQueue() {
    stop();
    swarm_->remove_availability_listener(listener_id_);
    {
        std::lock_guard<std::mutex> lock(mtx_);
        for (auto& kv : active_) {
            cancel_engine_locked(kv.second.handle);
            retired_.push_back(kv.second.handle);
            release_agent_locked(jobs_.at(kv.first), TaskOutcome::cancelled);
        }
        if (!active_.empty()) log_warn("queue", "abandoned " + std::to_string(active_.size()) + " active job(s) on shutdown");
        active_.clear();
    }
    release_retired();
}

void JobQueue::start() {
    if (thread_.joinable()) return;
    {
        std::lock_guard<std::mutex> lock(wake_mtx_);
        stopping_ = false;
        woken_ = false;
    }
    thread_ = std::thread(&JobQueue::run_loop, this);
}

void JobQueue::stop() {
    {
        std::lock_guard<std::mutex> lock(wake_mtx_);
        stopping_ = true;
    }
    wake_cv_.notify_all();
    if (thread_.joinable()) thread_.join();
}

void JobQueue::wake() {
    {
        std::lock_guard<std::mutex> lock(wake_mtx_);
        woken_ = true;
    }
    wake_cv_.notify_one();
}

void JobQueue::run_loop() {
    log_info("queue", "scheduler started (limit " + std::to_string(config_.concurrency_limit) + ", poll " +
             std::to_string(config_.poll_interval.count()) + "ms, engine " + engine_->name() + ")");
    for (;;) {
        try {
            tick();
        } catch (const std::exception& e) {
            log_error("queue", std::string("scheduler tick failed: ") + e.what());
        }
        std::unique_lock<std::mutex> lock(wake_mtx_);
        wake_cv_.wait_for(lock, config_.poll_interval, [this] { return stopping_ || woken_; });
        if (stopping_) break;
        woken_ = false;
    }
    log_info("queue", "scheduler stopped");
}

std::string JobQueue::submit(const JobRequest& request, JobPriority priority) {
    const bool data_job = is_data_job(request.type);
    if (data_job) {
        if (!request.config.input_data || request.config.input_data->empty()) {
            throw ValidationError("input data is required for " + std::string(job_type_name(request.type)));
        }
    } else if (request.config.input_path.empty()) {
        throw ValidationError("input_path is required");
    }
    if (request.config.level < 0 || request.config.level > 9) {
        throw ValidationError("level must be between 0 and 9, got " + std::to_string(request.config.level));
    }
    if (request.timeout.count() < 0) throw ValidationError("timeout must not be negative");
    const std::string capability = request.capability.empty() ? default_capability(request.type) : request.capability;
    if (!swarm_->supports(capability)) throw ValidationError("no agent offers capability '" + capability + "'");

    Job job;
    job.id = generate_id();
    job.type = request.type;
    job.priority = priority;
    job.config = request.config;
    if (data_job) {
        job.config.input_path.clear();
        job.config.output_path.clear();
        job.progress.bytes_total = job.config.input_data->size();
    } else if (job.type == JobType::verify) {
        job.config.input_data.reset();
        job.config.output_path.clear();
    } else {
        job.config.input_data.reset();
        if (job.config.output_path.empty()) job.config.output_path = default_output_path(job.type, job.config.input_path);
    }
    if (!job.config.output_path.empty() && job.config.output_path == job.config.input_path) {
        throw ValidationError("output_path must differ from input_path");
    }
    job.capability = capability;
    job.created_at = std::chrono::system_clock::now();
    job.user_id = request.user_id;
    job.tags = request.tags;
    job.task_timeout = request.timeout.count() > 0 ? request.timeout : config_.default_task_timeout;

    {
        std::lock_guard<std::mutex> lock(mtx_);
        job.submit_order = ++submit_counter_;
        pending_.enqueue(PendingEntry{job.id, job.capability, job.priority});
        emitter_->publish(EventType::job_queued, job.id, "", json{
            {"job_type", job_type_name(job.type)},
            {"priority", job_priority_name(job.priority)},
            {"capability", job.capability},
            {"level", job.config.level},
            {"input_path", job.config.input_path},
            {"output_path", job.config.output_path},
            {"input_bytes", data_job ? json(job.progress.bytes_total) : json(nullptr)},
            {"user_id", job.user_id.empty() ? json(nullptr) : json(job.user_id)}
        });
        jobs_.emplace(job.id, job);
    }
    const std::string source = data_job ? std::to_string(job.progress.bytes_total) + " bytes" : job.config.input_path;
    log_info("queue", "queued " + std::string(job_type_name(job.type)) + " job " + job.id + " (" +
             job_priority_name(priority) + ", " + source + ")");
    wake();
    return job.id;
}

void JobQueue::cancel(const std::string& job_id) {
    bool freed_slot = false;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        Job& job = find_locked(job_id);
        if (is_terminal(job.status)) {
            throw InvalidStateError("job " + job_id + " is already " + job_status_name(job.status));
        }
        const JobStatus previous = job.status;
        if (previous == JobStatus::queued) {
            pending_.remove(job_id);
        } else {
            cancel_engine_locked(active_.at(job_id).handle);
            release_agent_locked(job, TaskOutcome::cancelled);
            freed_slot = true;
        }
        transition(job, JobStatus::cancelled);
        job.finished_at = std::chrono::system_clock::now();
        job.progress.phase = "cancelled";
        emitter_->publish(EventType::job_cancelled, job.id, job.agent_id, json{
            {"reason", "user_request"},
            {"previous_status", job_status_name(previous)}
        });
        log_info("queue", "cancelled job " + job_id + " (was " + job_status_name(previous) + ")");
        retire_locked(job);
    }
    if (freed_slot) wake();
}

void JobQueue::pause(const std::string& job_id) {
    std::lock_guard<std::mutex> lock(mtx_);
    Job& job = find_locked(job_id);
    if (job.status != JobStatus::running) {
        throw InvalidStateError("job " + job_id + " is " + job_status_name(job.status) + ", not running");
    }
    ActiveRun& run = active_.at(job_id);
    engine_->suspend(run.handle);
    transition(job, JobStatus::paused);
    run.paused_since = now();
    emitter_->publish(EventType::job_paused, job.id, job.agent_id, json{{"percent", job.progress.percent}});
    log_info("queue", "paused job " + job_id);
}

void JobQueue::resume(const std::string& job_id) {
    std::lock_guard<std::mutex> lock(mtx_);
    Job& job = find_locked(job_id);
    if (job.status != JobStatus::paused) {
        throw InvalidStateError("job " + job_id + " is " + job_status_name(job.status) + ", not paused");
    }
    ActiveRun& run = active_.at(job_id);
    engine_->resume(run.handle);
    transition(job, JobStatus::running);
    if (run.paused_since) {
        const auto paused_for = now() - *run.paused_since;
        run.paused_total += paused_for;
        if (run.task.deadline) *run.task.deadline += paused_for;
        run.paused_since.reset();
    }
    emitter_->publish(EventType::job_resumed, job.id, job.agent_id, json{{"percent", job.progress.percent}});
    log_info("queue", "resumed job " + job_id);
}

std::optional<Job> JobQueue::get(const std::string& job_id) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = jobs_.find(job_id);
    if (it == jobs_.end()) return std::nullopt;
    return it->second;
}

std::vector<Job> JobQueue::list(std::optional<JobStatus> status, std::size_t limit, const std::string& user_id) const {
    std::vector<Job> out;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        for (const auto& kv : jobs_) {
            if (status && kv.second.status != *status) continue;
            if (!user_id.empty() && kv.second.user_id != user_id) continue;
            out.push_back(kv.second);
        }
    }
    std::sort(out.begin(), out.end(), [](const Job& a, const Job& b) { return a.submit_order > b.submit_order; });
    if (limit > 0 && out.size() > limit) out.resize(limit);
    return out;
}

QueueStats JobQueue::stats() const {
    QueueStats s;
    for (auto st : {JobStatus::queued, JobStatus::running, JobStatus::paused,
                    JobStatus::completed, JobStatus::failed, JobStatus::cancelled}) {
        s.by_status[st] = 0;
    }
    std::lock_guard<std::mutex> lock(mtx_);
    for (auto p : {JobPriority::critical, JobPriority::high, JobPriority::normal, JobPriority::low}) {
        s.queued_by_priority[p] = pending_.size(p);
    }
    for (const auto& kv : jobs_) ++s.by_status[kv.second.status];
    s.active = active_.size();
    s.queued = pending_.size();
    s.total = jobs_.size();
    s.concurrency_limit = config_.concurrency_limit;
    return s;
}

std::size_t JobQueue::queued_count() const {
    return pending_.size();
}

std::size_t JobQueue::size() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return jobs_.size();
}

bool JobQueue::ingest_progress(const std::string& job_id, const EngineProgress& progress) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = jobs_.find(job_id);
    if (it == jobs_.end()) {
        log_warn("queue", "progress for unknown job " + job_id + " ignored");
        return false;
    }
    Job& job = it->second;
    if (job.status != JobStatus::running) {
        log_warn("queue", "progress for " + std::string(job_status_name(job.status)) + " job " + job_id + " ignored");
        return false;
    }
    return ingest_locked(job, active_.at(job_id), progress);
}

void JobQueue::tick() {
    release_retired();
    // idle swarms never call acquire, so cooldowns are also applied here
    swarm_->recover_degraded();

    struct Polled {
        std::string job_id;
        EngineHandle handle;
        EnginePoll result;
    };
    std::vector<Polled> polled;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        for (const auto& kv : active_) {
            if (jobs_.at(kv.first).status == JobStatus::running) polled.push_back({kv.first, kv.second.handle, {}});
        }
    }

    for (auto& p : polled) {
        try {
            p.result = engine_->poll(p.handle);
        } catch (const std::exception& e) {
            p.result.outcome = EngineOutcome::failed;
            p.result.error = e.what();
        }
    }

    {
        std::lock_guard<std::mutex> lock(mtx_);
        for (const auto& p : polled) {
            auto run = active_.find(p.job_id);
            // cancelled or paused while we were polling
            if (run == active_.end() || run->second.handle != p.handle) continue;
            Job& job = jobs_.at(p.job_id);
            if (job.status != JobStatus::running) continue;

            if (p.result.outcome != EngineOutcome::running) {
                finish_locked(job, p.result);
                continue;
            }
            ingest_locked(job, run->second, p.result.progress);

            const auto& deadline = run->second.task.deadline;
            if (deadline && now() >= *deadline) {
                cancel_engine_locked(p.handle);
                log_warn("queue", "job " + job.id + " exceeded its " +
                         std::to_string(job.task_timeout.count()) + "ms timeout");
                fail_locked(job, "task timed out after " + std::to_string(job.task_timeout.count()) + " ms");
            }
        }
        schedule_locked();
    }

    release_retired();
}

Job& JobQueue::find_locked(const std::string& job_id) {
    auto it = jobs_.find(job_id);
    if (it == jobs_.end()) throw NotFoundError("job " + job_id + " not found");
    return it->second;
}

bool JobQueue::ingest_locked(Job& job, ActiveRun& run, const EngineProgress& progress) {
    auto& p = job.progress;
    p.percent = std::min(100.0, std::max(p.percent, progress.percent));
    p.bytes_processed = std::max(p.bytes_processed, progress.bytes_processed);
    p.bytes_total = std::max(p.bytes_total, progress.bytes_total);
    if (progress.current_ratio > 0.0) p.current_ratio = progress.current_ratio;
    if (!progress.phase.empty()) p.phase = progress.phase;

    const auto wall_now = std::chrono::system_clock::now();
    json eta = nullptr;
    if (p.percent >= 100.0) {
        p.estimated_completion = wall_now;
        eta = 0.0;
    } else if (p.percent > 0.0) {
        const double remaining = active_seconds(run) * (100.0 - p.percent) / p.percent;
        p.estimated_completion = wall_now + std::chrono::duration_cast<std::chrono::system_clock::duration>(
                                                std::chrono::duration<double>(remaining));
        eta = remaining;
    }

    const bool final = p.percent >= 100.0;
    if (final) {
        if (run.emitted_final) return true;
    } else {
        if (p.percent == run.emitted_percent) return true;
        if (run.last_emit && now() - *run.last_emit < config_.progress_coalesce) return true;
    }
    run.last_emit = now();
    run.emitted_percent = p.percent;
    run.emitted_final = final;
    emitter_->publish(EventType::progress_updated, job.id, job.agent_id, json{
        {"percent", p.percent},
        {"bytes_processed", p.bytes_processed},
        {"bytes_total", p.bytes_total},
        {"current_ratio", p.current_ratio},
        {"phase", p.phase},
        {"eta_seconds", eta}
    });
    return true;
}

void JobQueue::finish_locked(Job& job, const EnginePoll& result) {
    switch (result.outcome) {
        case EngineOutcome::completed: {
            EngineProgress final_progress = result.progress;
            final_progress.percent = 100.0;
            final_progress.phase = "complete";
            ActiveRun& run = active_.at(job.id);
            ingest_locked(job, run, final_progress);

            transition(job, JobStatus::completed);
            job.finished_at = std::chrono::system_clock::now();
            JobResult r;
            r.original_size = job.progress.bytes_total;
            r.output_size = result.output_bytes;
            r.compression_ratio = job.progress.current_ratio;
            r.elapsed_seconds = to_seconds(now() - run.started);
            job.result = r;
            job.output_data = result.output_data;
            release_agent_locked(job, TaskOutcome::success);
            emitter_->publish(EventType::job_completed, job.id, job.agent_id, json{
                {"original_size", r.original_size},
                {"output_size", r.output_size},
                {"compression_ratio", r.compression_ratio},
                {"elapsed_seconds", r.elapsed_seconds},
                {"output_path", job.config.output_path}
            });
            log_info("queue", "completed job " + job.id + " on " + job.agent_id + " in " +
                     std::to_string(r.elapsed_seconds) + "s");
            retire_locked(job);
            break;
        }
        case EngineOutcome::failed:
            fail_locked(job, result.error.empty() ? "engine reported failure" : result.error);
            break;
        case EngineOutcome::cancelled: {
            const JobStatus previous = job.status;
            transition(job, JobStatus::cancelled);
            job.finished_at = std::chrono::system_clock::now();
            job.progress.phase = "cancelled";
            release_agent_locked(job, TaskOutcome::cancelled);
            emitter_->publish(EventType::job_cancelled, job.id, job.agent_id, json{
                {"reason", "engine"},
                {"previous_status", job_status_name(previous)}
            });
            log_warn("queue", "engine cancelled job " + job.id);
            retire_locked(job);
            break;
        }
        case EngineOutcome::running:
            break;
    }
}

void JobQueue::fail_locked(Job& job, const std::string& error) {
    transition(job, JobStatus::failed);
    job.finished_at = std::chrono::system_clock::now();
    job.error = error;
    job.progress.phase = "error";
    double elapsed = 0.0;
    auto run = active_.find(job.id);
    if (run != active_.end()) elapsed = to_seconds(now() - run->second.started);
    release_agent_locked(job, TaskOutcome::failure);
    emitter_->publish(EventType::job_failed, job.id, job.agent_id, json{
        {"error_detail", error},
        {"elapsed_seconds", elapsed}
    });
    log_error("queue", "job " + job.id + " failed: " + error);
    retire_locked(job);
}

// Must be the last thing done with `job`: retention may erase it.
void JobQueue::retire_locked(Job& job) {
    auto run = active_.find(job.id);
    if (run != active_.end()) {
        retired_.push_back(run->second.handle);
        active_.erase(run);
    }
    finished_.push_back(job.id);
    while (finished_.size() > config_.max_finished_jobs) {
        jobs_.erase(finished_.front());
        finished_.pop_front();
    }
}

void JobQueue::release_agent_locked(const Job& job, TaskOutcome outcome) {
    if (job.agent_id.empty()) return;
    try {
        swarm_->release(job.agent_id, outcome);
    } catch (const CompressError& e) {
        log_warn("queue", "releasing agent " + job.agent_id + " for job " + job.id + ": " + e.what());
    }
}

void JobQueue::cancel_engine_locked(EngineHandle handle) {
    try {
        engine_->cancel(handle);
    } catch (const std::exception& e) {
        log_warn("queue", "engine cancel of run " + std::to_string(handle) + " failed: " + e.what());
    }
}

void JobQueue::schedule_locked() {
    std::set<std::string> starved;
    while (active_.size() < config_.concurrency_limit) {
        auto next = pending_.find_first([&](const PendingEntry& e) { return starved.count(e.capability) == 0; });
        if (!next) break;
        Job& job = jobs_.at(next->job_id);

        Task task;
        task.id = generate_id();
        task.job_id = job.id;
        task.capability = job.capability;
        task.timeout = job.task_timeout;

        auto agent_id = swarm_->acquire(task);
        if (!agent_id) {
            // keep FIFO within the capability; other capabilities may still run
            starved.insert(job.capability);
            continue;
        }

        pending_.remove(job.id);
        transition(job, JobStatus::running);
        job.agent_id = *agent_id;
        job.started_at = std::chrono::system_clock::now();
        job.progress.phase = "starting";

        ActiveRun run;
        run.started = now();
        if (task.timeout.count() > 0) task.deadline = run.started + task.timeout;
        run.task = task;

        emitter_->publish(EventType::job_started, job.id, job.agent_id, json{
            {"capability", job.capability},
            {"job_type", job_type_name(job.type)},
            {"task_id", task.id}
        });

        try {
            run.handle = engine_->start(job.type, job.config);
        } catch (const std::exception& e) {
            fail_locked(job, std::string("engine start failed: ") + e.what());
            continue;
        }
        active_.emplace(job.id, std::move(run));
        log_info("queue", "started job " + job.id + " on " + job.agent_id);
    }
}

void JobQueue::release_retired() {
    std::vector<EngineHandle> handles;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        handles.swap(retired_);
    }
    for (auto h : handles) {
        try {
            engine_->release(h);
        } catch (const std::exception& e) {
            log_warn("queue", "engine release of run " + std::to_string(h) + " failed: " + e.what());
        }
    }
}

double JobQueue::active_seconds(const ActiveRun& run) const {
    auto t = now() - run.started - run.paused_total;
    if (run.paused_since) t -= now() - *run.paused_since;
    return to_seconds(t);
}
