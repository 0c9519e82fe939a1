#include "../include/stub_engine.hpp"
#include "../../../shared/cpp/common/include/errors.hpp"
#include "../../../shared/cpp/common/include/log.hpp"
#include <algorithm>

namespace {
std::string option_or(const CompressionConfig& c, const std::string& key, const std::string& def) {
    auto it = c.options.find(key);
    return it == c.options.end() ? def : it->second;
}

std::string describe(JobType type, const CompressionConfig& c) {
    if (!is_data_job(type)) return c.input_path;
    return std::to_string(c.input_data ? c.input_data->size() : 0) + " byte buffer";
}
}

StubEngine::StubEngine(StubEngineOptions options) : options_(std::move(options)) {
    if (!options_.clock) options_.clock = steady_clock_fn();
}

EngineHandle StubEngine::start(JobType type, const CompressionConfig& config) {
    if (option_or(config, "stub.reject", "false") == "true") {
        throw EngineError("stub engine rejected " + describe(type, config));
    }
    Run run;
    run.type = type;
    const std::uint64_t default_bytes = is_data_job(type) && config.input_data
        ? config.input_data->size()
        : options_.simulated_bytes;
    try {
        run.duration = std::chrono::milliseconds(
            std::stoll(option_or(config, "stub.duration_ms", std::to_string(options_.duration.count()))));
        run.bytes_total = std::stoull(option_or(config, "stub.bytes", std::to_string(default_bytes)));
        auto fail_at = option_or(config, "stub.fail_at_percent", "");
        if (!fail_at.empty()) run.fail_at = std::stod(fail_at);
    } catch (const std::exception& e) {
        throw EngineError(std::string("invalid stub option: ") + e.what());
    }
    run.fail_message = option_or(config, "stub.fail_message", "simulated engine failure");
    run.resumed_at = now();

    std::lock_guard<std::mutex> lock(mtx_);
    EngineHandle h = next_handle_++;
    runs_.emplace(h, run);
    log_debug("engine", "stub run " + std::to_string(h) + " started for " + describe(type, config));
    return h;
}

StubEngine::Run& StubEngine::find(EngineHandle handle) {
    auto it = runs_.find(handle);
    if (it == runs_.end()) throw EngineError("unknown engine handle " + std::to_string(handle));
    return it->second;
}

EnginePoll StubEngine::poll(EngineHandle handle) {
    std::lock_guard<std::mutex> lock(mtx_);
    Run& run = find(handle);

    auto elapsed = run.consumed;
    if (!run.paused) elapsed += now() - run.resumed_at;
    double pct = 100.0;
    if (run.duration.count() > 0) {
        pct = std::min(100.0, 100.0 * to_seconds(elapsed) / to_seconds(run.duration));
    }

    EnginePoll out;
    if (run.fail_at && pct >= *run.fail_at) pct = *run.fail_at;
    out.progress.percent = pct;
    out.progress.bytes_total = run.bytes_total;
    out.progress.bytes_processed = static_cast<std::uint64_t>(run.bytes_total * (pct / 100.0));
    const bool compressing = run.type == JobType::compress || run.type == JobType::compress_data;
    out.progress.current_ratio = compressing ? options_.ratio : 1.0;
    out.progress.phase = run.type == JobType::verify ? "verifying" : "processing";

    if (run.cancelled) {
        out.outcome = EngineOutcome::cancelled;
        out.progress.phase = "cancelled";
    } else if (run.fail_at && pct >= *run.fail_at) {
        out.outcome = EngineOutcome::failed;
        out.error = run.fail_message;
        out.progress.phase = "error";
    } else if (pct >= 100.0) {
        out.outcome = EngineOutcome::completed;
        out.progress.phase = "complete";
        out.output_bytes = run.type == JobType::verify
            ? 0
            : static_cast<std::uint64_t>(run.bytes_total * out.progress.current_ratio);
        if (is_data_job(run.type)) {
            out.output_data = std::make_shared<std::string>(out.output_bytes, '\0');
        }
    }
    return out;
}

void StubEngine::cancel(EngineHandle handle) {
    std::lock_guard<std::mutex> lock(mtx_);
    find(handle).cancelled = true;
}

void StubEngine::suspend(EngineHandle handle) {
    std::lock_guard<std::mutex> lock(mtx_);
    Run& run = find(handle);
    if (run.paused) return;
    run.consumed += now() - run.resumed_at;
    run.paused = true;
}

void StubEngine::resume(EngineHandle handle) {
    std::lock_guard<std::mutex> lock(mtx_);
    Run& run = find(handle);
    if (!run.paused) return;
    run.paused = false;
    run.resumed_at = now();
}

void StubEngine::release(EngineHandle handle) {
    std::lock_guard<std::mutex> lock(mtx_);
    runs_.erase(handle);
}

std::size_t StubEngine::active_runs() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return runs_.size();
}
