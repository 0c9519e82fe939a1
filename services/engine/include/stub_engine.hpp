#pragma once
#include "engine_adapter.hpp"
#include "../../../shared/cpp/common/include/util.hpp"
#include <chrono>
#include <mutex>
#include <unordered_map>

struct StubEngineOptions {
    std::chrono::milliseconds duration{2000};
    std::uint64_t simulated_bytes{64ull * 1024 * 1024};
    double ratio{0.42};
    SteadyClockFn clock;  // defaults to the steady clock
};

// Simulates a run whose progress grows linearly with elapsed (unpaused) time.
// Data runs default to the buffer size and complete with a zero-filled output
// of the simulated compressed size.
// Per-job overrides through CompressionConfig::options:
//   stub.duration_ms, stub.bytes, stub.fail_at_percent, stub.fail_message, stub.reject
class StubEngine : public EngineAdapter {
public:
    explicit StubEngine(StubEngineOptions options = {});

    std::string name() const override { return "stub"; }
    EngineHandle start(JobType type, const CompressionConfig& config) override;
    EnginePoll poll(EngineHandle handle) override;
    void cancel(EngineHandle handle) override;
    void suspend(EngineHandle handle) override;
    void resume(EngineHandle handle) override;
    void release(EngineHandle handle) override;

    std::size_t active_runs() const;

private:
    struct Run {
        JobType type{JobType::compress};
        SteadyClock::time_point resumed_at{};
        SteadyClock::duration consumed{};
        std::chrono::milliseconds duration{};
        std::uint64_t bytes_total{0};
        std::optional<double> fail_at;
        std::string fail_message;
        bool paused{false};
        bool cancelled{false};
    };

    Run& find(EngineHandle handle);
    SteadyClock::time_point now() const { return options_.clock(); }

    StubEngineOptions options_;
    mutable std::mutex mtx_;
    std::unordered_map<EngineHandle, Run> runs_;
    EngineHandle next_handle_{1};
};
