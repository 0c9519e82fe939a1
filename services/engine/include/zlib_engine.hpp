#pragma once
#include "engine_adapter.hpp"
#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>

// gzip compression, decompression and integrity checks through zlib, on files
// or on in-memory buffers. Each run owns a worker thread that processes the
// input in chunks and checks the cancel and pause flags between chunks.
class ZlibEngine : public EngineAdapter {
public:
    explicit ZlibEngine(std::size_t chunk_size = 256 * 1024);
    ~ZlibEngine() override;

    ZlibEngine(const ZlibEngine&) = delete;
    ZlibEngine& operator=(const ZlibEngine&) = delete;

    std::string name() const override { return "zlib"; }
    EngineHandle start(JobType type, const CompressionConfig& config) override;
    EnginePoll poll(EngineHandle handle) override;
    void cancel(EngineHandle handle) override;
    void suspend(EngineHandle handle) override;
    void resume(EngineHandle handle) override;
    void release(EngineHandle handle) override;

private:
    struct Run {
        JobType type{JobType::compress};
        CompressionConfig config;
        std::thread worker;

        std::atomic<std::uint64_t> bytes_processed{0};
        std::atomic<std::uint64_t> bytes_total{0};
        std::atomic<std::uint64_t> bytes_written{0};
        std::atomic<bool> cancel_requested{false};

        std::mutex mtx;
        std::condition_variable cv;
        bool paused{false};
        EngineOutcome outcome{EngineOutcome::running};
        std::string error;
        std::shared_ptr<const std::string> output;
    };

    // Fills up to n bytes and returns how many; short only at end of input.
    using ReadFn = std::function<std::size_t(unsigned char*, std::size_t)>;
    using WriteFn = std::function<void(const unsigned char*, std::size_t)>;

    std::shared_ptr<Run> find(EngineHandle handle) const;
    static void execute(Run& run, std::size_t chunk_size);
    static void process_file(Run& run, std::size_t chunk_size);
    static std::shared_ptr<const std::string> process_buffer(Run& run, std::size_t chunk_size);
    static void deflate_stream(Run& run, std::size_t chunk_size, const ReadFn& read, const WriteFn& write);
    static void inflate_stream(Run& run, std::size_t chunk_size, const ReadFn& read, const WriteFn& write);
    // Blocks while paused; returns false once cancellation was requested.
    static bool checkpoint(Run& run);

    std::size_t chunk_size_;
    mutable std::mutex mtx_;
    std::unordered_map<EngineHandle, std::shared_ptr<Run>> runs_;
    EngineHandle next_handle_{1};
};
