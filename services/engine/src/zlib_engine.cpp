#include "../include/zlib_engine.hpp"
#include "../../../shared/cpp/common/include/errors.hpp"
#include "../../../shared/cpp/common/include/log.hpp"
#include <algorithm>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <vector>
#include <zlib.h>

namespace {
struct CancelledRun {};
}

ZlibEngine::ZlibEngine(std::size_t chunk_size) : chunk_size_(chunk_size == 0 ? 64 * 1024 : chunk_size) {}

ZlibEngine::~ZlibEngine() {
    std::unordered_map<EngineHandle, std::shared_ptr<Run>> runs;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        runs.swap(runs_);
    }
    for (auto& kv : runs) {
        auto& run = *kv.second;
        run.cancel_requested.store(true);
        {
            std::lock_guard<std::mutex> lock(run.mtx);
            run.paused = false;
        }
        run.cv.notify_all();
        if (run.worker.joinable()) run.worker.join();
    }
}

EngineHandle ZlibEngine::start(JobType type, const CompressionConfig& config) {
    std::uintmax_t size = 0;
    if (is_data_job(type)) {
        if (!config.input_data) throw EngineError("no input buffer for " + std::string(job_type_name(type)));
        size = config.input_data->size();
    } else {
        std::error_code ec;
        size = std::filesystem::file_size(config.input_path, ec);
        if (ec) throw EngineError("cannot read " + config.input_path + ": " + ec.message());
        if (type != JobType::verify && config.output_path.empty()) {
            throw EngineError("output path required for " + std::string(job_type_name(type)));
        }
    }

    auto run = std::make_shared<Run>();
    run->type = type;
    run->config = config;
    run->bytes_total.store(size);

    EngineHandle h;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        h = next_handle_++;
        runs_.emplace(h, run);
    }
    try {
        const std::size_t chunk = chunk_size_;
        run->worker = std::thread([run, chunk] { execute(*run, chunk); });
    } catch (const std::system_error& e) {
        std::lock_guard<std::mutex> lock(mtx_);
        runs_.erase(h);
        throw EngineError(std::string("failed to start worker: ") + e.what());
    }
    log_debug("engine", "zlib run " + std::to_string(h) + " " + job_type_name(type) + " " +
              (is_data_job(type) ? std::to_string(size) + " bytes" : config.input_path));
    return h;
}

std::shared_ptr<ZlibEngine::Run> ZlibEngine::find(EngineHandle handle) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = runs_.find(handle);
    if (it == runs_.end()) throw EngineError("unknown engine handle " + std::to_string(handle));
    return it->second;
}

EnginePoll ZlibEngine::poll(EngineHandle handle) {
    auto run = find(handle);
    EnginePoll out;
    const auto processed = run->bytes_processed.load();
    const auto total = run->bytes_total.load();
    const auto written = run->bytes_written.load();

    out.progress.bytes_processed = processed;
    out.progress.bytes_total = total;
    out.progress.percent = total > 0 ? 100.0 * static_cast<double>(processed) / static_cast<double>(total) : 0.0;
    if (processed > 0 && run->type != JobType::verify) {
        out.progress.current_ratio = static_cast<double>(written) / static_cast<double>(processed);
    }

    std::lock_guard<std::mutex> lock(run->mtx);
    out.outcome = run->outcome;
    out.error = run->error;
    switch (run->outcome) {
        case EngineOutcome::running:
            out.progress.phase = run->paused ? "paused" : (run->type == JobType::verify ? "verifying" : "processing");
            break;
        case EngineOutcome::completed:
            out.progress.percent = 100.0;
            out.progress.phase = "complete";
            out.output_bytes = run->type == JobType::verify ? 0 : written;
            out.output_data = run->output;
            break;
        case EngineOutcome::failed:
            out.progress.phase = "error";
            break;
        case EngineOutcome::cancelled:
            out.progress.phase = "cancelled";
            break;
    }
    return out;
}

void ZlibEngine::cancel(EngineHandle handle) {
    auto run = find(handle);
    run->cancel_requested.store(true);
    {
        std::lock_guard<std::mutex> lock(run->mtx);
        run->paused = false;
    }
    run->cv.notify_all();
}

void ZlibEngine::suspend(EngineHandle handle) {
    auto run = find(handle);
    std::lock_guard<std::mutex> lock(run->mtx);
    run->paused = true;
}

void ZlibEngine::resume(EngineHandle handle) {
    auto run = find(handle);
    {
        std::lock_guard<std::mutex> lock(run->mtx);
        run->paused = false;
    }
    run->cv.notify_all();
}

void ZlibEngine::release(EngineHandle handle) {
    std::shared_ptr<Run> run;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = runs_.find(handle);
        if (it == runs_.end()) return;
        run = it->second;
        runs_.erase(it);
    }
    // a released run that is still going is abandoned
    run->cancel_requested.store(true);
    {
        std::lock_guard<std::mutex> lock(run->mtx);
        run->paused = false;
    }
    run->cv.notify_all();
    if (run->worker.joinable()) run->worker.join();
}

bool ZlibEngine::checkpoint(Run& run) {
    std::unique_lock<std::mutex> lock(run.mtx);
    run.cv.wait(lock, [&] { return !run.paused || run.cancel_requested.load(); });
    return !run.cancel_requested.load();
}

void ZlibEngine::execute(Run& run, std::size_t chunk_size) {
    EngineOutcome outcome = EngineOutcome::completed;
    std::string error;
    std::shared_ptr<const std::string> output;
    try {
        if (is_data_job(run.type)) {
            output = process_buffer(run, chunk_size);
        } else {
            process_file(run, chunk_size);
        }
    } catch (const CancelledRun&) {
        outcome = EngineOutcome::cancelled;
    } catch (const std::exception& e) {
        outcome = EngineOutcome::failed;
        error = e.what();
    }

    const bool writes_file = !is_data_job(run.type) && run.type != JobType::verify;
    if (outcome != EngineOutcome::completed && writes_file) {
        std::error_code ec;
        std::filesystem::remove(run.config.output_path, ec);
    }

    std::lock_guard<std::mutex> lock(run.mtx);
    run.outcome = outcome;
    run.error = error;
    if (outcome == EngineOutcome::completed) run.output = std::move(output);
}

void ZlibEngine::process_file(Run& run, std::size_t chunk_size) {
    const std::string& in_path = run.config.input_path;
    const std::string& out_path = run.config.output_path;
    std::ifstream in(in_path, std::ios::binary);
    if (!in) throw EngineError("cannot open " + in_path);
    const bool write_output = run.type != JobType::verify;
    std::ofstream out;
    if (write_output) {
        out.open(out_path, std::ios::binary | std::ios::trunc);
        if (!out) throw EngineError("cannot create " + out_path);
    }

    ReadFn read = [&](unsigned char* buf, std::size_t n) {
        in.read(reinterpret_cast<char*>(buf), static_cast<std::streamsize>(n));
        if (in.bad()) throw EngineError("read failed on " + in_path);
        return static_cast<std::size_t>(in.gcount());
    };
    WriteFn write = [&](const unsigned char* buf, std::size_t n) {
        if (!write_output || n == 0) return;
        out.write(reinterpret_cast<const char*>(buf), static_cast<std::streamsize>(n));
        if (!out) throw EngineError("write failed on " + out_path);
    };

    if (run.type == JobType::compress) {
        deflate_stream(run, chunk_size, read, write);
    } else {
        inflate_stream(run, chunk_size, read, write);
    }
    if (write_output) {
        out.flush();
        if (!out) throw EngineError("write failed on " + out_path);
    }
}

std::shared_ptr<const std::string> ZlibEngine::process_buffer(Run& run, std::size_t chunk_size) {
    const std::string& data = *run.config.input_data;
    std::size_t pos = 0;
    auto output = std::make_shared<std::string>();

    ReadFn read = [&](unsigned char* buf, std::size_t n) {
        const std::size_t take = std::min(n, data.size() - pos);
        std::memcpy(buf, data.data() + pos, take);
        pos += take;
        return take;
    };
    WriteFn write = [&](const unsigned char* buf, std::size_t n) {
        output->append(reinterpret_cast<const char*>(buf), n);
    };

    if (run.type == JobType::compress_data) {
        deflate_stream(run, chunk_size, read, write);
    } else {
        inflate_stream(run, chunk_size, read, write);
    }
    return output;
}

void ZlibEngine::deflate_stream(Run& run, std::size_t chunk_size, const ReadFn& read, const WriteFn& write) {
    z_stream strm{};
    // 16 + MAX_WBITS selects the gzip wrapper
    if (deflateInit2(&strm, run.config.level, Z_DEFLATED, 16 + MAX_WBITS, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        throw EngineError("deflateInit2 failed");
    }

    std::vector<unsigned char> inbuf(chunk_size);
    std::vector<unsigned char> outbuf(chunk_size);
    try {
        int flush = Z_NO_FLUSH;
        do {
            if (!checkpoint(run)) throw CancelledRun{};
            const std::size_t n = read(inbuf.data(), inbuf.size());
            flush = n < inbuf.size() ? Z_FINISH : Z_NO_FLUSH;
            strm.next_in = inbuf.data();
            strm.avail_in = static_cast<uInt>(n);
            do {
                strm.next_out = outbuf.data();
                strm.avail_out = static_cast<uInt>(outbuf.size());
                if (deflate(&strm, flush) == Z_STREAM_ERROR) throw EngineError("deflate failed");
                const std::size_t have = outbuf.size() - strm.avail_out;
                write(outbuf.data(), have);
                run.bytes_written.fetch_add(have);
            } while (strm.avail_out == 0);
            run.bytes_processed.fetch_add(n);
        } while (flush != Z_FINISH);
    } catch (...) {
        deflateEnd(&strm);
        throw;
    }
    deflateEnd(&strm);
}

void ZlibEngine::inflate_stream(Run& run, std::size_t chunk_size, const ReadFn& read, const WriteFn& write) {
    z_stream strm{};
    if (inflateInit2(&strm, 16 + MAX_WBITS) != Z_OK) throw EngineError("inflateInit2 failed");

    std::vector<unsigned char> inbuf(chunk_size);
    std::vector<unsigned char> outbuf(chunk_size);
    int ret = Z_OK;
    try {
        while (ret != Z_STREAM_END) {
            if (!checkpoint(run)) throw CancelledRun{};
            const std::size_t n = read(inbuf.data(), inbuf.size());
            if (n == 0) throw EngineError("truncated gzip stream");
            strm.next_in = inbuf.data();
            strm.avail_in = static_cast<uInt>(n);
            do {
                strm.next_out = outbuf.data();
                strm.avail_out = static_cast<uInt>(outbuf.size());
                ret = inflate(&strm, Z_NO_FLUSH);
                if (ret == Z_NEED_DICT || ret == Z_DATA_ERROR || ret == Z_MEM_ERROR || ret == Z_STREAM_ERROR) {
                    throw EngineError(std::string("corrupt gzip data: ") + (strm.msg ? strm.msg : "inflate failed"));
                }
                const std::size_t have = outbuf.size() - strm.avail_out;
                write(outbuf.data(), have);
                run.bytes_written.fetch_add(have);
            } while (strm.avail_out == 0 && ret != Z_STREAM_END);
            run.bytes_processed.fetch_add(n - strm.avail_in);
        }
    } catch (...) {
        inflateEnd(&strm);
        throw;
    }
    inflateEnd(&strm);
    // trailing bytes after the gzip member count as processed
    run.bytes_processed.store(run.bytes_total.load());
}
