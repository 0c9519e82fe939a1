#include "../services/engine/include/zlib_engine.hpp"
#include "../shared/cpp/common/include/errors.hpp"
#include "../shared/cpp/common/include/util.hpp"
#include <gtest/gtest.h>
#include <zlib.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <thread>

namespace fs = std::filesystem;

class ZlibEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = fs::temp_directory_path() / ("compress-swarm-" + generate_id());
        fs::create_directories(dir);
    }
    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    std::string write_file(const std::string& name, const std::string& content) {
        auto p = dir / name;
        std::ofstream out(p, std::ios::binary);
        out << content;
        return p.string();
    }

    static std::string read_file(const std::string& path) {
        std::ifstream in(path, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    static std::string sample(std::size_t n) {
        std::string s;
        s.reserve(n);
        while (s.size() < n) s += "the quick brown fox jumps over the lazy dog\n";
        s.resize(n);
        return s;
    }

    static EnginePoll wait(ZlibEngine& engine, EngineHandle h) {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
        EnginePoll p = engine.poll(h);
        while (p.outcome == EngineOutcome::running && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            p = engine.poll(h);
        }
        return p;
    }

    CompressionConfig config(const std::string& in, const std::string& out) {
        CompressionConfig c;
        c.input_path = in;
        c.output_path = out;
        return c;
    }

    fs::path dir;
};

TEST_F(ZlibEngineTest, CompressProducesGzipReadableByZlib) {
    ZlibEngine engine(4096);
    const auto data = sample(200 * 1024);
    const auto in = write_file("data.txt", data);
    const auto out = (dir / "data.txt.gz").string();

    auto h = engine.start(JobType::compress, config(in, out));
    auto p = wait(engine, h);
    engine.release(h);
    ASSERT_EQ(p.outcome, EngineOutcome::completed) << p.error;
    EXPECT_DOUBLE_EQ(p.progress.percent, 100.0);
    EXPECT_EQ(p.progress.bytes_total, data.size());
    EXPECT_EQ(p.output_bytes, fs::file_size(out));
    EXPECT_LT(p.progress.current_ratio, 0.5);

    gzFile gz = gzopen(out.c_str(), "rb");
    ASSERT_NE(gz, nullptr);
    std::string back(data.size() + 16, '\0');
    int n = gzread(gz, &back[0], static_cast<unsigned>(back.size()));
    gzclose(gz);
    ASSERT_EQ(n, static_cast<int>(data.size()));
    back.resize(n);
    EXPECT_EQ(back, data);
}

TEST_F(ZlibEngineTest, DecompressAndVerifyGzipFile) {
    ZlibEngine engine(1024);
    const auto data = sample(50 * 1024);
    const auto in = write_file("doc.txt", data);
    const auto gz = (dir / "doc.txt.gz").string();
    auto h = engine.start(JobType::compress, config(in, gz));
    ASSERT_EQ(wait(engine, h).outcome, EngineOutcome::completed);
    engine.release(h);

    const auto restored = (dir / "restored.txt").string();
    h = engine.start(JobType::decompress, config(gz, restored));
    auto p = wait(engine, h);
    engine.release(h);
    ASSERT_EQ(p.outcome, EngineOutcome::completed) << p.error;
    EXPECT_EQ(read_file(restored), data);

    h = engine.start(JobType::verify, config(gz, ""));
    p = wait(engine, h);
    engine.release(h);
    EXPECT_EQ(p.outcome, EngineOutcome::completed) << p.error;
    EXPECT_EQ(p.output_bytes, 0u);
}

TEST_F(ZlibEngineTest, VerifyRejectsCorruptData) {
    ZlibEngine engine;
    const auto bad = write_file("bad.gz", "this is not gzip at all");
    auto h = engine.start(JobType::verify, config(bad, ""));
    auto p = wait(engine, h);
    engine.release(h);
    EXPECT_EQ(p.outcome, EngineOutcome::failed);
    EXPECT_FALSE(p.error.empty());
}

TEST_F(ZlibEngineTest, StartFailsForMissingInputOrOutput) {
    ZlibEngine engine;
    EXPECT_THROW(engine.start(JobType::compress, config((dir / "missing").string(), "x.gz")), EngineError);
    const auto in = write_file("a.txt", "abc");
    EXPECT_THROW(engine.start(JobType::compress, config(in, "")), EngineError);
    EXPECT_THROW(engine.poll(12345), EngineError);
}

TEST_F(ZlibEngineTest, CancelWhileSuspendedRemovesPartialOutput) {
    ZlibEngine engine(16);
    const auto in = write_file("big.txt", sample(1024 * 1024));
    const auto out = (dir / "big.txt.gz").string();
    auto h = engine.start(JobType::compress, config(in, out));
    engine.suspend(h);
    engine.cancel(h);
    auto p = wait(engine, h);
    engine.release(h);
    EXPECT_EQ(p.outcome, EngineOutcome::cancelled);
    EXPECT_FALSE(fs::exists(out));
}

TEST_F(ZlibEngineTest, BufferRoundTripProducesGzipInMemory) {
    ZlibEngine engine(2048);
    const auto data = sample(64 * 1024);
    CompressionConfig c;
    c.input_data = std::make_shared<std::string>(data);

    auto h = engine.start(JobType::compress_data, c);
    auto p = wait(engine, h);
    engine.release(h);
    ASSERT_EQ(p.outcome, EngineOutcome::completed) << p.error;
    ASSERT_TRUE(p.output_data);
    EXPECT_EQ(p.output_bytes, p.output_data->size());
    EXPECT_EQ(p.progress.bytes_total, data.size());
    EXPECT_LT(p.output_data->size(), data.size() / 2);
    ASSERT_GE(p.output_data->size(), 2u);
    EXPECT_EQ(static_cast<unsigned char>((*p.output_data)[0]), 0x1f);
    EXPECT_EQ(static_cast<unsigned char>((*p.output_data)[1]), 0x8b);

    CompressionConfig back;
    back.input_data = p.output_data;
    h = engine.start(JobType::decompress_data, back);
    p = wait(engine, h);
    engine.release(h);
    ASSERT_EQ(p.outcome, EngineOutcome::completed) << p.error;
    ASSERT_TRUE(p.output_data);
    EXPECT_EQ(*p.output_data, data);
    EXPECT_TRUE(fs::is_empty(dir));
}

TEST_F(ZlibEngineTest, CorruptBufferFailsWithoutOutput) {
    ZlibEngine engine;
    CompressionConfig c;
    c.input_data = std::make_shared<std::string>("definitely not gzip");
    auto h = engine.start(JobType::decompress_data, c);
    auto p = wait(engine, h);
    engine.release(h);
    EXPECT_EQ(p.outcome, EngineOutcome::failed);
    EXPECT_NE(p.error.find("corrupt"), std::string::npos);
    EXPECT_FALSE(p.output_data);

    EXPECT_THROW(engine.start(JobType::compress_data, CompressionConfig{}), EngineError);
}
