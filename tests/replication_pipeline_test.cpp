//
// Created by garrett on 2/28/25.
//
#include <gtest/gtest.h>
#include "backup_errors.hpp"
#include "local_sink.hpp"
#include "mock_snapshot_provider.hpp"
#include "replication_pipeline.hpp"

#include <atomic>
#include <filesystem>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

// Sink whose writes fail after a number of bytes, or whose finalize reports a wrong checksum
class FaultySink : public Sink {
public:
    class Writer : public ArtifactWriter {
    public:
        explicit Writer(FaultySink& sink) : m_sink(sink) {}

        void write(const char*, size_t size) override {
            m_written += size;
            if (m_sink.failAfter && m_written > *m_sink.failAfter) {
                throw IOError("No space left on device");
            }
        }

        ChecksumResult finalize() override {
            return {"0000", m_written};
        }

        void abort() noexcept override { ++m_sink.aborts; }

    private:
        FaultySink& m_sink;
        uint64_t m_written = 0;
    };

    explicit FaultySink(std::string id) : m_id(std::move(id)) {}

    const std::string& id() const override { return m_id; }
    std::unique_ptr<ArtifactWriter> open(const ArtifactKey&) override {
        if (failOpen) {
            throw IOError("Target " + m_id + " is not initialized");
        }
        return std::make_unique<Writer>(*this);
    }
    std::unique_ptr<ByteSource> read(const ArtifactKey&) override { throw IOError("not readable"); }
    bool exists(const ArtifactKey&) override { return false; }
    void remove(const ArtifactKey&) override { ++removals; }
    void initialize() override {}
    bool isInitialized() override { return true; }

    std::optional<uint64_t> failAfter;
    bool failOpen = false;
    std::atomic<int> aborts{0};
    std::atomic<int> removals{0};

private:
    std::string m_id;
};

// Endless stream, for cancellation and timeouts
class EndlessSource : public ByteSource {
public:
    size_t read(char* buffer, size_t size) override {
        std::fill(buffer, buffer + size, 'z');
        return size;
    }
};

} // namespace

class ReplicationPipelineTest : public ::testing::Test {
protected:
    fs::path m_dir;
    ArtifactKey m_key{"pool0/a", "backup-snapshot_1"};
    std::string m_data;

    void SetUp() override {
        m_dir = fs::temp_directory_path() / ("replication_pipeline_test_" + std::to_string(::getpid()));
        fs::remove_all(m_dir);
        m_data = MockSnapshotProvider::payload("0123456789abcdef");
    }

    void TearDown() override {
        fs::remove_all(m_dir);
    }

    std::shared_ptr<LocalSink> localSink(const std::string& name) {
        auto sink = std::make_shared<LocalSink>((m_dir / name).string());
        sink->initialize();
        return sink;
    }
};

TEST_F(ReplicationPipelineTest, EverySinkReceivesIdenticalStream) {
    auto first = localSink("a");
    auto second = localSink("b");
    ReplicationPipeline pipeline(100, 2);

    MemorySource source(m_data);
    auto results = pipeline.run(source, m_key, {{"disks", first}, {"offsite", second}});

    ASSERT_EQ(results.size(), 2u);
    for (const auto& result : results) {
        EXPECT_TRUE(result.success) << result.error;
        EXPECT_EQ(result.byteCount, m_data.size());
    }
    EXPECT_EQ(results[0].group, "disks");
    EXPECT_EQ(results[1].group, "offsite");
    EXPECT_EQ(results[0].checksum, results[1].checksum);
    EXPECT_EQ(results[0].checksum, checksumFile(first->artifactPath(m_key)).checksum);

    auto stored = second->read(m_key);
    EXPECT_EQ(readAll(*stored), m_data);
}

TEST_F(ReplicationPipelineTest, FailingSinkDoesNotStopOthers) {
    auto good = localSink("a");
    auto bad = std::make_shared<FaultySink>("/mnt/full");
    bad->failAfter = 150;
    ReplicationPipeline pipeline(64, 1);

    MemorySource source(m_data);
    auto results = pipeline.run(source, m_key, {{"disks", bad}, {"disks", good}});

    ASSERT_EQ(results.size(), 2u);
    EXPECT_FALSE(results[0].success);
    EXPECT_NE(results[0].error.find("No space left"), std::string::npos);
    EXPECT_EQ(bad->aborts.load(), 1);

    EXPECT_TRUE(results[1].success) << results[1].error;
    EXPECT_EQ(results[1].byteCount, m_data.size());
    EXPECT_TRUE(good->exists(m_key));
}

TEST_F(ReplicationPipelineTest, SinkThatCannotOpenIsReported) {
    auto good = localSink("a");
    auto bad = std::make_shared<FaultySink>("/mnt/missing");
    bad->failOpen = true;
    ReplicationPipeline pipeline(64, 4);

    MemorySource source(m_data);
    auto results = pipeline.run(source, m_key, {{"disks", bad}, {"disks", good}});

    EXPECT_FALSE(results[0].success);
    EXPECT_NE(results[0].error.find("not initialized"), std::string::npos);
    EXPECT_TRUE(results[1].success);
}

TEST_F(ReplicationPipelineTest, SourceFailureAbortsEverySink) {
    auto first = localSink("a");
    auto second = localSink("b");
    ReplicationPipeline pipeline(64, 2);

    MemorySource source(m_data, 300);
    auto results = pipeline.run(source, m_key, {{"disks", first}, {"disks", second}});

    for (const auto& result : results) {
        EXPECT_FALSE(result.success);
        EXPECT_NE(result.error.find("source stream failed"), std::string::npos) << result.error;
    }
    EXPECT_FALSE(first->exists(m_key));
    EXPECT_FALSE(fs::exists(first->artifactPath(m_key) + ".partial"));
    EXPECT_FALSE(second->exists(m_key));
}

TEST_F(ReplicationPipelineTest, StoredChecksumMismatchRemovesArtifact) {
    auto lying = std::make_shared<FaultySink>("/mnt/lying");
    ReplicationPipeline pipeline(64, 2);

    MemorySource source(m_data);
    auto results = pipeline.run(source, m_key, {{"disks", lying}});

    ASSERT_EQ(results.size(), 1u);
    EXPECT_FALSE(results[0].success);
    EXPECT_NE(results[0].error.find("checksum mismatch"), std::string::npos);
    EXPECT_EQ(lying->removals.load(), 1);
}

TEST_F(ReplicationPipelineTest, CancellationAbortsRunningStream) {
    auto sink = std::make_shared<FaultySink>("/mnt/a");
    CancellationToken token;
    token.cancel();
    ReplicationPipeline pipeline(4096, 2, std::chrono::seconds(0), &token);

    EndlessSource source;
    auto results = pipeline.run(source, m_key, {{"disks", sink}});

    ASSERT_EQ(results.size(), 1u);
    EXPECT_FALSE(results[0].success);
    EXPECT_EQ(results[0].error, "cancelled");
    EXPECT_EQ(sink->aborts.load(), 1);
}

TEST_F(ReplicationPipelineTest, TimeoutAbortsRunningStream) {
    auto sink = std::make_shared<FaultySink>("/mnt/slow");
    ReplicationPipeline pipeline(4096, 2, std::chrono::seconds(1));

    EndlessSource source;
    auto results = pipeline.run(source, m_key, {{"disks", sink}});

    ASSERT_EQ(results.size(), 1u);
    EXPECT_FALSE(results[0].success);
    EXPECT_NE(results[0].error.find("timed out"), std::string::npos);
    EXPECT_EQ(sink->aborts.load(), 1);
}
