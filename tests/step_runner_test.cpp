//
// Created by garrett on 3/2/25.
//
#include <gtest/gtest.h>
#include "local_sink.hpp"
#include "manifest_store.hpp"
#include "metrics_collector.hpp"
#include "mock_snapshot_provider.hpp"
#include "replication_pipeline.hpp"
#include "snapshot_naming.hpp"
#include "step_runner.hpp"

#include <filesystem>
#include <map>
#include <unistd.h>

namespace fs = std::filesystem;

class StepRunnerTest : public ::testing::Test {
protected:
    fs::path m_dir;
    MockSnapshotProvider m_provider;
    MetricsCollector m_metrics;
    ReplicationPipeline m_pipeline{128, 2};
    std::map<std::string, std::shared_ptr<LocalSink>> m_sinks;
    std::unique_ptr<ManifestStore> m_manifest;
    std::unique_ptr<StepRunner> m_runner;

    void SetUp() override {
        m_dir = fs::temp_directory_path() / ("step_runner_test_" + std::to_string(::getpid()));
        fs::remove_all(m_dir);
        fs::create_directories(m_dir);

        for (const std::string name : {"a", "b"}) {
            auto sink = std::make_shared<LocalSink>((m_dir / name).string());
            sink->initialize();
            m_sinks[sink->id()] = sink;
        }
        m_manifest = std::make_unique<ManifestStore>((m_dir / "manifest").string());
        m_runner = std::make_unique<StepRunner>(
            *m_manifest, m_provider, m_pipeline,
            [this](const StepDestination& destination) { return m_sinks.at(destination.sink); },
            "backup-snapshot", &m_metrics);

        m_provider.addDataset("pool0/a", "first");
        m_provider.createSnapshot("pool0/a", "backup-snapshot_1", false);
    }

    void TearDown() override {
        fs::remove_all(m_dir);
    }

    std::string sink(const std::string& name) const {
        return (m_dir / name).string();
    }

    PlannedStep step(std::optional<uint64_t> base, uint64_t target) const {
        return PlannedStep{"pool0/a", base, target, {{"disks", sink("a")}, {"disks", sink("b")}}};
    }

    void snapshot(uint64_t sequence, const std::string& data) {
        m_provider.write("pool0/a", data);
        m_provider.createSnapshot("pool0/a", formatSnapshotName("backup-snapshot", sequence), false);
    }

    static DestinationOutcome outcomeFor(const StepReport& report, const std::string& sinkId) {
        for (const auto& destination : report.destinations) {
            if (destination.destination.sink == sinkId) {
                return destination.outcome;
            }
        }
        ADD_FAILURE() << "no outcome for " << sinkId;
        return DestinationOutcome::FAILED;
    }
};

TEST_F(StepRunnerTest, StoresAndRecordsEveryDestination) {
    auto report = m_runner->run(step(std::nullopt, 1));

    EXPECT_EQ(outcomeFor(report, sink("a")), DestinationOutcome::COMPLETE);
    EXPECT_EQ(outcomeFor(report, sink("b")), DestinationOutcome::COMPLETE);
    EXPECT_EQ(m_provider.sends, 1);

    auto entry = m_manifest->find("disks", sink("b"), "pool0/a", 1);
    ASSERT_TRUE(entry.has_value());
    EXPECT_TRUE(entry->isComplete());
    EXPECT_TRUE(entry->isFull());
    EXPECT_EQ(m_metrics.counter("steps_completed"), 1u);
}

TEST_F(StepRunnerTest, CompleteDestinationIsAlreadyDone) {
    ASSERT_EQ(outcomeFor(m_runner->run(PlannedStep{"pool0/a", std::nullopt, 1, {{"disks", sink("a")}}}), sink("a")),
              DestinationOutcome::COMPLETE);
    ASSERT_EQ(m_provider.sends, 1);

    // Only the sink still lacking it is streamed to
    auto report = m_runner->run(step(std::nullopt, 1));
    EXPECT_EQ(outcomeFor(report, sink("a")), DestinationOutcome::ALREADY_DONE);
    EXPECT_EQ(outcomeFor(report, sink("b")), DestinationOutcome::COMPLETE);
    EXPECT_EQ(m_provider.sends, 2);

    // Nothing left to do, so no stream is started at all
    auto again = m_runner->run(step(std::nullopt, 1));
    EXPECT_EQ(outcomeFor(again, sink("a")), DestinationOutcome::ALREADY_DONE);
    EXPECT_EQ(outcomeFor(again, sink("b")), DestinationOutcome::ALREADY_DONE);
    EXPECT_EQ(toString(DestinationOutcome::ALREADY_DONE), "up_to_date");
    EXPECT_EQ(m_provider.sends, 2);
}

TEST_F(StepRunnerTest, IncrementalIsBlockedOnlyWhereItsBaseFailed) {
    snapshot(2, "second");
    snapshot(3, "third");
    m_runner->run(step(std::nullopt, 1));

    // b loses its disk for the 1 -> 2 step
    fs::remove(m_dir / "b" / "zfs" / ".initialized");
    auto second = m_runner->run(step(1, 2));
    EXPECT_EQ(outcomeFor(second, sink("a")), DestinationOutcome::COMPLETE);
    EXPECT_EQ(outcomeFor(second, sink("b")), DestinationOutcome::FAILED);
    EXPECT_EQ(m_manifest->find("disks", sink("b"), "pool0/a", 2)->status, EntryStatus::FAILED);

    m_sinks.at(sink("b"))->initialize();
    int sendsBefore = m_provider.sends;
    auto third = m_runner->run(step(2, 3));
    EXPECT_EQ(outcomeFor(third, sink("a")), DestinationOutcome::COMPLETE);
    EXPECT_EQ(outcomeFor(third, sink("b")), DestinationOutcome::BLOCKED);
    EXPECT_EQ(m_provider.sends, sendsBefore + 1);
    EXPECT_FALSE(m_manifest->find("disks", sink("b"), "pool0/a", 3).has_value());
    EXPECT_FALSE(fs::exists(m_dir / "b" / "zfs" / "pool0" / "a" / "backup-snapshot_3.zfs"));
}

TEST_F(StepRunnerTest, EveryDestinationBlockedStartsNoStream) {
    snapshot(2, "second");
    auto report = m_runner->run(step(1, 2));
    EXPECT_EQ(outcomeFor(report, sink("a")), DestinationOutcome::BLOCKED);
    EXPECT_EQ(outcomeFor(report, sink("b")), DestinationOutcome::BLOCKED);
    EXPECT_EQ(m_provider.sends, 0);
}

TEST_F(StepRunnerTest, SourceFailureIsRecordedPerDestination) {
    auto report = m_runner->run(step(std::nullopt, 7));
    EXPECT_EQ(outcomeFor(report, sink("a")), DestinationOutcome::FAILED);
    EXPECT_EQ(outcomeFor(report, sink("b")), DestinationOutcome::FAILED);
    auto entry = m_manifest->find("disks", sink("a"), "pool0/a", 7);
    ASSERT_TRUE(entry.has_value());
    EXPECT_NE(entry->errorMessage.find("source stream failed"), std::string::npos);
    EXPECT_EQ(m_metrics.counter("sinks_failed"), 2u);
}
