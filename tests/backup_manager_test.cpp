//
// Created by garrett on 3/3/25.
//
#include <gtest/gtest.h>
#include "backup_manager.hpp"
#include "backup_errors.hpp"
#include "manifest_store.hpp"
#include "metrics_collector.hpp"
#include "mock_remote_channel.hpp"
#include "mock_snapshot_provider.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>

namespace fs = std::filesystem;

class BackupManagerTest : public ::testing::Test {
protected:
    fs::path m_dir;
    std::shared_ptr<MockSnapshotProvider> m_provider = std::make_shared<MockSnapshotProvider>();
    std::shared_ptr<MockRemoteChannel> m_channel = std::make_shared<MockRemoteChannel>();
    std::shared_ptr<MetricsCollector> m_metrics = std::make_shared<MetricsCollector>();
    Configuration m_config;

    const std::string REMOTE_ARTIFACT = "/srv/backup/zfs/pool0/a/backup-snapshot_";

    void SetUp() override {
        m_dir = fs::temp_directory_path() / ("backup_manager_test_" + std::to_string(::getpid()));
        fs::remove_all(m_dir);
        fs::create_directories(m_dir);

        m_provider->addDataset("pool0", "root");
        m_provider->addDataset("pool0/a", "first version");

        m_config.general.manifest_dir = (m_dir / "manifest").string();
        m_config.general.num_threads = 2;
        m_config.general.chunk_size = 256;
        m_config.general.queue_depth = 2;

        m_config.remotes["backup-host"] = RemoteHost{"backup.example.net", std::string("backup"), std::nullopt,
                                                     std::nullopt};
        m_config.target_groups["disks"] = TargetGroupConfig{"disks", {sinkPath("a"), sinkPath("b")}, std::nullopt};
        m_config.target_groups["offsite"] = TargetGroupConfig{"offsite", {"/srv/backup"}, std::string("backup-host")};

        SourceConfig source;
        source.name = "main";
        source.datasets = {"pool0/a"};
        source.targets = {"disks", "offsite"};
        m_config.sources.push_back(source);
    }

    void TearDown() override {
        fs::remove_all(m_dir);
    }

    std::string sinkPath(const std::string& name) const {
        return (m_dir / name).string();
    }

    std::string localArtifact(const std::string& sink, uint64_t sequence) const {
        return (m_dir / sink / "zfs" / "pool0" / "a" / ("backup-snapshot_" + std::to_string(sequence) + ".zfs")).string();
    }

    std::unique_ptr<BackupManager> manager() {
        return std::make_unique<BackupManager>(m_config, m_provider, m_channel, m_metrics);
    }

    static std::string readFile(const std::string& path) {
        std::ifstream in(path, std::ios::binary);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    static const StatusRow* rowFor(const OperationReport& report, const std::string& group) {
        for (const auto& row : report.rows) {
            if (row.group == group) {
                return &row;
            }
        }
        return nullptr;
    }
};

TEST_F(BackupManagerTest, InitializeTargetsCreatesMarkers) {
    auto backup = manager();
    auto report = backup->initializeTargets();

    ASSERT_EQ(report.rows.size(), 3u);
    for (const auto& row : report.rows) {
        EXPECT_EQ(row.status, "initialized");
    }
    EXPECT_TRUE(fs::exists(m_dir / "a" / "zfs" / ".initialized"));
    EXPECT_TRUE(fs::exists(m_dir / "b" / "zfs" / ".initialized"));
    EXPECT_EQ(m_channel->files.count("/srv/backup/zfs/.initialized"), 1u);
    EXPECT_EQ(report.exitCode(), 0);

    // Running it again is harmless
    EXPECT_EQ(backup->initializeTargets().exitCode(), 0);
}

TEST_F(BackupManagerTest, FirstBackupIsFullToEverySink) {
    auto backup = manager();
    backup->initializeTargets();
    auto report = backup->backup(BackupOptions{});

    EXPECT_EQ(report.exitCode(), 0);
    ASSERT_EQ(report.rows.size(), 2u);
    EXPECT_EQ(rowFor(report, "disks")->status, "complete");
    EXPECT_EQ(rowFor(report, "offsite")->status, "complete");

    EXPECT_EQ(m_provider->created, 1);
    // Both groups share the same full stream
    EXPECT_EQ(m_provider->sends, 1);

    std::string stream = readFile(localArtifact("a", 1));
    EXPECT_EQ(stream.rfind("FULL:backup-snapshot_1:", 0), 0u);
    EXPECT_EQ(readFile(localArtifact("b", 1)), stream);
    EXPECT_EQ(m_channel->file(REMOTE_ARTIFACT + "1.zfs"), stream);

    auto entries = backup->manifest().entries("disks", "pool0/a");
    ASSERT_EQ(entries.size(), 2u);
    for (const auto& entry : entries) {
        EXPECT_TRUE(entry.isComplete());
        EXPECT_TRUE(entry.isFull());
        EXPECT_EQ(entry.byteCount, stream.size());
    }
    EXPECT_EQ(m_metrics->counter("steps_completed"), 1u);
    EXPECT_EQ(m_metrics->counter("bytes_sent"), 3 * stream.size());
}

TEST_F(BackupManagerTest, SecondBackupAfterChangeIsIncremental) {
    auto backup = manager();
    backup->initializeTargets();
    backup->backup(BackupOptions{});

    m_provider->write("pool0/a", "second version");
    auto report = backup->backup(BackupOptions{});
    EXPECT_EQ(report.exitCode(), 0);
    EXPECT_EQ(rowFor(report, "disks")->detail, "stored backup-snapshot_2");

    EXPECT_EQ(m_provider->created, 2);
    EXPECT_EQ(readFile(localArtifact("a", 2)).rfind("INCR:backup-snapshot_1->backup-snapshot_2:", 0), 0u);

    auto second = backup->manifest().find("offsite", "backup.example.net:/srv/backup", "pool0/a", 2);
    ASSERT_TRUE(second.has_value());
    EXPECT_TRUE(second->isComplete());
    EXPECT_EQ(second->baseSequence.value(), 1u);
}

TEST_F(BackupManagerTest, UnchangedRerunWritesNothing) {
    auto backup = manager();
    backup->initializeTargets();
    backup->backup(BackupOptions{});
    auto filesBefore = m_channel->files.size();

    auto report = backup->backup(BackupOptions{});
    EXPECT_EQ(report.exitCode(), 0);
    for (const auto& row : report.rows) {
        EXPECT_EQ(row.status, "up_to_date");
    }
    EXPECT_EQ(m_provider->created, 1);
    EXPECT_EQ(m_provider->sends, 1);
    EXPECT_EQ(m_channel->files.size(), filesBefore);
    EXPECT_FALSE(fs::exists(localArtifact("a", 2)));
}

TEST_F(BackupManagerTest, IntermediateSnapshotsBlockBehindAFailedLink) {
    m_config.general.include_intermediate_snapshots = true;
    auto backup = manager();
    backup->initializeTargets();
    backup->backup(BackupOptions{});

    // A snapshot taken outside the tool, then more changes
    m_provider->write("pool0/a", "second version");
    m_provider->createSnapshot("pool0/a", "backup-snapshot_2", false);
    m_provider->write("pool0/a", "third version");
    fs::remove(m_dir / "b" / "zfs" / ".initialized");

    auto report = backup->backup(BackupOptions{});
    EXPECT_EQ(report.exitCode(), 1);
    EXPECT_EQ(rowFor(report, "disks")->status, "failed");
    EXPECT_EQ(rowFor(report, "offsite")->status, "complete");
    EXPECT_EQ(m_provider->sends, 3);

    EXPECT_EQ(readFile(localArtifact("a", 2)).rfind("INCR:backup-snapshot_1->backup-snapshot_2:", 0), 0u);
    EXPECT_EQ(readFile(localArtifact("a", 3)).rfind("INCR:backup-snapshot_2->backup-snapshot_3:", 0), 0u);
    EXPECT_EQ(backup->manifest().find("disks", sinkPath("b"), "pool0/a", 2)->status, EntryStatus::FAILED);
    // 2 -> 3 never reached b because its base was not complete there
    EXPECT_FALSE(backup->manifest().find("disks", sinkPath("b"), "pool0/a", 3).has_value());
    EXPECT_FALSE(fs::exists(localArtifact("b", 3)));

    // With the disk back, b gets both missing links and nothing else is sent
    backup->initializeTargets();
    auto retry = backup->backup(BackupOptions{});
    EXPECT_EQ(retry.exitCode(), 0);
    EXPECT_EQ(rowFor(retry, "disks")->status, "complete");
    EXPECT_EQ(rowFor(retry, "offsite")->status, "up_to_date");
    EXPECT_EQ(m_provider->sends, 5);
    EXPECT_EQ(m_provider->created, 3);
    EXPECT_EQ(readFile(localArtifact("b", 3)).rfind("INCR:backup-snapshot_2->backup-snapshot_3:", 0), 0u);
}

TEST_F(BackupManagerTest, UninitializedTargetFails) {
    auto report = manager()->backup(BackupOptions{});
    EXPECT_EQ(report.exitCode(), 1);
    EXPECT_EQ(rowFor(report, "disks")->status, "failed");
    EXPECT_NE(rowFor(report, "disks")->detail.find("not initialized"), std::string::npos);
}

TEST_F(BackupManagerTest, FailingGroupDoesNotStopTheOther) {
    auto backup = manager();
    backup->initializeTargets();
    m_channel->failWriteAfter = 100;

    auto report = backup->backup(BackupOptions{});
    EXPECT_EQ(report.exitCode(), 1);
    EXPECT_EQ(rowFor(report, "disks")->status, "complete");
    EXPECT_EQ(rowFor(report, "offsite")->status, "failed");
    EXPECT_NE(rowFor(report, "offsite")->detail.find("connection reset"), std::string::npos);
    EXPECT_TRUE(fs::exists(localArtifact("a", 1)));
    EXPECT_EQ(m_channel->files.count(REMOTE_ARTIFACT + "1.zfs"), 0u);
    EXPECT_EQ(m_metrics->counter("sinks_failed"), 1u);

    auto failed = backup->manifest().find("offsite", "backup.example.net:/srv/backup", "pool0/a", 1);
    ASSERT_TRUE(failed.has_value());
    EXPECT_EQ(failed->status, EntryStatus::FAILED);

    // Once the link works again only the failed group is sent to
    m_channel->failWriteAfter.reset();
    auto retry = backup->backup(BackupOptions{});
    EXPECT_EQ(retry.exitCode(), 0);
    EXPECT_EQ(rowFor(retry, "disks")->status, "up_to_date");
    EXPECT_EQ(rowFor(retry, "offsite")->status, "complete");
    EXPECT_EQ(m_provider->sends, 2);
    EXPECT_EQ(m_provider->created, 1);
}

TEST_F(BackupManagerTest, VerifyCatchesTruncationAndBackupResends) {
    auto backup = manager();
    backup->initializeTargets();
    backup->backup(BackupOptions{});

    fs::resize_file(localArtifact("b", 1), 20);

    auto verify = backup->verify(VerifyOptions{});
    EXPECT_EQ(verify.exitCode(), 1);
    EXPECT_EQ(rowFor(verify, "disks")->status, "checksum_mismatch");
    EXPECT_EQ(rowFor(verify, "offsite")->status, "ok");
    EXPECT_EQ(m_metrics->counter("artifacts_verified"), 3u);

    auto demoted = backup->manifest().find("disks", sinkPath("b"), "pool0/a", 1);
    EXPECT_EQ(demoted->status, EntryStatus::FAILED);

    auto repair = backup->backup(BackupOptions{});
    EXPECT_EQ(repair.exitCode(), 0);
    EXPECT_EQ(rowFor(repair, "disks")->status, "complete");
    EXPECT_EQ(readFile(localArtifact("b", 1)), readFile(localArtifact("a", 1)));

    EXPECT_EQ(backup->verify(VerifyOptions{}).exitCode(), 0);
}

TEST_F(BackupManagerTest, VerifyReportsMissingArtifact) {
    auto backup = manager();
    backup->initializeTargets();
    backup->backup(BackupOptions{});
    fs::remove(localArtifact("a", 1));

    VerifyOptions options;
    options.targetFilter = sinkPath("a");
    auto verify = backup->verify(options);
    ASSERT_EQ(verify.rows.size(), 1u);
    EXPECT_EQ(verify.rows[0].status, "missing");
    EXPECT_EQ(backup->manifest().find("disks", sinkPath("a"), "pool0/a", 1)->status, EntryStatus::MISSING);
}

TEST_F(BackupManagerTest, RepairModeCreatesNoSnapshot) {
    auto backup = manager();
    backup->initializeTargets();

    BackupOptions repair;
    repair.repair = true;
    auto empty = backup->backup(repair);
    EXPECT_EQ(m_provider->created, 0);
    EXPECT_EQ(rowFor(empty, "disks")->status, "up_to_date");

    backup->backup(BackupOptions{});
    fs::remove(localArtifact("b", 1));
    backup->verify(VerifyOptions{});

    m_provider->write("pool0/a", "changed");
    auto repaired = backup->backup(repair);
    EXPECT_EQ(repaired.exitCode(), 0);
    EXPECT_EQ(m_provider->created, 1);
    EXPECT_TRUE(fs::exists(localArtifact("b", 1)));
}

TEST_F(BackupManagerTest, DryRunChangesNothing) {
    auto backup = manager();
    backup->initializeTargets();

    BackupOptions options;
    options.dryRun = true;
    auto report = backup->backup(options);
    EXPECT_EQ(report.exitCode(), 0);
    EXPECT_EQ(rowFor(report, "disks")->status, "planned");
    EXPECT_EQ(rowFor(report, "disks")->detail, "full backup-snapshot_1 to 2 sink(s)");
    EXPECT_EQ(m_provider->created, 0);
    EXPECT_EQ(m_provider->sends, 0);
    EXPECT_TRUE(backup->manifest().entries("disks").empty());
}

TEST_F(BackupManagerTest, MissingSourceDatasetIsFatal) {
    m_config.sources[0].datasets = {"pool9"};
    auto report = manager()->backup(BackupOptions{});
    EXPECT_TRUE(report.fatal);
    EXPECT_EQ(report.exitCode(), 2);
}

TEST_F(BackupManagerTest, DeletedSourceSnapshotBreaksChain) {
    auto backup = manager();
    backup->initializeTargets();
    backup->backup(BackupOptions{});

    m_provider->destroySnapshot("pool0/a", "backup-snapshot_1");
    m_provider->write("pool0/a", "after delete");
    auto report = backup->backup(BackupOptions{});

    EXPECT_EQ(report.exitCode(), 2);
    EXPECT_EQ(rowFor(report, "disks")->status, "chain_broken");

    // A forced full stream starts a new chain
    BackupOptions full;
    full.forceFull = true;
    auto recovered = backup->backup(full);
    EXPECT_EQ(recovered.exitCode(), 0);
    EXPECT_EQ(readFile(localArtifact("a", 2)).rfind("FULL:backup-snapshot_2:", 0), 0u);
}

TEST_F(BackupManagerTest, RecursiveSourceBacksUpEveryDataset) {
    m_config.sources[0].datasets = {"pool0"};
    m_config.sources[0].recursive = true;
    m_config.sources[0].targets = {"disks"};

    auto backup = manager();
    backup->initializeTargets();
    auto report = backup->backup(BackupOptions{});

    EXPECT_EQ(report.exitCode(), 0);
    ASSERT_EQ(report.rows.size(), 2u);
    EXPECT_EQ(report.rows[0].subject, "pool0");
    EXPECT_EQ(report.rows[1].subject, "pool0/a");
    EXPECT_EQ(backup->manifest().datasets("disks"), (std::vector<std::string>{"pool0", "pool0/a"}));
}

TEST_F(BackupManagerTest, RestoreReplaysChain) {
    auto backup = manager();
    backup->initializeTargets();
    backup->backup(BackupOptions{});
    m_provider->write("pool0/a", "second version");
    backup->backup(BackupOptions{});

    RestoreOptions options;
    options.destinationRoot = "restore/";
    auto report = backup->restore(options);

    EXPECT_EQ(report.exitCode(), 0);
    ASSERT_EQ(report.rows.size(), 1u);
    EXPECT_EQ(report.rows[0].group, "disks");
    EXPECT_EQ(report.rows[0].status, "restored");
    EXPECT_EQ(m_provider->receivedHeaders(),
              (std::vector<std::string>{"FULL:backup-snapshot_1", "INCR:backup-snapshot_1->backup-snapshot_2"}));
    EXPECT_EQ(m_provider->received[0].first, "restore/pool0/a");
}

TEST_F(BackupManagerTest, RestoreFallsBackToNextGroup) {
    auto backup = manager();
    backup->initializeTargets();
    backup->backup(BackupOptions{});
    fs::remove(localArtifact("a", 1));
    fs::remove(localArtifact("b", 1));

    RestoreOptions options;
    options.destinationRoot = ".";
    auto report = backup->restore(options);
    EXPECT_EQ(report.exitCode(), 0);
    ASSERT_EQ(report.rows.size(), 1u);
    EXPECT_EQ(report.rows[0].group, "offsite");
    EXPECT_EQ(m_provider->received[0].first, "pool0/a");
}

TEST_F(BackupManagerTest, RestoreWithoutUsableChainIsChainBroken) {
    auto backup = manager();
    backup->initializeTargets();
    backup->backup(BackupOptions{});
    fs::remove(localArtifact("a", 1));
    fs::remove(localArtifact("b", 1));
    m_channel->files.erase(REMOTE_ARTIFACT + "1.zfs");

    RestoreOptions options;
    options.destinationRoot = "restore";
    auto report = backup->restore(options);
    ASSERT_EQ(report.rows.size(), 1u);
    EXPECT_EQ(report.rows[0].group, "*");
    EXPECT_EQ(report.rows[0].status, "chain_broken");
    EXPECT_EQ(report.exitCode(), 2);
    EXPECT_TRUE(m_provider->received.empty());
}

TEST_F(BackupManagerTest, ListShowsStoredSnapshots) {
    auto backup = manager();
    backup->initializeTargets();
    backup->backup(BackupOptions{});

    std::stringstream out;
    backup->list(out);
    EXPECT_NE(out.str().find("disks: pool0/a"), std::string::npos);
    EXPECT_NE(out.str().find("backup-snapshot_1  full"), std::string::npos);
    EXPECT_NE(out.str().find("[" + sinkPath("a") + ": complete]"), std::string::npos);
}

TEST_F(BackupManagerTest, PlainListPrintsSnapshotNames) {
    auto backup = manager();
    backup->initializeTargets();
    backup->backup(BackupOptions{});
    m_provider->write("pool0/a", "more data");
    backup->backup(BackupOptions{});

    std::stringstream out;
    backup->list(out, true);
    EXPECT_EQ(out.str(), "pool0/a@backup-snapshot_1\npool0/a@backup-snapshot_2\n");
}

TEST_F(BackupManagerTest, RemoteGroupNeedsChannel) {
    EXPECT_THROW(BackupManager(m_config, m_provider, nullptr, m_metrics), ConfigurationError);
}

TEST(OperationReportTest, ExitCodes) {
    OperationReport report;
    EXPECT_EQ(report.exitCode(), 0);

    report.rows.push_back({"disks", "pool0/a", "complete", ""});
    report.rows.push_back({"disks", "pool0/b", "up_to_date", ""});
    EXPECT_EQ(report.exitCode(), 0);

    report.rows.push_back({"disks", "pool0/c", "blocked", ""});
    EXPECT_EQ(report.exitCode(), 1);

    report.rows.push_back({"disks", "pool0/d", "chain_broken", ""});
    EXPECT_EQ(report.exitCode(), 2);

    OperationReport fatal;
    fatal.fatal = true;
    EXPECT_EQ(fatal.exitCode(), 2);
}
