//
// Created by garrett on 3/2/25.
//

#ifndef BACKUP_MANAGER_HPP
#define BACKUP_MANAGER_HPP

#include "configuration.hpp"

#include <iosfwd>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>


class CancellationToken;
class ManifestStore;
class MetricsCollector;
class RemoteChannel;
class Sink;
class SnapshotProvider;

struct BackupOptions {
    bool repair{false};          // only re-send missing links, create no snapshot
    bool forceFull{false};       // full stream to every sink lacking the target
    bool dryRun{false};
    std::string datasetFilter;   // dataset path prefix
    std::string targetFilter;    // sink id prefix
};

struct VerifyOptions {
    std::string datasetFilter;
    std::string targetFilter;
    bool removeCorrupted{false};
};

struct RestoreOptions {
    std::string destinationRoot;            // "." restores in place
    std::string datasetFilter;
    std::optional<std::string> group;       // first group with a usable chain when empty
    std::optional<uint64_t> sequence;
    bool incremental{false};
    bool dryRun{false};
};

// One line of the status table: per target group and dataset (or sink for init)
struct StatusRow {
    std::string group;
    std::string subject;
    std::string status;
    std::string detail;
};

struct OperationReport {
    std::vector<StatusRow> rows;
    bool fatal{false};
    std::string fatalError;

    // 0 success, 1 something incomplete, 2 fatal configuration or chain error
    int exitCode() const;
    void print(std::ostream& out) const;
};

/// class that runs the init, list, backup, verify and restore operations over a configuration
class BackupManager
{
public:
    BackupManager(Configuration config, std::shared_ptr<SnapshotProvider> provider,
                  std::shared_ptr<RemoteChannel> channel, std::shared_ptr<MetricsCollector> metrics,
                  const CancellationToken* cancellation = nullptr);
    ~BackupManager();
    BackupManager(const BackupManager&) = delete;
    BackupManager& operator=(const BackupManager&) = delete;
    BackupManager(BackupManager&&) = delete;
    BackupManager& operator=(BackupManager&&) = delete;

    OperationReport initializeTargets();

    /// @brief Print the stored chains per group and dataset. With plain set, print only
    /// the dataset@snapshot names complete on at least one sink, one per line.
    OperationReport list(std::ostream& out, bool plain = false);

    OperationReport backup(const BackupOptions& options);

    OperationReport verify(const VerifyOptions& options);

    OperationReport restore(const RestoreOptions& options);

    ManifestStore& manifest() { return *m_manifest; }


private:
    Configuration m_config;
    std::shared_ptr<SnapshotProvider> m_provider;
    std::shared_ptr<RemoteChannel> m_channel;
    std::shared_ptr<MetricsCollector> m_metrics;
    const CancellationToken* m_cancellation;
    std::unique_ptr<ManifestStore> m_manifest;
    // group -> sinks, in configured path order
    std::map<std::string, std::vector<std::shared_ptr<Sink>>> m_sinks;

    std::vector<std::shared_ptr<Sink>> sinksOf(const std::string& group, const std::string& targetFilter = "") const;
    std::shared_ptr<Sink> findSink(const std::string& group, const std::string& sinkId) const;

    // dataset -> target groups, union over all sources
    std::map<std::string, std::vector<std::string>> selectDatasets(const std::string& datasetFilter) const;
};


#endif // BACKUP_MANAGER_HPP
