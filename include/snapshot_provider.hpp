//
// Created by garrett on 2/24/25.
//

#ifndef SNAPSHOT_PROVIDER_HPP
#define SNAPSHOT_PROVIDER_HPP

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

/// A pull-style byte stream. read() returns 0 at end of stream and throws on failure.
class ByteSource {
public:
    virtual ~ByteSource() = default;

    /// @brief Read up to size bytes into buffer
    /// @return number of bytes read, 0 at end of stream
    virtual size_t read(char* buffer, size_t size) = 0;

    /// @brief Release the stream and report any deferred failure (e.g. the producing process exit status)
    virtual void close() {}
};

/// Snapshot as reported by the storage layer
struct SnapshotInfo {
    std::string name;
    std::chrono::system_clock::time_point createdAt;
};

/// Snapshot-capable storage layer (ZFS or a test double). Implemented outside the backup core.
class SnapshotProvider {
public:
    virtual ~SnapshotProvider() = default;

    /// @brief List root and (if recursive) all descendants. Empty if root does not exist.
    virtual std::vector<std::string> listDatasets(const std::string& root, bool recursive) = 0;

    /// @brief Snapshots of exactly this dataset, oldest first
    virtual std::vector<SnapshotInfo> listSnapshots(const std::string& dataset) = 0;

    virtual void createSnapshot(const std::string& dataset, const std::string& name, bool recursive) = 0;

    /// @brief True if the dataset has data written after the given snapshot
    virtual bool hasChangesSince(const std::string& dataset, const std::string& snapshot) = 0;

    /// @brief Full stream of `to` when `from` is empty, otherwise the incremental from -> to
    virtual std::unique_ptr<ByteSource> sendStream(const std::string& dataset,
                                                   const std::optional<std::string>& from,
                                                   const std::string& to) = 0;

    /// @brief Apply one stream to the dataset
    virtual void receiveStream(const std::string& dataset, ByteSource& stream) = 0;
};

#endif // SNAPSHOT_PROVIDER_HPP
