//
// Created by garrett on 2/24/25.
//

#ifndef MANIFEST_STORE_HPP
#define MANIFEST_STORE_HPP

#include "sys/file_descriptor.hpp"

#include <json/json.h>

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

// Status of one stored artifact
enum class EntryStatus {
    COMPLETE,
    FAILED,
    MISSING
};

std::string toString(EntryStatus status);
std::optional<EntryStatus> entryStatusFromString(const std::string& value);

// One (target group, sink, dataset, snapshot) transfer record
struct ManifestEntry {
    std::string targetGroup;
    std::string sink;
    std::string dataset;
    uint64_t sequence{0};
    std::optional<uint64_t> baseSequence;  // empty for a full stream
    std::string snapshotName;
    std::string checksum;
    uint64_t byteCount{0};
    EntryStatus status{EntryStatus::FAILED};
    std::chrono::system_clock::time_point timestamp;
    std::string errorMessage;

    bool isFull() const { return !baseSequence.has_value(); }
    bool isComplete() const { return status == EntryStatus::COMPLETE; }

    Json::Value toJson() const;
    static std::optional<ManifestEntry> fromJson(const Json::Value& json);
};

// Durable record of what has been stored where.
//
// One append-only JSON-lines file per target group, <dir>/<group>.manifest.jsonl.
// Reads are latest-wins per (sink, dataset, sequence). Every record is fsync'ed, a
// torn trailing line left by a crash is ignored. A complete entry is never
// overwritten by record(); only demote() moves it out of complete.
class ManifestStore {
public:
    // Exclusive per-(target group, dataset) advisory lock, held for the duration of a step
    class DatasetLock {
    public:
        DatasetLock() = default;
        explicit DatasetLock(sys::FileDescriptor fd) : m_fd(std::move(fd)) {}
        DatasetLock(DatasetLock&&) noexcept = default;
        DatasetLock& operator=(DatasetLock&&) noexcept = default;

        bool held() const { return m_fd.isValid(); }

    private:
        sys::FileDescriptor m_fd;
    };

    explicit ManifestStore(const std::string& manifestDir);

    ManifestStore(const ManifestStore&) = delete;
    ManifestStore& operator=(const ManifestStore&) = delete;

    // Write an entry. Returns false (and writes nothing) if a complete entry exists for the key.
    bool record(const ManifestEntry& entry);

    // Move an entry out of complete after a failed verification. Returns false if there is no entry.
    bool demote(const std::string& group, const std::string& sink, const std::string& dataset,
                uint64_t sequence, EntryStatus status, const std::string& reason);

    std::optional<ManifestEntry> find(const std::string& group, const std::string& sink,
                                      const std::string& dataset, uint64_t sequence);

    // Latest entries of a group ordered by dataset, sequence, sink. Optionally only one dataset.
    std::vector<ManifestEntry> entries(const std::string& group,
                                       const std::optional<std::string>& dataset = std::nullopt);

    // Complete entries whose dataset starts with the prefix
    std::vector<ManifestEntry> completeEntries(const std::string& group, const std::string& datasetPrefix = "");

    std::vector<std::string> datasets(const std::string& group);

    DatasetLock lockDataset(const std::string& group, const std::string& dataset);

    // Rewrite the log with only the latest entries once it grows past maxSize
    bool compactIfNeeded(const std::string& group, uint64_t maxSize = 4 * 1024 * 1024);

    const std::string& directory() const { return m_dir; }

private:
    using Key = std::tuple<std::string, std::string, uint64_t>;  // sink, dataset, sequence

    struct GroupLog {
        std::string path;
        sys::FileDescriptor appendFd;
        ino_t inode{0};
        uint64_t offset{0};
        std::map<Key, ManifestEntry> entries;
    };

    std::string m_dir;
    std::mutex m_mutex;
    std::map<std::string, std::unique_ptr<GroupLog>> m_logs;

    GroupLog& logFor(const std::string& group);
    sys::FileDescriptor lockGroupFile(const std::string& group);
    void reopenIfReplaced(GroupLog& log);
    void refresh(GroupLog& log);
    void appendRecord(GroupLog& log, const ManifestEntry& entry);
    std::string lockPath(const std::string& group, const std::string& dataset) const;
    static std::string escapeName(const std::string& name);
};

#endif // MANIFEST_STORE_HPP
