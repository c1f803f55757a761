//
// Created by garrett on 2/24/25.
//

#include "manifest_store.hpp"
#include "backup_errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>
#include <sstream>

namespace fs = std::filesystem;

std::string toString(EntryStatus status) {
    switch (status) {
        case EntryStatus::COMPLETE:
            return "complete";
        case EntryStatus::FAILED:
            return "failed";
        case EntryStatus::MISSING:
            return "missing";
    }
    return "failed";
}

std::optional<EntryStatus> entryStatusFromString(const std::string& value) {
    if (value == "complete") return EntryStatus::COMPLETE;
    if (value == "failed") return EntryStatus::FAILED;
    if (value == "missing") return EntryStatus::MISSING;
    return std::nullopt;
}

Json::Value ManifestEntry::toJson() const {
    Json::Value json;
    json["group"] = targetGroup;
    json["sink"] = sink;
    json["dataset"] = dataset;
    json["sequence"] = Json::UInt64(sequence);
    if (baseSequence) {
        json["base"] = Json::UInt64(*baseSequence);
    }
    json["snapshot"] = snapshotName;
    json["checksum"] = checksum;
    json["bytes"] = Json::UInt64(byteCount);
    json["status"] = toString(status);
    json["timestamp"] = Json::Int64(std::chrono::duration_cast<std::chrono::milliseconds>(
        timestamp.time_since_epoch()).count());
    if (!errorMessage.empty()) {
        json["error"] = errorMessage;
    }
    return json;
}

std::optional<ManifestEntry> ManifestEntry::fromJson(const Json::Value& json) {
    if (!json.isObject() || !json["group"].isString() || !json["sink"].isString() ||
        !json["dataset"].isString() || !json["sequence"].isIntegral() || !json["status"].isString()) {
        return std::nullopt;
    }
    auto status = entryStatusFromString(json["status"].asString());
    if (!status) {
        return std::nullopt;
    }

    ManifestEntry entry;
    entry.targetGroup = json["group"].asString();
    entry.sink = json["sink"].asString();
    entry.dataset = json["dataset"].asString();
    entry.sequence = json["sequence"].asUInt64();
    if (json.isMember("base") && json["base"].isIntegral()) {
        entry.baseSequence = json["base"].asUInt64();
    }
    entry.snapshotName = json["snapshot"].asString();
    entry.checksum = json["checksum"].asString();
    entry.byteCount = json["bytes"].asUInt64();
    entry.status = *status;
    entry.timestamp = std::chrono::system_clock::time_point(
        std::chrono::milliseconds(json["timestamp"].asInt64()));
    entry.errorMessage = json["error"].asString();
    return entry;
}

ManifestStore::ManifestStore(const std::string& manifestDir) : m_dir(manifestDir) {
    try {
        fs::create_directories(fs::path(m_dir) / "locks");
    } catch (const fs::filesystem_error& e) {
        throw IOError("Cannot create manifest directory " + m_dir + ": " + e.what());
    }
}

bool ManifestStore::record(const ManifestEntry& entry) {
    std::lock_guard<std::mutex> lock(m_mutex);
    GroupLog& log = logFor(entry.targetGroup);
    auto groupLock = lockGroupFile(entry.targetGroup);
    reopenIfReplaced(log);
    refresh(log);

    auto it = log.entries.find(Key{entry.sink, entry.dataset, entry.sequence});
    if (it != log.entries.end() && it->second.isComplete()) {
        spdlog::warn("Refusing to overwrite complete manifest entry {}:{}@{} on {}",
                     entry.targetGroup, entry.dataset, entry.sequence, entry.sink);
        return false;
    }

    ManifestEntry stamped = entry;
    stamped.timestamp = std::chrono::system_clock::now();
    appendRecord(log, stamped);
    refresh(log);
    return true;
}

bool ManifestStore::demote(const std::string& group, const std::string& sink, const std::string& dataset,
                           uint64_t sequence, EntryStatus status, const std::string& reason) {
    std::lock_guard<std::mutex> lock(m_mutex);
    GroupLog& log = logFor(group);
    auto groupLock = lockGroupFile(group);
    reopenIfReplaced(log);
    refresh(log);

    auto it = log.entries.find(Key{sink, dataset, sequence});
    if (it == log.entries.end()) {
        return false;
    }

    ManifestEntry demoted = it->second;
    demoted.status = status;
    demoted.errorMessage = reason;
    demoted.timestamp = std::chrono::system_clock::now();
    appendRecord(log, demoted);
    refresh(log);
    spdlog::info("Demoted {}:{}@{} on {} to {} ({})", group, dataset, sequence, sink, toString(status), reason);
    return true;
}

std::optional<ManifestEntry> ManifestStore::find(const std::string& group, const std::string& sink,
                                                 const std::string& dataset, uint64_t sequence) {
    std::lock_guard<std::mutex> lock(m_mutex);
    GroupLog& log = logFor(group);
    reopenIfReplaced(log);
    refresh(log);

    auto it = log.entries.find(Key{sink, dataset, sequence});
    if (it == log.entries.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<ManifestEntry> ManifestStore::entries(const std::string& group,
                                                  const std::optional<std::string>& dataset) {
    std::lock_guard<std::mutex> lock(m_mutex);
    GroupLog& log = logFor(group);
    reopenIfReplaced(log);
    refresh(log);

    std::vector<ManifestEntry> result;
    for (const auto& [key, entry] : log.entries) {
        if (!dataset || entry.dataset == *dataset) {
            result.push_back(entry);
        }
    }
    std::sort(result.begin(), result.end(), [](const ManifestEntry& a, const ManifestEntry& b) {
        return std::tie(a.dataset, a.sequence, a.sink) < std::tie(b.dataset, b.sequence, b.sink);
    });
    return result;
}

std::vector<ManifestEntry> ManifestStore::completeEntries(const std::string& group,
                                                          const std::string& datasetPrefix) {
    std::vector<ManifestEntry> result;
    for (auto& entry : entries(group)) {
        if (entry.isComplete() && entry.dataset.compare(0, datasetPrefix.size(), datasetPrefix) == 0) {
            result.push_back(std::move(entry));
        }
    }
    return result;
}

std::vector<std::string> ManifestStore::datasets(const std::string& group) {
    std::vector<std::string> result;
    for (const auto& entry : entries(group)) {
        if (result.empty() || result.back() != entry.dataset) {
            result.push_back(entry.dataset);
        }
    }
    return result;
}

ManifestStore::DatasetLock ManifestStore::lockDataset(const std::string& group, const std::string& dataset) {
    std::string path = lockPath(group, dataset);
    try {
        fs::create_directories(fs::path(path).parent_path());
        sys::FileDescriptor fd(path, O_RDWR | O_CREAT, 0644);
        fd.lockExclusive();
        return DatasetLock(std::move(fd));
    } catch (const std::exception& e) {
        throw IOError("Cannot lock " + group + ":" + dataset + ": " + e.what());
    }
}

bool ManifestStore::compactIfNeeded(const std::string& group, uint64_t maxSize) {
    std::lock_guard<std::mutex> lock(m_mutex);
    GroupLog& log = logFor(group);
    auto groupLock = lockGroupFile(group);
    reopenIfReplaced(log);
    refresh(log);

    if (log.offset < maxSize) {
        return false;
    }

    std::string tmpPath = log.path + ".tmp";
    try {
        sys::FileDescriptor out(tmpPath, O_WRONLY | O_CREAT | O_TRUNC, 0644);
        Json::StreamWriterBuilder builder;
        builder["indentation"] = "";
        for (const auto& [key, entry] : log.entries) {
            std::string line = Json::writeString(builder, entry.toJson()) + "\n";
            out.writeAll(line.data(), line.size());
        }
        out.sync();
        out.close();

        fs::rename(tmpPath, log.path);
        sys::syncDirectory(m_dir);
    } catch (const std::exception& e) {
        throw IOError("Cannot compact manifest " + log.path + ": " + e.what());
    }

    size_t before = log.offset;
    reopenIfReplaced(log);
    refresh(log);
    spdlog::info("Compacted manifest {} from {} to {} bytes", log.path, before, log.offset);
    return true;
}

ManifestStore::GroupLog& ManifestStore::logFor(const std::string& group) {
    auto it = m_logs.find(group);
    if (it != m_logs.end()) {
        return *it->second;
    }

    auto log = std::make_unique<GroupLog>();
    log->path = (fs::path(m_dir) / (escapeName(group) + ".manifest.jsonl")).string();

    try {
        log->appendFd = sys::FileDescriptor(log->path, O_WRONLY | O_APPEND | O_CREAT, 0644);
        struct stat st;
        if (::fstat(log->appendFd.fd(), &st) == -1) {
            throw std::system_error(errno, std::system_category(), "Failed to stat " + log->path);
        }
        log->inode = st.st_ino;

        // Terminate a torn line from an earlier crash so the next record starts clean
        if (st.st_size > 0) {
            sys::FileDescriptor in(log->path, O_RDONLY);
            in.seek(st.st_size - 1, SEEK_SET);
            char last = '\n';
            in.read(&last, 1);
            if (last != '\n') {
                spdlog::warn("Manifest {} ends with a torn record, ignoring it", log->path);
                log->appendFd.writeAll("\n", 1);
                log->appendFd.sync();
            }
        }
    } catch (const std::system_error& e) {
        throw IOError(std::string("Cannot open manifest: ") + e.what());
    }

    GroupLog& ref = *log;
    m_logs[group] = std::move(log);
    refresh(ref);
    return ref;
}

sys::FileDescriptor ManifestStore::lockGroupFile(const std::string& group) {
    std::string path = (fs::path(m_dir) / "locks" / (escapeName(group) + ".manifest.lock")).string();
    try {
        sys::FileDescriptor fd(path, O_RDWR | O_CREAT, 0644);
        fd.lockExclusive();
        return fd;
    } catch (const std::system_error& e) {
        throw IOError(std::string("Cannot lock manifest: ") + e.what());
    }
}

void ManifestStore::reopenIfReplaced(GroupLog& log) {
    struct stat st;
    if (::stat(log.path.c_str(), &st) == 0 && st.st_ino == log.inode) {
        return;
    }

    // Compacted (renamed over) by this or another process: start over from the new file
    try {
        log.appendFd = sys::FileDescriptor(log.path, O_WRONLY | O_APPEND | O_CREAT, 0644);
        if (::fstat(log.appendFd.fd(), &st) == -1) {
            throw std::system_error(errno, std::system_category(), "Failed to stat " + log.path);
        }
    } catch (const std::system_error& e) {
        throw IOError(std::string("Cannot reopen manifest: ") + e.what());
    }
    log.inode = st.st_ino;
    log.offset = 0;
    log.entries.clear();
}

void ManifestStore::refresh(GroupLog& log) {
    std::string data;
    try {
        sys::FileDescriptor in(log.path, O_RDONLY);
        in.seek(static_cast<off_t>(log.offset), SEEK_SET);
        char buffer[16 * 1024];
        size_t n;
        while ((n = in.read(buffer, sizeof(buffer))) > 0) {
            data.append(buffer, n);
        }
    } catch (const std::system_error& e) {
        throw IOError(std::string("Cannot read manifest: ") + e.what());
    }

    Json::CharReaderBuilder builder;
    size_t consumed = 0;
    size_t newline;
    // Only newline terminated records count, a partial trailing line is still being written
    while ((newline = data.find('\n', consumed)) != std::string::npos) {
        std::string line = data.substr(consumed, newline - consumed);
        consumed = newline + 1;
        if (line.empty()) {
            continue;
        }

        Json::Value json;
        JSONCPP_STRING errs;
        std::istringstream iss(line);
        std::optional<ManifestEntry> entry;
        if (Json::parseFromStream(builder, iss, &json, &errs)) {
            entry = ManifestEntry::fromJson(json);
        }
        if (!entry) {
            spdlog::warn("Skipping unreadable manifest record in {}", log.path);
            continue;
        }
        log.entries[Key{entry->sink, entry->dataset, entry->sequence}] = *entry;
    }
    log.offset += consumed;
}

void ManifestStore::appendRecord(GroupLog& log, const ManifestEntry& entry) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";  // one record per line
    std::string line = Json::writeString(builder, entry.toJson()) + "\n";

    try {
        log.appendFd.writeAll(line.data(), line.size());
        log.appendFd.sync();
    } catch (const std::system_error& e) {
        throw IOError(std::string("Cannot write manifest: ") + e.what());
    }
}

std::string ManifestStore::lockPath(const std::string& group, const std::string& dataset) const {
    return (fs::path(m_dir) / "locks" / escapeName(group) / (escapeName(dataset) + ".lock")).string();
}

std::string ManifestStore::escapeName(const std::string& name) {
    std::string escaped;
    for (char c : name) {
        if (c == '/') {
            escaped += "%2F";
        } else if (c == '%') {
            escaped += "%25";
        } else {
            escaped += c;
        }
    }
    return escaped;
}
