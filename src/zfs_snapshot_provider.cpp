//
// Created by garrett on 2/28/25.
//

#include "zfs_snapshot_provider.hpp"
#include "backup_errors.hpp"
#include "sys/child_process.hpp"

#include <spdlog/spdlog.h>

#include <sstream>

namespace {

std::vector<std::string> splitLines(const std::string& output) {
    std::vector<std::string> lines;
    std::istringstream iss(output);
    std::string line;
    while (std::getline(iss, line)) {
        if (!line.empty()) {
            lines.push_back(line);
        }
    }
    return lines;
}

// Reads `zfs send` output; close() reports the exit status
class ZfsSendSource : public ByteSource {
public:
    explicit ZfsSendSource(const std::vector<std::string>& argv)
        : m_child(argv, sys::ChildProcess::Pipe::STDOUT) {}

    size_t read(char* buffer, size_t size) override {
        try {
            return m_child.pipe().read(buffer, size);
        } catch (const std::system_error& e) {
            throw SnapshotProviderError(e.what());
        }
    }

    void close() override {
        int status = m_child.wait();
        if (status != 0) {
            throw SnapshotProviderError(m_child.commandLine() + " exited with " + std::to_string(status) + ": " +
                                        m_child.errorOutput());
        }
    }

private:
    sys::ChildProcess m_child;
};

}

ZfsSnapshotProvider::ZfsSnapshotProvider(std::string zfsCommand) : m_zfs(std::move(zfsCommand)) {}

std::string ZfsSnapshotProvider::runChecked(const std::vector<std::string>& argv) {
    sys::CommandResult result;
    try {
        result = sys::ChildProcess::run(argv);
    } catch (const std::system_error& e) {
        throw SnapshotProviderError(e.what());
    }
    if (result.exitCode != 0) {
        std::string command;
        for (const auto& arg : argv) {
            command += (command.empty() ? "" : " ") + arg;
        }
        throw SnapshotProviderError(command + " exited with " + std::to_string(result.exitCode) + ": " +
                                    result.errorOutput);
    }
    return result.output;
}

std::vector<std::string> ZfsSnapshotProvider::listDatasets(const std::string& root, bool recursive) {
    std::vector<std::string> argv{m_zfs, "list", "-H", "-o", "name", "-t", "filesystem,volume"};
    if (recursive) {
        argv.push_back("-r");
    }
    argv.push_back(root);

    sys::CommandResult result;
    try {
        result = sys::ChildProcess::run(argv);
    } catch (const std::system_error& e) {
        throw SnapshotProviderError(e.what());
    }
    if (result.exitCode != 0) {
        if (result.errorOutput.find("does not exist") != std::string::npos) {
            return {};
        }
        throw SnapshotProviderError("zfs list " + root + " failed: " + result.errorOutput);
    }
    return splitLines(result.output);
}

std::vector<SnapshotInfo> ZfsSnapshotProvider::listSnapshots(const std::string& dataset) {
    sys::CommandResult result;
    try {
        result = sys::ChildProcess::run({m_zfs, "list", "-H", "-p", "-t", "snapshot", "-o", "name,creation",
                                         "-s", "createtxg", "-d", "1", dataset});
    } catch (const std::system_error& e) {
        throw SnapshotProviderError(e.what());
    }
    if (result.exitCode != 0) {
        // A dataset that does not exist yet (restore destination) has no snapshots
        if (result.errorOutput.find("does not exist") != std::string::npos) {
            return {};
        }
        throw SnapshotProviderError("zfs list snapshots of " + dataset + " failed: " + result.errorOutput);
    }
    const std::string& output = result.output;

    std::vector<SnapshotInfo> snapshots;
    for (const auto& line : splitLines(output)) {
        auto tab = line.find('\t');
        std::string fullName = line.substr(0, tab);
        auto at = fullName.find('@');
        if (at == std::string::npos || fullName.compare(0, at, dataset) != 0 || at != dataset.size()) {
            continue;
        }

        SnapshotInfo info;
        info.name = fullName.substr(at + 1);
        if (tab != std::string::npos) {
            try {
                info.createdAt = std::chrono::system_clock::time_point(std::chrono::seconds(std::stoll(line.substr(tab + 1))));
            } catch (const std::exception&) {
                spdlog::debug("Unparsable creation time for {}", fullName);
            }
        }
        snapshots.push_back(std::move(info));
    }
    return snapshots;
}

void ZfsSnapshotProvider::createSnapshot(const std::string& dataset, const std::string& name, bool recursive) {
    std::vector<std::string> argv{m_zfs, "snapshot"};
    if (recursive) {
        argv.push_back("-r");
    }
    argv.push_back(dataset + "@" + name);
    runChecked(argv);
    spdlog::info("Created snapshot {}@{}", dataset, name);
}

bool ZfsSnapshotProvider::hasChangesSince(const std::string& dataset, const std::string& snapshot) {
    std::string output = runChecked({m_zfs, "get", "-H", "-p", "-o", "value", "written@" + snapshot, dataset});
    try {
        return std::stoull(output) > 0;
    } catch (const std::exception&) {
        throw SnapshotProviderError("Unexpected written@" + snapshot + " value for " + dataset + ": " + output);
    }
}

std::unique_ptr<ByteSource> ZfsSnapshotProvider::sendStream(const std::string& dataset,
                                                            const std::optional<std::string>& from,
                                                            const std::string& to) {
    std::vector<std::string> argv{m_zfs, "send", "--raw"};
    if (from) {
        argv.push_back("-i");
        argv.push_back("@" + *from);
    }
    argv.push_back(dataset + "@" + to);
    try {
        return std::make_unique<ZfsSendSource>(argv);
    } catch (const std::system_error& e) {
        throw SnapshotProviderError(e.what());
    }
}

void ZfsSnapshotProvider::receiveStream(const std::string& dataset, ByteSource& stream) {
    try {
        sys::ChildProcess child({m_zfs, "receive", dataset}, sys::ChildProcess::Pipe::STDIN);
        std::vector<char> buffer(1024 * 1024);
        size_t n;
        while ((n = stream.read(buffer.data(), buffer.size())) > 0) {
            child.pipe().writeAll(buffer.data(), n);
        }
        child.closePipe();
        int status = child.wait();
        if (status != 0) {
            throw SnapshotProviderError(child.commandLine() + " exited with " + std::to_string(status) + ": " +
                                        child.errorOutput());
        }
    } catch (const std::system_error& e) {
        throw SnapshotProviderError("zfs receive " + dataset + " failed: " + e.what());
    }
}
