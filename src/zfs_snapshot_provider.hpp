//
// Created by garrett on 2/28/25.
//

#ifndef ZFS_SNAPSHOT_PROVIDER_HPP
#define ZFS_SNAPSHOT_PROVIDER_HPP

#include "snapshot_provider.hpp"

#include <string>
#include <vector>

// SnapshotProvider backed by the zfs command line tool. Failures raise SnapshotProviderError.
class ZfsSnapshotProvider : public SnapshotProvider {
public:
    explicit ZfsSnapshotProvider(std::string zfsCommand = "zfs");

    std::vector<std::string> listDatasets(const std::string& root, bool recursive) override;
    std::vector<SnapshotInfo> listSnapshots(const std::string& dataset) override;
    void createSnapshot(const std::string& dataset, const std::string& name, bool recursive) override;
    bool hasChangesSince(const std::string& dataset, const std::string& snapshot) override;
    std::unique_ptr<ByteSource> sendStream(const std::string& dataset, const std::optional<std::string>& from,
                                           const std::string& to) override;
    void receiveStream(const std::string& dataset, ByteSource& stream) override;

private:
    std::string m_zfs;

    std::string runChecked(const std::vector<std::string>& argv);
};

#endif // ZFS_SNAPSHOT_PROVIDER_HPP
