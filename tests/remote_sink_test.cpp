//
// Created by garrett on 2/27/25.
//
#include <gtest/gtest.h>
#include "backup_errors.hpp"
#include "mock_remote_channel.hpp"
#include "remote_sink.hpp"

class RemoteSinkTest : public ::testing::Test {
protected:
    std::shared_ptr<MockRemoteChannel> m_channel = std::make_shared<MockRemoteChannel>();
    RemoteHost m_host{"backup.example.net", std::string("backup"), 2222, std::nullopt};
    ArtifactKey m_key{"pool0/a", "backup-snapshot_1"};
    const std::string m_path = "/srv/backup/zfs/pool0/a/backup-snapshot_1.zfs";
};

TEST_F(RemoteSinkTest, IdNamesHostAndRoot) {
    RemoteSink sink(m_channel, m_host, "/srv/backup/");
    EXPECT_EQ(sink.id(), "backup.example.net:/srv/backup");
    EXPECT_EQ(sink.artifactPath(m_key), m_path);
}

TEST_F(RemoteSinkTest, OpenRequiresInitializedRoot) {
    RemoteSink sink(m_channel, m_host, "/srv/backup");
    EXPECT_FALSE(sink.isInitialized());
    EXPECT_THROW(sink.open(m_key), TransportError);

    sink.initialize();
    EXPECT_TRUE(sink.isInitialized());
    EXPECT_EQ(m_channel->directories.count("/srv/backup/zfs"), 1u);
}

TEST_F(RemoteSinkTest, FinalizeWritesArtifactAndSidecar) {
    RemoteSink sink(m_channel, m_host, "/srv/backup");
    sink.initialize();

    auto writer = sink.open(m_key);
    writer->write("abc", 3);
    EXPECT_FALSE(sink.exists(m_key));

    ChecksumResult result = writer->finalize();
    EXPECT_TRUE(sink.exists(m_key));
    EXPECT_EQ(m_channel->file(m_path), "abc");
    EXPECT_EQ(result.checksum, "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(result.byteCount, 3u);
    EXPECT_EQ(m_channel->file(m_path + ".sha256"), formatChecksumLine(result.checksum, "backup-snapshot_1.zfs"));
    EXPECT_EQ(m_channel->directories.count("/srv/backup/zfs/pool0/a"), 1u);

    auto source = sink.read(m_key);
    EXPECT_EQ(readAll(*source), "abc");
}

TEST_F(RemoteSinkTest, TransportFailureIsReported) {
    RemoteSink sink(m_channel, m_host, "/srv/backup");
    sink.initialize();
    m_channel->failWriteAfter = 4;

    auto writer = sink.open(m_key);
    writer->write("abc", 3);
    EXPECT_THROW(writer->write("def", 3), TransportError);
    writer->abort();

    EXPECT_EQ(m_channel->aborts, 1);
    EXPECT_FALSE(sink.exists(m_key));
}

TEST_F(RemoteSinkTest, UnreachableHostIsTransportError) {
    RemoteSink sink(m_channel, m_host, "/srv/backup");
    m_channel->unreachable = true;
    EXPECT_THROW(sink.isInitialized(), TransportError);
    EXPECT_THROW(sink.open(m_key), TransportError);
}

TEST_F(RemoteSinkTest, RemoveDropsArtifactAndSidecar) {
    RemoteSink sink(m_channel, m_host, "/srv/backup");
    sink.initialize();
    auto writer = sink.open(m_key);
    writer->write("abc", 3);
    writer->finalize();

    sink.remove(m_key);
    EXPECT_FALSE(sink.exists(m_key));
    EXPECT_TRUE(m_channel->file(m_path + ".sha256").empty());
}
