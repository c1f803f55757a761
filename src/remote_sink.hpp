//
// Created by garrett on 2/26/25.
//

#ifndef REMOTE_SINK_HPP
#define REMOTE_SINK_HPP

#include "remote_channel.hpp"
#include "sink.hpp"

// Artifacts in a directory on a host reached over a RemoteChannel
class RemoteSink : public Sink {
public:
    RemoteSink(std::shared_ptr<RemoteChannel> channel, RemoteHost host, std::string root,
               bool verifyAfterWrite = true);

    const std::string& id() const override { return m_id; }

    std::unique_ptr<ArtifactWriter> open(const ArtifactKey& key) override;
    std::unique_ptr<ByteSource> read(const ArtifactKey& key) override;
    bool exists(const ArtifactKey& key) override;
    void remove(const ArtifactKey& key) override;
    void initialize() override;
    bool isInitialized() override;

    std::string artifactPath(const ArtifactKey& key) const;

private:
    std::shared_ptr<RemoteChannel> m_channel;
    RemoteHost m_host;
    std::string m_root;
    std::string m_id;
    bool m_verifyAfterWrite;

    std::unique_ptr<RemoteSession> connect();
    std::string markerPath() const;
};

#endif // REMOTE_SINK_HPP
