//
// Created by garrett on 2/26/25.
//

#ifndef LOCAL_SINK_HPP
#define LOCAL_SINK_HPP

#include "sink.hpp"

// Artifacts in a directory of the local filesystem (usually a mounted backup disk)
class LocalSink : public Sink {
public:
    explicit LocalSink(std::string root, bool verifyAfterWrite = true);

    const std::string& id() const override { return m_root; }

    std::unique_ptr<ArtifactWriter> open(const ArtifactKey& key) override;
    std::unique_ptr<ByteSource> read(const ArtifactKey& key) override;
    bool exists(const ArtifactKey& key) override;
    void remove(const ArtifactKey& key) override;
    void initialize() override;
    bool isInitialized() override;

    std::string artifactPath(const ArtifactKey& key) const;

private:
    std::string m_root;
    bool m_verifyAfterWrite;
};

#endif // LOCAL_SINK_HPP
