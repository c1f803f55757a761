//
// Created by garrett on 2/26/25.
//

#include "remote_sink.hpp"
#include "backup_errors.hpp"

#include <spdlog/spdlog.h>

namespace {

std::string parentOf(const std::string& path) {
    auto pos = path.rfind('/');
    return pos == std::string::npos || pos == 0 ? "/" : path.substr(0, pos);
}

std::string fileNameOf(const std::string& path) {
    auto pos = path.rfind('/');
    return pos == std::string::npos ? path : path.substr(pos + 1);
}

class RemoteArtifactWriter : public ArtifactWriter {
public:
    RemoteArtifactWriter(std::unique_ptr<RemoteSession> session, std::string path, bool verifyAfterWrite)
        : m_session(std::move(session)), m_path(std::move(path)), m_verifyAfterWrite(verifyAfterWrite) {
        m_session->makeDirectories(parentOf(m_path));
        m_writer = m_session->writeFile(m_path);
    }

    ~RemoteArtifactWriter() override {
        if (m_writer) {
            abort();
        }
    }

    void write(const char* data, size_t size) override {
        m_writer->write(data, size);
        if (!m_verifyAfterWrite) {
            m_checksum.update(data, size);
        }
    }

    ChecksumResult finalize() override {
        // close() returns after the remote side synced and renamed the file into place
        m_writer->close();
        m_writer.reset();

        ChecksumResult result;
        if (m_verifyAfterWrite) {
            auto source = m_session->readFile(m_path);
            result = checksumSource(*source);
            source->close();
        } else {
            uint64_t bytes = m_checksum.bytes();
            result = {m_checksum.finalHex(), bytes};
        }

        std::string line = formatChecksumLine(result.checksum, fileNameOf(m_path));
        auto sidecar = m_session->writeFile(m_path + CHECKSUM_EXTENSION);
        sidecar->write(line.data(), line.size());
        sidecar->close();
        return result;
    }

    void abort() noexcept override {
        if (m_writer) {
            m_writer->abort();
            m_writer.reset();
        }
    }

private:
    std::unique_ptr<RemoteSession> m_session;
    std::unique_ptr<RemoteWriter> m_writer;
    std::string m_path;
    bool m_verifyAfterWrite;
    StreamingChecksum m_checksum;
};

// Keeps the session alive as long as the stream is read
class RemoteFileSource : public ByteSource {
public:
    RemoteFileSource(std::unique_ptr<RemoteSession> session, const std::string& path)
        : m_session(std::move(session)), m_source(m_session->readFile(path)) {}

    size_t read(char* buffer, size_t size) override { return m_source->read(buffer, size); }
    void close() override { m_source->close(); }

private:
    std::unique_ptr<RemoteSession> m_session;
    std::unique_ptr<ByteSource> m_source;
};

}

RemoteSink::RemoteSink(std::shared_ptr<RemoteChannel> channel, RemoteHost host, std::string root,
                       bool verifyAfterWrite)
    : m_channel(std::move(channel)),
      m_host(std::move(host)),
      m_root(std::move(root)),
      m_verifyAfterWrite(verifyAfterWrite) {
    while (m_root.size() > 1 && m_root.back() == '/') {
        m_root.pop_back();
    }
    m_id = m_host.host + ":" + m_root;
}

std::string RemoteSink::artifactPath(const ArtifactKey& key) const {
    return m_root + "/" + key.relativePath();
}

std::string RemoteSink::markerPath() const {
    return m_root + "/" + STORAGE_SUBDIRECTORY + "/" + INITIALIZED_FILE_NAME;
}

std::unique_ptr<RemoteSession> RemoteSink::connect() {
    return m_channel->connect(m_host);
}

std::unique_ptr<ArtifactWriter> RemoteSink::open(const ArtifactKey& key) {
    auto session = connect();
    if (!session->exists(markerPath())) {
        throw TransportError("Target " + m_id + " is not initialized");
    }
    return std::make_unique<RemoteArtifactWriter>(std::move(session), artifactPath(key), m_verifyAfterWrite);
}

std::unique_ptr<ByteSource> RemoteSink::read(const ArtifactKey& key) {
    return std::make_unique<RemoteFileSource>(connect(), artifactPath(key));
}

bool RemoteSink::exists(const ArtifactKey& key) {
    return connect()->exists(artifactPath(key));
}

void RemoteSink::remove(const ArtifactKey& key) {
    auto session = connect();
    std::string path = artifactPath(key);
    session->remove(path);
    session->remove(path + CHECKSUM_EXTENSION);
    spdlog::info("Removed {}:{}", m_host.label(), path);
}

void RemoteSink::initialize() {
    auto session = connect();
    session->makeDirectories(m_root + "/" + STORAGE_SUBDIRECTORY);
    auto writer = session->writeFile(markerPath());
    writer->close();
}

bool RemoteSink::isInitialized() {
    return connect()->exists(markerPath());
}
