//
// Created by garrett on 2/26/25.
//

#include "local_sink.hpp"
#include "backup_errors.hpp"
#include "sys/file_descriptor.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>

namespace fs = std::filesystem;

namespace {

class LocalArtifactWriter : public ArtifactWriter {
public:
    LocalArtifactWriter(std::string path, bool verifyAfterWrite)
        : m_path(std::move(path)),
          m_partialPath(m_path + PARTIAL_EXTENSION),
          m_verifyAfterWrite(verifyAfterWrite) {
        try {
            fs::create_directories(fs::path(m_path).parent_path());
            m_fd = sys::FileDescriptor(m_partialPath, O_WRONLY | O_CREAT | O_TRUNC, 0644);
        } catch (const std::system_error& e) {
            throw IOError("Cannot create " + m_partialPath + ": " + e.what());
        }
    }

    ~LocalArtifactWriter() override {
        if (!m_finalized) {
            abort();
        }
    }

    void write(const char* data, size_t size) override {
        try {
            m_fd.writeAll(data, size);
        } catch (const std::system_error& e) {
            throw IOError(e.what());
        }
        if (!m_verifyAfterWrite) {
            m_checksum.update(data, size);
        }
    }

    ChecksumResult finalize() override {
        ChecksumResult result;
        try {
            m_fd.sync();
            m_fd.close();
            fs::rename(m_partialPath, m_path);
            m_finalized = true;
            sys::syncDirectory(fs::path(m_path).parent_path().string());

            if (m_verifyAfterWrite) {
                result = checksumFile(m_path);
            } else {
                uint64_t bytes = m_checksum.bytes();
                result = {m_checksum.finalHex(), bytes};
            }

            std::string line = formatChecksumLine(result.checksum, fs::path(m_path).filename().string());
            sys::FileDescriptor sidecar(m_path + CHECKSUM_EXTENSION, O_WRONLY | O_CREAT | O_TRUNC, 0644);
            sidecar.writeAll(line.data(), line.size());
            sidecar.sync();
            sidecar.close();
        } catch (const std::system_error& e) {
            throw IOError("Cannot finalize " + m_path + ": " + e.what());
        }
        return result;
    }

    void abort() noexcept override {
        m_finalized = true;
        m_fd = sys::FileDescriptor();
        std::error_code ec;
        fs::remove(m_partialPath, ec);
        if (ec) {
            spdlog::warn("Could not remove partial artifact {}: {}", m_partialPath, ec.message());
        }
    }

private:
    std::string m_path;
    std::string m_partialPath;
    bool m_verifyAfterWrite;
    bool m_finalized = false;
    sys::FileDescriptor m_fd;
    StreamingChecksum m_checksum;
};

class LocalFileSource : public ByteSource {
public:
    explicit LocalFileSource(const std::string& path) {
        try {
            m_fd = sys::FileDescriptor(path, O_RDONLY);
        } catch (const std::system_error& e) {
            throw IOError(e.what());
        }
    }

    size_t read(char* buffer, size_t size) override {
        try {
            return m_fd.read(buffer, size);
        } catch (const std::system_error& e) {
            throw IOError(e.what());
        }
    }

    void close() override {
        try {
            m_fd.close();
        } catch (const std::system_error& e) {
            throw IOError(e.what());
        }
    }

private:
    sys::FileDescriptor m_fd;
};

}

LocalSink::LocalSink(std::string root, bool verifyAfterWrite)
    : m_root(std::move(root)), m_verifyAfterWrite(verifyAfterWrite) {
    while (m_root.size() > 1 && m_root.back() == '/') {
        m_root.pop_back();
    }
}

std::string LocalSink::artifactPath(const ArtifactKey& key) const {
    return (fs::path(m_root) / key.relativePath()).string();
}

std::unique_ptr<ArtifactWriter> LocalSink::open(const ArtifactKey& key) {
    if (!isInitialized()) {
        throw IOError("Target " + m_root + " is not initialized");
    }
    return std::make_unique<LocalArtifactWriter>(artifactPath(key), m_verifyAfterWrite);
}

std::unique_ptr<ByteSource> LocalSink::read(const ArtifactKey& key) {
    return std::make_unique<LocalFileSource>(artifactPath(key));
}

bool LocalSink::exists(const ArtifactKey& key) {
    std::error_code ec;
    bool found = fs::is_regular_file(artifactPath(key), ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        throw IOError("Cannot access " + artifactPath(key) + ": " + ec.message());
    }
    return found;
}

void LocalSink::remove(const ArtifactKey& key) {
    std::string path = artifactPath(key);
    try {
        fs::remove(path);
        fs::remove(path + CHECKSUM_EXTENSION);
        fs::remove(path + PARTIAL_EXTENSION);
    } catch (const fs::filesystem_error& e) {
        throw IOError("Cannot remove " + path + ": " + e.what());
    }
    spdlog::info("Removed {}", path);
}

void LocalSink::initialize() {
    fs::path marker = fs::path(m_root) / STORAGE_SUBDIRECTORY / INITIALIZED_FILE_NAME;
    try {
        fs::create_directories(marker.parent_path());
        sys::FileDescriptor fd(marker.string(), O_WRONLY | O_CREAT, 0644);
        fd.sync();
        fd.close();
        sys::syncDirectory(marker.parent_path().string());
    } catch (const std::exception& e) {
        throw IOError("Cannot initialize " + m_root + ": " + e.what());
    }
}

bool LocalSink::isInitialized() {
    std::error_code ec;
    return fs::exists(fs::path(m_root) / STORAGE_SUBDIRECTORY / INITIALIZED_FILE_NAME, ec);
}
