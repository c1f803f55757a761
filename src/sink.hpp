//
// Created by garrett on 2/26/25.
//

#ifndef SINK_HPP
#define SINK_HPP

#include "checksum.hpp"
#include "snapshot_provider.hpp"

#include <memory>
#include <string>

// Directory below a sink root that holds all artifacts
constexpr const char* STORAGE_SUBDIRECTORY = "zfs";
constexpr const char* INITIALIZED_FILE_NAME = ".initialized";
constexpr const char* ARTIFACT_EXTENSION = ".zfs";
constexpr const char* PARTIAL_EXTENSION = ".partial";
constexpr const char* CHECKSUM_EXTENSION = ".sha256";

// Identifies one stored snapshot stream
struct ArtifactKey {
    std::string dataset;
    std::string snapshotName;

    // zfs/<dataset>/<snapshot>.zfs, relative to the sink root
    std::string relativePath() const {
        return std::string(STORAGE_SUBDIRECTORY) + "/" + dataset + "/" + snapshotName + ARTIFACT_EXTENSION;
    }
};

// Writes one artifact. Nothing is visible under the artifact name before finalize() succeeds.
class ArtifactWriter {
public:
    virtual ~ArtifactWriter() = default;

    virtual void write(const char* data, size_t size) = 0;

    /// @brief Durably store the artifact and its checksum sidecar
    /// @return checksum and size of what the sink now holds
    virtual ChecksumResult finalize() = 0;

    /// @brief Drop the partial artifact
    virtual void abort() noexcept = 0;
};

// A storage destination. Local sinks throw IOError, remote sinks TransportError.
class Sink {
public:
    virtual ~Sink() = default;

    // "/local/path" or "host:/remote/path"
    virtual const std::string& id() const = 0;

    virtual std::unique_ptr<ArtifactWriter> open(const ArtifactKey& key) = 0;
    virtual std::unique_ptr<ByteSource> read(const ArtifactKey& key) = 0;
    virtual bool exists(const ArtifactKey& key) = 0;

    // Remove the artifact and its sidecar, missing files are not an error
    virtual void remove(const ArtifactKey& key) = 0;

    // Create <root>/zfs/.initialized, proving the root is writable
    virtual void initialize() = 0;
    virtual bool isInitialized() = 0;
};

#endif // SINK_HPP
