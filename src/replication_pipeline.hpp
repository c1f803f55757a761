//
// Created by garrett on 2/26/25.
//
/*
Single pass fan-out of one snapshot stream
1. One producer reads chunk_size chunks from the send stream.
2. Every destination has its own bounded queue and writer thread; the same chunk is shared by all queues.
3. A destination that fails is dropped, the others are fed to the end.
4. A failing source, cancellation or the step timeout aborts every destination.
*/

#ifndef REPLICATION_PIPELINE_HPP
#define REPLICATION_PIPELINE_HPP

#include "sink.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

// Set from the SIGINT handler, checked by every running step
class CancellationToken {
public:
    void cancel() { m_cancelled.store(true); }
    bool cancelled() const { return m_cancelled.load(); }
    void reset() { m_cancelled.store(false); }

private:
    std::atomic<bool> m_cancelled{false};
};

struct PipelineDestination {
    std::string group;
    std::shared_ptr<Sink> sink;
};

struct PipelineResult {
    std::string group;
    std::string sink;
    bool success{false};
    std::string checksum;    // computed while streaming
    uint64_t byteCount{0};
    std::string error;
};

class ReplicationPipeline {
public:
    ReplicationPipeline(size_t chunkSize, size_t queueDepth,
                        std::chrono::seconds timeout = std::chrono::seconds(0),
                        const CancellationToken* cancellation = nullptr);

    /// @brief Stream source to every destination under key. Never throws for sink or
    /// source failures; those are reported per destination.
    std::vector<PipelineResult> run(ByteSource& source, const ArtifactKey& key,
                                    const std::vector<PipelineDestination>& destinations);

private:
    size_t m_chunkSize;
    size_t m_queueDepth;
    std::chrono::seconds m_timeout;
    const CancellationToken* m_cancellation;
};

#endif // REPLICATION_PIPELINE_HPP
