//
// Created by garrett on 2/26/25.
//

#include "replication_pipeline.hpp"
#include "bounded_chunk_queue.hpp"
#include "checksum.hpp"

#include <spdlog/spdlog.h>

#include <condition_variable>
#include <mutex>
#include <thread>

namespace {

// Per destination state shared between the producer and its writer thread
struct Lane {
    PipelineDestination destination;
    std::unique_ptr<BoundedChunkQueue> queue;
    std::unique_ptr<ArtifactWriter> writer;
    PipelineResult result;
    bool live{false};
};

// Reason every destination was aborted, first one wins
class AbortReason {
public:
    void set(const std::string& reason) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_reason.empty()) {
            m_reason = reason;
        }
    }

    std::string get() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_reason.empty() ? "stream aborted" : m_reason;
    }

private:
    mutable std::mutex m_mutex;
    std::string m_reason;
};

void consume(Lane& lane, const ArtifactKey& key, const AbortReason& abortReason) {
    StreamingChecksum checksum;
    const std::string& sinkId = lane.destination.sink->id();

    try {
        while (auto chunk = lane.queue->pop()) {
            const Chunk& data = **chunk;
            lane.writer->write(data.data(), data.size());
            checksum.update(data.data(), data.size());
        }

        if (lane.queue->aborted()) {
            lane.writer->abort();
            lane.result.error = abortReason.get();
            return;
        }

        lane.result.byteCount = checksum.bytes();
        lane.result.checksum = checksum.finalHex();

        ChecksumResult stored = lane.writer->finalize();
        if (stored.checksum != lane.result.checksum || stored.byteCount != lane.result.byteCount) {
            lane.result.error = "checksum mismatch after write: streamed " + lane.result.checksum + " (" +
                                std::to_string(lane.result.byteCount) + " bytes), stored " + stored.checksum +
                                " (" + std::to_string(stored.byteCount) + " bytes)";
            spdlog::error("{} on {}: {}", key.relativePath(), sinkId, lane.result.error);
            lane.destination.sink->remove(key);
            return;
        }
        lane.result.success = true;
    } catch (const std::exception& e) {
        // Stop the producer feeding this lane, leave the others alone
        lane.queue->abort();
        lane.writer->abort();
        if (lane.result.error.empty()) {
            lane.result.error = e.what();
        }
        spdlog::error("Writing {} to {} failed: {}", key.relativePath(), sinkId, e.what());
    }
}

}

ReplicationPipeline::ReplicationPipeline(size_t chunkSize, size_t queueDepth, std::chrono::seconds timeout,
                                         const CancellationToken* cancellation)
    : m_chunkSize(chunkSize == 0 ? 1 : chunkSize),
      m_queueDepth(queueDepth),
      m_timeout(timeout),
      m_cancellation(cancellation) {}

std::vector<PipelineResult> ReplicationPipeline::run(ByteSource& source, const ArtifactKey& key,
                                                     const std::vector<PipelineDestination>& destinations) {
    std::vector<Lane> lanes(destinations.size());
    AbortReason abortReason;

    for (size_t i = 0; i < destinations.size(); ++i) {
        Lane& lane = lanes[i];
        lane.destination = destinations[i];
        lane.result.group = destinations[i].group;
        lane.result.sink = destinations[i].sink->id();
        try {
            lane.writer = destinations[i].sink->open(key);
            lane.queue = std::make_unique<BoundedChunkQueue>(m_queueDepth);
            lane.live = true;
        } catch (const std::exception& e) {
            lane.result.error = e.what();
            spdlog::error("Cannot open {} on {}: {}", key.relativePath(), lane.result.sink, e.what());
        }
    }

    auto abortAll = [&](const std::string& reason) {
        abortReason.set(reason);
        for (auto& lane : lanes) {
            if (lane.live) {
                lane.queue->abort();
            }
        }
    };

    std::vector<std::thread> writers;
    for (auto& lane : lanes) {
        if (lane.live) {
            writers.emplace_back(consume, std::ref(lane), std::cref(key), std::cref(abortReason));
        }
    }

    // Watchdog for cancellation and the step timeout; the producer may be blocked on a full queue
    std::mutex doneMutex;
    std::condition_variable doneCondition;
    bool done = false;
    auto deadline = std::chrono::steady_clock::now() + m_timeout;
    std::thread watchdog([&] {
        std::unique_lock<std::mutex> lock(doneMutex);
        while (!done) {
            doneCondition.wait_for(lock, std::chrono::milliseconds(100));
            if (done) {
                break;
            }
            if (m_cancellation && m_cancellation->cancelled()) {
                abortAll("cancelled");
                break;
            }
            if (m_timeout.count() > 0 && std::chrono::steady_clock::now() >= deadline) {
                abortAll("step timed out after " + std::to_string(m_timeout.count()) + "s");
                break;
            }
        }
    });

    bool sourceOk = !writers.empty();
    try {
        while (sourceOk) {
            auto chunk = std::make_shared<Chunk>(m_chunkSize);
            size_t filled = 0;
            while (filled < m_chunkSize) {
                size_t n = source.read(chunk->data() + filled, m_chunkSize - filled);
                if (n == 0) {
                    break;
                }
                filled += n;
            }
            if (filled == 0) {
                break;
            }
            chunk->resize(filled);
            ChunkPtr shared = std::move(chunk);

            bool anyLive = false;
            for (auto& lane : lanes) {
                if (lane.live && lane.queue->push(shared)) {
                    anyLive = true;
                }
            }
            if (!anyLive) {
                // Every destination failed or the step was aborted
                sourceOk = false;
            }
        }
        // Exit status of the send process decides whether the stream was complete
        source.close();
    } catch (const std::exception& e) {
        sourceOk = false;
        spdlog::error("Source stream for {} failed: {}", key.relativePath(), e.what());
        abortAll(std::string("source stream failed: ") + e.what());
    }

    for (auto& lane : lanes) {
        if (lane.live) {
            lane.queue->close();
        }
    }
    for (auto& writer : writers) {
        writer.join();
    }

    {
        std::lock_guard<std::mutex> lock(doneMutex);
        done = true;
    }
    doneCondition.notify_all();
    watchdog.join();

    std::vector<PipelineResult> results;
    for (auto& lane : lanes) {
        results.push_back(std::move(lane.result));
    }
    return results;
}
