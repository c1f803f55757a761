//
// Created by garrett on 2/24/25.
//
/*
Chunk queue between the stream producer and one sink writer
1. Bounded: the producer blocks when the sink falls queue_depth chunks behind.
2. Shared chunks: every sink queue holds the same immutable buffer, nothing is copied per sink.
3. Two ways to end: close() lets the consumer drain what is queued, abort() drops it.
*/

#ifndef BOUNDED_CHUNK_QUEUE_HPP
#define BOUNDED_CHUNK_QUEUE_HPP

#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

using Chunk = std::vector<char>;
using ChunkPtr = std::shared_ptr<const Chunk>;

class BoundedChunkQueue {
public:
    explicit BoundedChunkQueue(size_t maxSize = 16)
        : m_maxSize(maxSize == 0 ? 1 : maxSize), m_closed(false), m_aborted(false) {}

    BoundedChunkQueue(const BoundedChunkQueue&) = delete;
    BoundedChunkQueue& operator=(const BoundedChunkQueue&) = delete;

    // Add a chunk, waiting for room. Returns false if the queue was closed or aborted.
    bool push(ChunkPtr chunk) {
        std::unique_lock<std::mutex> lock(m_mutex);

        m_notFull.wait(lock, [this] {
            return m_chunks.size() < m_maxSize || m_closed || m_aborted;
        });

        if (m_closed || m_aborted) {
            return false;
        }

        m_chunks.push_back(std::move(chunk));
        m_notEmpty.notify_one();
        return true;
    }

    // Next chunk; nullopt once the queue is closed and drained, or aborted
    std::optional<ChunkPtr> pop() {
        std::unique_lock<std::mutex> lock(m_mutex);

        m_notEmpty.wait(lock, [this] {
            return !m_chunks.empty() || m_closed || m_aborted;
        });

        if (m_aborted || m_chunks.empty()) {
            return std::nullopt;
        }

        ChunkPtr chunk = std::move(m_chunks.front());
        m_chunks.pop_front();
        m_notFull.notify_one();
        return chunk;
    }

    // Producer is done, consumer drains the remaining chunks
    void close() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_closed = true;
        m_notEmpty.notify_all();
        m_notFull.notify_all();
    }

    // Drop everything and wake both sides
    void abort() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_aborted = true;
        m_chunks.clear();
        m_notEmpty.notify_all();
        m_notFull.notify_all();
    }

    bool aborted() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_aborted;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_chunks.size();
    }

private:
    mutable std::mutex m_mutex;
    std::condition_variable m_notEmpty;
    std::condition_variable m_notFull;
    std::deque<ChunkPtr> m_chunks;
    size_t m_maxSize;
    bool m_closed;
    bool m_aborted;
};

#endif // BOUNDED_CHUNK_QUEUE_HPP
