//
// Created by garrett on 3/1/25.
//

#ifndef MOCK_REMOTE_CHANNEL_HPP
#define MOCK_REMOTE_CHANNEL_HPP

#include "backup_errors.hpp"
#include "mock_snapshot_provider.hpp"
#include "remote_channel.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>

// In-memory remote filesystem. Files appear only when a writer is closed.
class MockRemoteChannel : public RemoteChannel {
public:
    class Writer : public RemoteWriter {
    public:
        Writer(MockRemoteChannel& channel, std::string path) : m_channel(channel), m_path(std::move(path)) {}

        void write(const char* data, size_t size) override {
            std::lock_guard<std::mutex> lock(m_channel.m_mutex);
            if (m_channel.failWriteAfter && m_buffer.size() + size > *m_channel.failWriteAfter) {
                throw TransportError("connection reset");
            }
            m_buffer.append(data, size);
        }

        void close() override {
            std::lock_guard<std::mutex> lock(m_channel.m_mutex);
            m_channel.files[m_path] = m_buffer;
        }

        void abort() noexcept override {
            std::lock_guard<std::mutex> lock(m_channel.m_mutex);
            ++m_channel.aborts;
        }

    private:
        MockRemoteChannel& m_channel;
        std::string m_path;
        std::string m_buffer;
    };

    class Session : public RemoteSession {
    public:
        explicit Session(MockRemoteChannel& channel) : m_channel(channel) {}

        std::unique_ptr<RemoteWriter> writeFile(const std::string& path) override {
            return std::make_unique<Writer>(m_channel, path);
        }

        std::unique_ptr<ByteSource> readFile(const std::string& path) override {
            std::lock_guard<std::mutex> lock(m_channel.m_mutex);
            auto it = m_channel.files.find(path);
            if (it == m_channel.files.end()) {
                throw TransportError("cat: " + path + ": No such file or directory");
            }
            return std::make_unique<MemorySource>(it->second);
        }

        bool exists(const std::string& path) override {
            std::lock_guard<std::mutex> lock(m_channel.m_mutex);
            return m_channel.files.count(path) > 0 || m_channel.directories.count(path) > 0;
        }

        void remove(const std::string& path) override {
            std::lock_guard<std::mutex> lock(m_channel.m_mutex);
            m_channel.files.erase(path);
        }

        void makeDirectories(const std::string& path) override {
            std::lock_guard<std::mutex> lock(m_channel.m_mutex);
            m_channel.directories.insert(path);
        }

    private:
        MockRemoteChannel& m_channel;
    };

    std::unique_ptr<RemoteSession> connect(const RemoteHost& host) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (unreachable) {
            throw TransportError("ssh: connect to host " + host.host + " port 22: Connection refused");
        }
        ++connections;
        return std::make_unique<Session>(*this);
    }

    std::string file(const std::string& path) {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = files.find(path);
        return it == files.end() ? std::string() : it->second;
    }

    std::map<std::string, std::string> files;
    std::set<std::string> directories;
    std::optional<size_t> failWriteAfter;
    bool unreachable = false;
    int connections = 0;
    int aborts = 0;

private:
    std::mutex m_mutex;
};

#endif // MOCK_REMOTE_CHANNEL_HPP
