//
// Created by garrett on 2/24/25.
//

#ifndef REMOTE_CHANNEL_HPP
#define REMOTE_CHANNEL_HPP

#include "snapshot_provider.hpp"

#include <memory>
#include <optional>
#include <string>

/// Address of a host reachable over the secure channel
struct RemoteHost {
    std::string host;
    std::optional<std::string> user;
    std::optional<int> port;
    std::optional<std::string> keyPath;

    std::string label() const {
        return user ? *user + "@" + host : host;
    }
};

/// Push-style writer for one remote file. close() only returns once the remote side confirmed the write.
class RemoteWriter {
public:
    virtual ~RemoteWriter() = default;
    virtual void write(const char* data, size_t size) = 0;
    virtual void close() = 0;
    /// @brief Abandon the transfer, nothing is left at the destination path
    virtual void abort() noexcept = 0;
};

/// An authenticated session. All failures are reported as TransportError.
class RemoteSession {
public:
    virtual ~RemoteSession() = default;

    /// @brief Start writing path; the file only appears under its name after a successful close()
    virtual std::unique_ptr<RemoteWriter> writeFile(const std::string& path) = 0;
    virtual std::unique_ptr<ByteSource> readFile(const std::string& path) = 0;
    virtual bool exists(const std::string& path) = 0;
    virtual void remove(const std::string& path) = 0;
    virtual void makeDirectories(const std::string& path) = 0;
};

/// Secure channel abstraction (ssh in production)
class RemoteChannel {
public:
    virtual ~RemoteChannel() = default;
    virtual std::unique_ptr<RemoteSession> connect(const RemoteHost& host) = 0;
};

#endif // REMOTE_CHANNEL_HPP
