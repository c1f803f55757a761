//
// Created by garrett on 2/25/25.
//

#ifndef FILE_DESCRIPTOR_HPP
#define FILE_DESCRIPTOR_HPP

#include <unistd.h>
#include <fcntl.h>
#include <cerrno>
#include <string>
#include <system_error>
#include <sys/stat.h>
#include <sys/file.h>

namespace sys {

class FileDescriptor {
private:
    int m_fd = -1;
    std::string m_path;

public:
    FileDescriptor() = default;

    explicit FileDescriptor(int fd) : m_fd(fd) {
        if (m_fd == -1) {
            throw std::system_error(errno, std::system_category(), "Invalid file descriptor");
        }
    }

    FileDescriptor(const std::string& path, int flags, mode_t mode = 0) : m_path(path) {
        do {
            m_fd = ::open(path.c_str(), flags | O_CLOEXEC, mode);
        } while (m_fd == -1 && errno == EINTR);
        if (m_fd == -1) {
            throw std::system_error(errno, std::system_category(),
                "Failed to open file: " + path);
        }
    }

    ~FileDescriptor() {
        if (m_fd != -1) {
            ::close(m_fd);
        }
    }

    // Prevent copying
    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    // Allow moving
    FileDescriptor(FileDescriptor&& other) noexcept : m_fd(other.m_fd), m_path(std::move(other.m_path)) {
        other.m_fd = -1;
    }

    FileDescriptor& operator=(FileDescriptor&& other) noexcept {
        if (this != &other) {
            if (m_fd != -1) {
                ::close(m_fd);
            }
            m_fd = other.m_fd;
            m_path = std::move(other.m_path);
            other.m_fd = -1;
        }
        return *this;
    }

    int fd() const { return m_fd; }

    bool isValid() const { return m_fd != -1; }

    const std::string& path() const { return m_path; }

    // Read up to bufferSize bytes, 0 means end of file
    size_t read(void* buffer, size_t bufferSize) {
        ssize_t result;
        do {
            result = ::read(m_fd, buffer, bufferSize);
        } while (result == -1 && errno == EINTR);
        if (result == -1) {
            throw std::system_error(errno, std::system_category(), "Failed to read from " + describe());
        }
        return static_cast<size_t>(result);
    }

    // Write the whole buffer, retrying short writes
    void writeAll(const void* buffer, size_t bufferSize) {
        const char* data = static_cast<const char*>(buffer);
        while (bufferSize > 0) {
            ssize_t result = ::write(m_fd, data, bufferSize);
            if (result == -1) {
                if (errno == EINTR) {
                    continue;
                }
                throw std::system_error(errno, std::system_category(), "Failed to write to " + describe());
            }
            data += result;
            bufferSize -= static_cast<size_t>(result);
        }
    }

    // Flush data and metadata to stable storage
    void sync() {
        if (::fsync(m_fd) == -1) {
            throw std::system_error(errno, std::system_category(), "Failed to fsync " + describe());
        }
    }

    // Exclusive advisory lock, blocks until granted
    void lockExclusive() {
        int result;
        do {
            result = ::flock(m_fd, LOCK_EX);
        } while (result == -1 && errno == EINTR);
        if (result == -1) {
            throw std::system_error(errno, std::system_category(), "Failed to lock " + describe());
        }
    }

    // Close explicitly so close errors (deferred write failures) are reported
    void close() {
        if (m_fd == -1) {
            return;
        }
        int fd = m_fd;
        m_fd = -1;
        if (::close(fd) == -1 && errno != EINTR) {
            throw std::system_error(errno, std::system_category(), "Failed to close " + describe());
        }
    }

    // Set file position
    off_t seek(off_t offset, int whence) {
        off_t result = lseek(m_fd, offset, whence);
        if (result == -1) {
            throw std::system_error(errno, std::system_category(), "Failed to seek in " + describe());
        }
        return result;
    }

    // Get file size
    off_t size() {
        struct stat st;
        if (fstat(m_fd, &st) == -1) {
            throw std::system_error(errno, std::system_category(), "Failed to get file size");
        }
        return st.st_size;
    }

private:
    std::string describe() const {
        return m_path.empty() ? "fd " + std::to_string(m_fd) : m_path;
    }
};

// fsync a directory so a rename inside it is durable
inline void syncDirectory(const std::string& path) {
    FileDescriptor dir(path, O_RDONLY | O_DIRECTORY);
    dir.sync();
}

}
#endif // FILE_DESCRIPTOR_HPP
