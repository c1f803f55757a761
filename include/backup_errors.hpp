//
// Created by garrett on 2/24/25.
//

#ifndef BACKUP_ERRORS_HPP
#define BACKUP_ERRORS_HPP

#include <stdexcept>
#include <string>

// Invalid source/target reference or unusable configuration. Raised before any I/O.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& msg) : std::runtime_error(msg) {}
};

// A snapshot or artifact the incremental chain depends on is gone.
// Fatal for one (target group, dataset) pair only.
class ChainBrokenError : public std::runtime_error {
public:
    explicit ChainBrokenError(const std::string& msg) : std::runtime_error(msg) {}
};

// Local sink failure (disk full, permissions, uninitialized target).
class IOError : public std::runtime_error {
public:
    explicit IOError(const std::string& msg) : std::runtime_error(msg) {}
};

// Remote sink failure (connection loss, authentication, remote write failure).
class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& msg) : std::runtime_error(msg) {}
};

// The snapshot tool (zfs) failed to list, create, send or receive.
class SnapshotProviderError : public std::runtime_error {
public:
    explicit SnapshotProviderError(const std::string& msg) : std::runtime_error(msg) {}
};

// Stored artifact does not hash to the recorded checksum.
class ChecksumMismatchError : public std::runtime_error {
public:
    ChecksumMismatchError(const std::string& msg, std::string expected, std::string actual)
        : std::runtime_error(msg), m_expected(std::move(expected)), m_actual(std::move(actual)) {}

    const std::string& expected() const { return m_expected; }
    const std::string& actual() const { return m_actual; }

private:
    std::string m_expected;
    std::string m_actual;
};

#endif // BACKUP_ERRORS_HPP
