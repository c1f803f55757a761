//
// Created by garrett on 2/24/25.
//

#ifndef CHECKSUM_HPP
#define CHECKSUM_HPP

#include <openssl/sha.h>

#include <cstdint>
#include <string>

class ByteSource;

// Incremental SHA-256, hex encoded the way sha256sum prints it
class StreamingChecksum {
public:
    StreamingChecksum();

    void update(const char* data, size_t size);

    // Finish the digest. The object is reset afterwards and can be reused.
    std::string finalHex();

    uint64_t bytes() const { return m_bytes; }

private:
    SHA256_CTX m_context;
    uint64_t m_bytes;
};

struct ChecksumResult {
    std::string checksum;
    uint64_t byteCount;
};

// Drain a stream through SHA-256
ChecksumResult checksumSource(ByteSource& source, size_t bufferSize = 64 * 1024);

// Calculate SHA-256 hash for a file, throws IOError if it can't be read
ChecksumResult checksumFile(const std::string& filePath);

// "<hex> *<name>\n", the format sha256sum -b writes
std::string formatChecksumLine(const std::string& checksum, const std::string& fileName);

// First token of a sha256sum line, empty if it is not a SHA-256 hex digest
std::string parseChecksumLine(const std::string& line);

#endif // CHECKSUM_HPP
