//
// Created by garrett on 2/24/25.
//

#include "checksum.hpp"
#include "backup_errors.hpp"
#include "snapshot_provider.hpp"
#include "sys/file_descriptor.hpp"

#include <iomanip>
#include <sstream>
#include <vector>

StreamingChecksum::StreamingChecksum() : m_bytes(0) {
    SHA256_Init(&m_context);
}

void StreamingChecksum::update(const char* data, size_t size) {
    SHA256_Update(&m_context, data, size);
    m_bytes += size;
}

std::string StreamingChecksum::finalHex() {
    unsigned char result[SHA256_DIGEST_LENGTH];
    SHA256_Final(result, &m_context);

    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    for (int i = 0; i < SHA256_DIGEST_LENGTH; i++) {
        ss << std::setw(2) << static_cast<int>(result[i]);
    }

    SHA256_Init(&m_context);
    m_bytes = 0;
    return ss.str();
}

ChecksumResult checksumSource(ByteSource& source, size_t bufferSize) {
    StreamingChecksum checksum;
    std::vector<char> buffer(bufferSize);

    size_t n;
    while ((n = source.read(buffer.data(), buffer.size())) > 0) {
        checksum.update(buffer.data(), n);
    }

    uint64_t bytes = checksum.bytes();
    return {checksum.finalHex(), bytes};
}

ChecksumResult checksumFile(const std::string& filePath) {
    try {
        sys::FileDescriptor file(filePath, O_RDONLY);
        StreamingChecksum checksum;

        std::vector<char> buffer(64 * 1024);
        size_t n;
        while ((n = file.read(buffer.data(), buffer.size())) > 0) {
            checksum.update(buffer.data(), n);
        }

        uint64_t bytes = checksum.bytes();
        return {checksum.finalHex(), bytes};
    } catch (const std::system_error& e) {
        throw IOError(e.what());
    }
}

std::string formatChecksumLine(const std::string& checksum, const std::string& fileName) {
    return checksum + " *" + fileName + "\n";
}

std::string parseChecksumLine(const std::string& line) {
    std::string token = line.substr(0, line.find_first_of(" \t\r\n"));
    if (token.size() != SHA256_DIGEST_LENGTH * 2) {
        return "";
    }
    for (char c : token) {
        bool hex = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
        if (!hex) {
            return "";
        }
    }
    return token;
}
