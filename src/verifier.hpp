//
// Created by garrett on 2/24/25.
//

#ifndef VERIFIER_HPP
#define VERIFIER_HPP

#include "manifest_store.hpp"
#include "sink.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

// Re-reads stored artifacts and compares them to their manifest entries
class Verifier {
public:
    enum class Status {
        OK,
        CHECKSUM_MISMATCH,
        MISSING,
        UNREADABLE   // the sink could not be read, says nothing about the artifact
    };

    struct Finding {
        ManifestEntry entry;
        Status status{Status::UNREADABLE};
        std::string actualChecksum;
        uint64_t actualBytes{0};
        std::string detail;
    };

    // Sink for a manifest entry, nullptr if it is no longer configured
    using SinkLookup = std::function<std::shared_ptr<Sink>(const ManifestEntry&)>;

    explicit Verifier(int maxThreads = 1);

    Finding verifyEntry(const ManifestEntry& entry, Sink& sink) const;

    /// @brief Verify an artifact, throwing instead of classifying
    /// @throws ChecksumMismatchError, IOError or TransportError
    void verifyArtifact(const ManifestEntry& entry, Sink& sink) const;

    /// @brief Verify all entries, up to maxThreads at a time. Findings keep the input order.
    std::vector<Finding> verifyAll(const std::vector<ManifestEntry>& entries, const SinkLookup& sinks) const;

private:
    int m_maxThreads;
};

std::string toString(Verifier::Status status);

#endif // VERIFIER_HPP
