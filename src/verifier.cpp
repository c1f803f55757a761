//
// Created by garrett on 2/24/25.
//

#include "verifier.hpp"
#include "backup_errors.hpp"
#include "checksum.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <future>

std::string toString(Verifier::Status status) {
    switch (status) {
        case Verifier::Status::OK:
            return "ok";
        case Verifier::Status::CHECKSUM_MISMATCH:
            return "checksum_mismatch";
        case Verifier::Status::MISSING:
            return "missing";
        case Verifier::Status::UNREADABLE:
            return "unreadable";
    }
    return "unreadable";
}

Verifier::Verifier(int maxThreads) : m_maxThreads(std::max(1, maxThreads)) {}

Verifier::Finding Verifier::verifyEntry(const ManifestEntry& entry, Sink& sink) const {
    Finding finding;
    finding.entry = entry;
    ArtifactKey key{entry.dataset, entry.snapshotName};

    try {
        if (!sink.exists(key)) {
            finding.status = Status::MISSING;
            finding.detail = key.relativePath() + " not found on " + sink.id();
            return finding;
        }

        auto source = sink.read(key);
        ChecksumResult actual = checksumSource(*source);
        source->close();

        finding.actualChecksum = actual.checksum;
        finding.actualBytes = actual.byteCount;
        if (actual.checksum != entry.checksum || actual.byteCount != entry.byteCount) {
            finding.status = Status::CHECKSUM_MISMATCH;
            finding.detail = "expected " + entry.checksum + " (" + std::to_string(entry.byteCount) + " bytes), found " +
                             actual.checksum + " (" + std::to_string(actual.byteCount) + " bytes)";
        } else {
            finding.status = Status::OK;
        }
    } catch (const IOError& e) {
        finding.status = Status::UNREADABLE;
        finding.detail = e.what();
    } catch (const TransportError& e) {
        finding.status = Status::UNREADABLE;
        finding.detail = e.what();
    }
    return finding;
}

void Verifier::verifyArtifact(const ManifestEntry& entry, Sink& sink) const {
    ArtifactKey key{entry.dataset, entry.snapshotName};
    auto source = sink.read(key);
    ChecksumResult actual = checksumSource(*source);
    source->close();
    if (actual.checksum != entry.checksum || actual.byteCount != entry.byteCount) {
        throw ChecksumMismatchError(key.relativePath() + " on " + sink.id() + " does not match its manifest entry",
                                    entry.checksum, actual.checksum);
    }
}

std::vector<Verifier::Finding> Verifier::verifyAll(const std::vector<ManifestEntry>& entries,
                                                   const SinkLookup& sinks) const {
    std::vector<Finding> findings(entries.size());

    auto verifyOne = [&](size_t index) {
        const ManifestEntry& entry = entries[index];
        std::shared_ptr<Sink> sink = sinks(entry);
        if (!sink) {
            findings[index].entry = entry;
            findings[index].status = Status::UNREADABLE;
            findings[index].detail = "sink " + entry.sink + " is not configured";
        } else {
            findings[index] = verifyEntry(entry, *sink);
        }
        if (findings[index].status != Status::OK) {
            spdlog::warn("{}:{}@{} on {}: {} {}", entry.targetGroup, entry.dataset, entry.sequence, entry.sink,
                         toString(findings[index].status), findings[index].detail);
        } else {
            spdlog::debug("{}:{}@{} on {}: ok", entry.targetGroup, entry.dataset, entry.sequence, entry.sink);
        }
    };

    // Strided split over at most maxThreads workers, each writes only its own slots
    size_t numThreads = std::min(static_cast<size_t>(m_maxThreads), entries.size());
    if (numThreads <= 1) {
        for (size_t i = 0; i < entries.size(); ++i) {
            verifyOne(i);
        }
        return findings;
    }

    std::vector<std::future<void>> futures;
    for (size_t t = 0; t < numThreads; ++t) {
        futures.push_back(std::async(std::launch::async, [&verifyOne, &entries, t, numThreads]() {
            for (size_t j = t; j < entries.size(); j += numThreads) {
                verifyOne(j);
            }
        }));
    }
    for (auto& future : futures) {
        future.get();
    }
    return findings;
}
