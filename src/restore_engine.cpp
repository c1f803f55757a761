//
// Created by garrett on 2/27/25.
//

#include "restore_engine.hpp"
#include "backup_errors.hpp"
#include "snapshot_naming.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <map>
#include <set>

RestoreEngine::RestoreEngine(ManifestStore& manifest, SnapshotProvider& provider, const Verifier& verifier,
                             std::string prefix)
    : m_manifest(manifest), m_provider(provider), m_verifier(verifier), m_prefix(std::move(prefix)) {}

std::optional<uint64_t> RestoreEngine::newestGroupComplete(const std::vector<ManifestEntry>& entries,
                                                           const std::vector<std::string>& sinks) {
    std::map<uint64_t, std::set<std::string>> complete;
    for (const auto& entry : entries) {
        if (entry.isComplete()) {
            complete[entry.sequence].insert(entry.sink);
        }
    }
    for (auto it = complete.rbegin(); it != complete.rend(); ++it) {
        bool everySink = std::all_of(sinks.begin(), sinks.end(),
                                     [&](const std::string& sink) { return it->second.count(sink) > 0; });
        if (everySink) {
            return it->first;
        }
    }
    return std::nullopt;
}

std::vector<ManifestEntry> RestoreEngine::chainFor(const std::vector<ManifestEntry>& entries,
                                                   const std::string& sink, uint64_t sequence) const {
    std::map<uint64_t, const ManifestEntry*> bySequence;
    for (const auto& entry : entries) {
        if (entry.sink == sink) {
            bySequence[entry.sequence] = &entry;
        }
    }

    std::vector<ManifestEntry> chain;
    uint64_t current = sequence;
    while (true) {
        auto it = bySequence.find(current);
        if (it == bySequence.end() || !it->second->isComplete()) {
            throw ChainBrokenError(formatSnapshotName(m_prefix, current) + " is not complete on " + sink);
        }
        chain.push_back(*it->second);
        if (!it->second->baseSequence) {
            break;
        }
        if (*it->second->baseSequence >= current) {
            throw ChainBrokenError("Chain link " + it->second->snapshotName + " on " + sink + " points forward");
        }
        current = *it->second->baseSequence;
    }
    std::reverse(chain.begin(), chain.end());
    return chain;
}

RestoreResult RestoreEngine::restore(const RestoreRequest& request, const std::vector<std::shared_ptr<Sink>>& sinks) {
    auto entries = m_manifest.entries(request.group, request.dataset);

    std::vector<std::string> sinkIds;
    for (const auto& sink : sinks) {
        sinkIds.push_back(sink->id());
    }

    uint64_t sequence;
    if (request.sequence) {
        sequence = *request.sequence;
    } else {
        auto newest = newestGroupComplete(entries, sinkIds);
        if (!newest) {
            throw ChainBrokenError(request.group + ":" + request.dataset + " has no snapshot stored on every sink");
        }
        sequence = *newest;
    }

    // Snapshots the destination already has, for incremental restores
    std::set<uint64_t> present;
    if (request.incremental) {
        auto existing = snapshotSequences(m_prefix, m_provider.listSnapshots(request.destination));
        present.insert(existing.begin(), existing.end());
    }

    std::vector<std::string> reasons;
    for (const auto& sink : sinks) {
        std::vector<ManifestEntry> chain;
        try {
            chain = chainFor(entries, sink->id(), sequence);
        } catch (const ChainBrokenError& e) {
            reasons.push_back(e.what());
            continue;
        }

        if (request.incremental) {
            auto newestPresent = std::find_if(chain.rbegin(), chain.rend(),
                                              [&](const ManifestEntry& entry) { return present.count(entry.sequence) > 0; });
            if (newestPresent != chain.rend()) {
                chain.erase(chain.begin(), newestPresent.base());
            }
            if (chain.empty()) {
                spdlog::info("{} already has {}", request.destination, formatSnapshotName(m_prefix, sequence));
                return RestoreResult{sink->id(), {}, sequence};
            }
        }

        bool usable = true;
        for (const auto& entry : chain) {
            try {
                m_verifier.verifyArtifact(entry, *sink);
            } catch (const ChecksumMismatchError& e) {
                reasons.push_back(e.what());
                usable = false;
            } catch (const IOError& e) {
                reasons.push_back(e.what());
                usable = false;
            } catch (const TransportError& e) {
                reasons.push_back(e.what());
                usable = false;
            }
            if (!usable) {
                break;
            }
        }
        if (!usable) {
            spdlog::warn("Chain of {} on {} does not verify, trying the next sink", request.dataset, sink->id());
            continue;
        }

        RestoreResult result{sink->id(), {}, sequence};
        for (const auto& entry : chain) {
            spdlog::info("Applying {}@{} from {} to {}", entry.dataset, entry.snapshotName, sink->id(),
                         request.destination);
            auto source = sink->read(ArtifactKey{entry.dataset, entry.snapshotName});
            m_provider.receiveStream(request.destination, *source);
            source->close();
            result.applied.push_back(entry.sequence);
        }
        return result;
    }

    std::string message = "No sink of " + request.group + " holds a verified chain for " + request.dataset + "@" +
                          formatSnapshotName(m_prefix, sequence);
    for (const auto& reason : reasons) {
        message += "; " + reason;
    }
    throw ChainBrokenError(message);
}
