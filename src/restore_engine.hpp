//
// Created by garrett on 2/27/25.
//

#ifndef RESTORE_ENGINE_HPP
#define RESTORE_ENGINE_HPP

#include "manifest_store.hpp"
#include "sink.hpp"
#include "snapshot_provider.hpp"
#include "verifier.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

struct RestoreRequest {
    std::string group;
    std::string dataset;
    std::optional<uint64_t> sequence;   // newest group-complete sequence when empty
    std::string destination;            // dataset the streams are received into
    bool incremental{false};            // only apply what the destination does not have yet
};

struct RestoreResult {
    std::string sink;
    std::vector<uint64_t> applied;
    uint64_t sequence{0};
};

// Replays a dataset's chain of artifacts, full first, into the receive side of the provider
class RestoreEngine {
public:
    RestoreEngine(ManifestStore& manifest, SnapshotProvider& provider, const Verifier& verifier, std::string prefix);

    /// @brief Restore from the first sink of the group holding a complete chain that verifies.
    /// Every artifact is verified before the first one is applied.
    /// @throws ChainBrokenError if no sink has a usable chain
    RestoreResult restore(const RestoreRequest& request, const std::vector<std::shared_ptr<Sink>>& sinks);

    /// @brief Chain from the full artifact to sequence as stored on one sink, ascending
    /// @throws ChainBrokenError if a link is not complete on that sink
    std::vector<ManifestEntry> chainFor(const std::vector<ManifestEntry>& entries, const std::string& sink,
                                        uint64_t sequence) const;

    /// @brief Newest sequence complete on every given sink
    static std::optional<uint64_t> newestGroupComplete(const std::vector<ManifestEntry>& entries,
                                                       const std::vector<std::string>& sinks);

private:
    ManifestStore& m_manifest;
    SnapshotProvider& m_provider;
    const Verifier& m_verifier;
    std::string m_prefix;
};

#endif // RESTORE_ENGINE_HPP
