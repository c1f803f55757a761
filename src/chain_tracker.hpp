//
// Created by garrett on 2/25/25.
//

#ifndef CHAIN_TRACKER_HPP
#define CHAIN_TRACKER_HPP

#include "manifest_store.hpp"
#include "snapshot_provider.hpp"

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <tuple>
#include <vector>

// Where one step's stream has to go
struct StepDestination {
    std::string group;
    std::string sink;

    bool operator<(const StepDestination& other) const {
        return std::tie(group, sink) < std::tie(other.group, other.sink);
    }
    bool operator==(const StepDestination& other) const {
        return group == other.group && sink == other.sink;
    }
};

// One transfer of a dataset: full when base is empty, otherwise base -> target
struct PlannedStep {
    std::string dataset;
    std::optional<uint64_t> base;
    uint64_t target{0};
    std::vector<StepDestination> destinations;

    bool isFull() const { return !base.has_value(); }
};

// Snapshot the run works towards for one dataset
struct TargetDecision {
    uint64_t sequence{0};
    bool create{false};
};

// Decides, per dataset and per target group, which snapshots to create and which
// full or incremental transfers bring every sink of the group up to date.
class ChainTracker {
public:
    ChainTracker(std::string prefix, bool includeIntermediate);

    /// @brief Snapshot to back up. Creates prefix_1 on a fresh dataset, L+1 when data changed
    /// since the newest snapshot L, otherwise L. In repair mode nothing is created and an
    /// empty result means there is nothing to back up yet.
    /// @param recordedHighest highest sequence any manifest holds for the dataset; new
    /// snapshots are numbered past it so a stored sequence is never reused
    std::optional<TargetDecision> decideTarget(SnapshotProvider& provider, const std::string& dataset,
                                               const std::vector<uint64_t>& sourceSequences, bool repair,
                                               uint64_t recordedHighest = 0) const;

    /// @brief Steps one group needs, in ascending target order
    /// @param entries manifest entries of this group and dataset
    /// @param sourceSequences prefixed snapshots present on the source
    /// @throws ChainBrokenError when the recorded chain can't be continued or repaired
    std::vector<PlannedStep> planGroup(const std::string& group, const std::string& dataset,
                                       const std::vector<std::string>& sinks,
                                       const std::vector<ManifestEntry>& entries,
                                       const std::set<uint64_t>& sourceSequences,
                                       uint64_t target, bool forceFull) const;

    /// @brief Combine the steps of several groups so identical (base, target) pairs are streamed once
    static std::vector<PlannedStep> merge(const std::vector<PlannedStep>& steps);

    const std::string& prefix() const { return m_prefix; }

private:
    std::string m_prefix;
    bool m_includeIntermediate;
};

#endif // CHAIN_TRACKER_HPP
