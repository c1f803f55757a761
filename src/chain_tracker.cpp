//
// Created by garrett on 2/25/25.
//

#include "chain_tracker.hpp"
#include "backup_errors.hpp"
#include "snapshot_naming.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <map>
#include <utility>

ChainTracker::ChainTracker(std::string prefix, bool includeIntermediate)
    : m_prefix(std::move(prefix)), m_includeIntermediate(includeIntermediate) {}

std::optional<TargetDecision> ChainTracker::decideTarget(SnapshotProvider& provider, const std::string& dataset,
                                                         const std::vector<uint64_t>& sourceSequences,
                                                         bool repair, uint64_t recordedHighest) const {
    if (sourceSequences.empty()) {
        if (repair) {
            return std::nullopt;
        }
        return TargetDecision{std::max(FIRST_SEQUENCE, recordedHighest + 1), true};
    }

    uint64_t latest = sourceSequences.back();
    if (repair) {
        return TargetDecision{latest, false};
    }
    if (provider.hasChangesSince(dataset, formatSnapshotName(m_prefix, latest))) {
        return TargetDecision{std::max(latest, recordedHighest) + 1, true};
    }
    return TargetDecision{latest, false};
}

std::vector<PlannedStep> ChainTracker::planGroup(const std::string& group, const std::string& dataset,
                                                 const std::vector<std::string>& sinks,
                                                 const std::vector<ManifestEntry>& entries,
                                                 const std::set<uint64_t>& sourceSequences,
                                                 uint64_t target, bool forceFull) const {
    std::set<std::string> configured(sinks.begin(), sinks.end());

    // sequence -> sink -> that sink's own entry
    std::map<uint64_t, std::map<std::string, const ManifestEntry*>> recorded;
    std::set<uint64_t> completeSequences;
    for (const auto& entry : entries) {
        if (entry.dataset != dataset || !configured.count(entry.sink)) {
            continue;
        }
        recorded[entry.sequence][entry.sink] = &entry;
        if (entry.isComplete()) {
            completeSequences.insert(entry.sequence);
        }
    }

    auto holds = [&](const std::string& sink, uint64_t sequence) {
        auto it = recorded.find(sequence);
        if (it == recorded.end()) {
            return false;
        }
        auto own = it->second.find(sink);
        return own != it->second.end() && own->second->isComplete();
    };

    auto lacking = [&](uint64_t sequence) {
        std::vector<StepDestination> result;
        for (const auto& sink : sinks) {
            if (!holds(sink, sequence)) {
                result.push_back({group, sink});
            }
        }
        return result;
    };

    // A sink follows its own recorded base; where it has no entry it takes the
    // link another sink completed, so a new or wiped sink copies a working chain
    auto linkFor = [&](const std::string& sink, uint64_t sequence) -> const ManifestEntry* {
        auto it = recorded.find(sequence);
        if (it == recorded.end()) {
            return nullptr;
        }
        auto own = it->second.find(sink);
        if (own != it->second.end()) {
            return own->second;
        }
        for (const auto& other : sinks) {
            auto found = it->second.find(other);
            if (found != it->second.end() && found->second->isComplete()) {
                return found->second;
            }
        }
        return it->second.begin()->second;
    };

    auto step = [&](std::optional<uint64_t> base, uint64_t to, std::vector<StepDestination> destinations) {
        return PlannedStep{dataset, base, to, std::move(destinations)};
    };

    std::vector<PlannedStep> steps;

    if (forceFull) {
        auto destinations = lacking(target);
        if (!destinations.empty()) {
            spdlog::info("{}:{} full resend of {} requested", group, dataset, formatSnapshotName(m_prefix, target));
            steps.push_back(step(std::nullopt, target, std::move(destinations)));
        }
        return steps;
    }

    if (completeSequences.empty()) {
        spdlog::debug("{}:{} has no complete artifact, starting with a full stream", group, dataset);
        steps.push_back(step(std::nullopt, target, lacking(target)));
        return steps;
    }

    uint64_t top = *completeSequences.rbegin();

    // Walk every sink's chain from the newest complete sequence back to its full artifact
    // and collect the links that sink is missing, keyed by (target, base)
    std::map<std::pair<uint64_t, std::optional<uint64_t>>, PlannedStep> repairs;
    for (const auto& sink : sinks) {
        uint64_t sequence = top;
        while (true) {
            const ManifestEntry* link = linkFor(sink, sequence);
            if (!link) {
                throw ChainBrokenError(group + ":" + dataset + " has no manifest entry for chain link " +
                                       formatSnapshotName(m_prefix, sequence));
            }
            if (link->baseSequence && *link->baseSequence >= sequence) {
                throw ChainBrokenError(group + ":" + dataset + " has a chain link pointing forward at " +
                                       formatSnapshotName(m_prefix, sequence));
            }
            if (!holds(sink, sequence)) {
                if (!sourceSequences.count(sequence) ||
                    (link->baseSequence && !sourceSequences.count(*link->baseSequence))) {
                    throw ChainBrokenError(group + ":" + dataset + " needs to repair " + link->snapshotName +
                                           " on " + sink + " but its snapshots are gone from the source");
                }
                auto key = std::make_pair(sequence, link->baseSequence);
                auto it = repairs.try_emplace(key, step(link->baseSequence, sequence, {})).first;
                it->second.destinations.push_back({group, sink});
            }
            if (!link->baseSequence) {
                break;
            }
            sequence = *link->baseSequence;
        }
    }

    for (auto& [key, repair] : repairs) {
        spdlog::info("{}:{} repairing {} on {} sink(s)", group, dataset, formatSnapshotName(m_prefix, repair.target),
                     repair.destinations.size());
        steps.push_back(std::move(repair));
    }

    if (target <= top) {
        return steps;
    }
    if (!sourceSequences.count(top)) {
        throw ChainBrokenError(group + ":" + dataset + " latest stored snapshot " +
                               formatSnapshotName(m_prefix, top) + " no longer exists on the source");
    }

    std::vector<StepDestination> everyone = lacking(target);
    if (m_includeIntermediate) {
        uint64_t previous = top;
        for (auto it = sourceSequences.upper_bound(top); it != sourceSequences.end() && *it <= target; ++it) {
            steps.push_back(step(previous, *it, everyone));
            previous = *it;
        }
        if (previous != target) {
            steps.push_back(step(previous, target, everyone));
        }
    } else {
        steps.push_back(step(top, target, everyone));
    }
    return steps;
}

std::vector<PlannedStep> ChainTracker::merge(const std::vector<PlannedStep>& steps) {
    std::map<std::tuple<std::string, uint64_t, bool, uint64_t>, PlannedStep> merged;
    for (const auto& step : steps) {
        auto key = std::make_tuple(step.dataset, step.target, step.base.has_value(), step.base.value_or(0));
        auto [it, inserted] = merged.try_emplace(key, PlannedStep{step.dataset, step.base, step.target, {}});
        for (const auto& destination : step.destinations) {
            auto& list = it->second.destinations;
            if (std::find(list.begin(), list.end(), destination) == list.end()) {
                list.push_back(destination);
            }
        }
    }

    std::vector<PlannedStep> result;
    for (auto& [key, step] : merged) {
        if (!step.destinations.empty()) {
            std::sort(step.destinations.begin(), step.destinations.end());
            result.push_back(std::move(step));
        }
    }
    return result;
}
