//
// Created by garrett on 2/27/25.
//

#include "step_runner.hpp"
#include "snapshot_naming.hpp"

#include <spdlog/spdlog.h>

#include <set>

std::string toString(DestinationOutcome outcome) {
    switch (outcome) {
        case DestinationOutcome::COMPLETE:
            return "complete";
        case DestinationOutcome::FAILED:
            return "failed";
        case DestinationOutcome::BLOCKED:
            return "blocked";
        case DestinationOutcome::ALREADY_DONE:
            return "up_to_date";
    }
    return "failed";
}

StepRunner::StepRunner(ManifestStore& manifest, SnapshotProvider& provider, ReplicationPipeline& pipeline,
                       SinkResolver sinks, std::string prefix, MetricsCollector* metrics)
    : m_manifest(manifest),
      m_provider(provider),
      m_pipeline(pipeline),
      m_sinks(std::move(sinks)),
      m_prefix(std::move(prefix)),
      m_metrics(metrics) {}

ManifestEntry StepRunner::entryFor(const PlannedStep& step, const StepDestination& destination) const {
    ManifestEntry entry;
    entry.targetGroup = destination.group;
    entry.sink = destination.sink;
    entry.dataset = step.dataset;
    entry.sequence = step.target;
    entry.baseSequence = step.base;
    entry.snapshotName = formatSnapshotName(m_prefix, step.target);
    return entry;
}

void StepRunner::recordFailure(const PlannedStep& step, const StepDestination& destination,
                               const std::string& error, StepReport& report) {
    ManifestEntry entry = entryFor(step, destination);
    entry.status = EntryStatus::FAILED;
    entry.errorMessage = error;
    m_manifest.record(entry);
    report.destinations.push_back({destination, DestinationOutcome::FAILED, error});
    if (m_metrics) {
        m_metrics->incrementCounter("sinks_failed");
    }
}

StepReport StepRunner::run(const PlannedStep& step) {
    StepReport report{step, {}};
    std::string snapshot = formatSnapshotName(m_prefix, step.target);
    std::string description = step.dataset + "@" + snapshot +
        (step.base ? " from " + formatSnapshotName(m_prefix, *step.base) : std::string(" (full)"));

    // One lock per involved group, taken in name order
    std::set<std::string> groups;
    for (const auto& destination : step.destinations) {
        groups.insert(destination.group);
    }
    std::vector<ManifestStore::DatasetLock> locks;
    for (const auto& group : groups) {
        locks.push_back(m_manifest.lockDataset(group, step.dataset));
    }

    std::vector<PipelineDestination> admitted;
    std::vector<StepDestination> admittedKeys;
    for (const auto& destination : step.destinations) {
        auto existing = m_manifest.find(destination.group, destination.sink, step.dataset, step.target);
        if (existing && existing->isComplete()) {
            report.destinations.push_back({destination, DestinationOutcome::ALREADY_DONE, ""});
            continue;
        }
        if (step.base) {
            auto base = m_manifest.find(destination.group, destination.sink, step.dataset, *step.base);
            if (!base || !base->isComplete()) {
                spdlog::warn("{} blocked on {}:{}, base is not complete there", description,
                             destination.group, destination.sink);
                report.destinations.push_back({destination, DestinationOutcome::BLOCKED,
                                               "base " + formatSnapshotName(m_prefix, *step.base) + " not complete"});
                continue;
            }
        }
        admitted.push_back({destination.group, m_sinks(destination)});
        admittedKeys.push_back(destination);
    }

    if (admitted.empty()) {
        return report;
    }

    spdlog::info("Sending {} to {} sink(s)", description, admitted.size());

    std::unique_ptr<ByteSource> source;
    try {
        source = m_provider.sendStream(step.dataset,
                                       step.base ? std::optional<std::string>(formatSnapshotName(m_prefix, *step.base))
                                                 : std::nullopt,
                                       snapshot);
    } catch (const std::exception& e) {
        spdlog::error("Cannot start stream for {}: {}", description, e.what());
        for (const auto& destination : admittedKeys) {
            recordFailure(step, destination, std::string("source stream failed: ") + e.what(), report);
        }
        return report;
    }

    auto results = m_pipeline.run(*source, ArtifactKey{step.dataset, snapshot}, admitted);

    for (size_t i = 0; i < results.size(); ++i) {
        const auto& result = results[i];
        const auto& destination = admittedKeys[i];
        if (!result.success) {
            recordFailure(step, destination, result.error, report);
            continue;
        }

        ManifestEntry entry = entryFor(step, destination);
        entry.status = EntryStatus::COMPLETE;
        entry.checksum = result.checksum;
        entry.byteCount = result.byteCount;
        if (m_manifest.record(entry)) {
            report.destinations.push_back({destination, DestinationOutcome::COMPLETE, ""});
        } else {
            report.destinations.push_back({destination, DestinationOutcome::ALREADY_DONE, ""});
        }
        if (m_metrics) {
            m_metrics->incrementCounter("bytes_sent", result.byteCount);
        }
    }

    if (m_metrics) {
        m_metrics->incrementCounter("steps_completed");
    }
    spdlog::info("Finished {}", description);
    return report;
}
