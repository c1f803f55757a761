//
// Created by garrett on 2/23/25.
//

#include "backup_manager.hpp"
#include "backup_errors.hpp"
#include "chain_tracker.hpp"
#include "dataset_selector.hpp"
#include "local_sink.hpp"
#include "manifest_store.hpp"
#include "metrics_collector.hpp"
#include "remote_sink.hpp"
#include "replication_pipeline.hpp"
#include "restore_engine.hpp"
#include "snapshot_naming.hpp"
#include "step_runner.hpp"
#include "step_scheduler.hpp"
#include "verifier.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iomanip>
#include <ostream>
#include <set>

namespace {

bool startsWith(const std::string& value, const std::string& prefix) {
    return value.compare(0, prefix.size(), prefix) == 0;
}

bool isSuccess(const std::string& status) {
    static const std::set<std::string> ok{"complete", "up_to_date", "ok", "restored", "initialized", "planned"};
    return ok.count(status) > 0;
}

std::string describeStep(const PlannedStep& step, const std::string& prefix) {
    std::string target = formatSnapshotName(prefix, step.target);
    if (step.isFull()) {
        return "full " + target;
    }
    return "incremental " + formatSnapshotName(prefix, *step.base) + " -> " + target;
}

}

int OperationReport::exitCode() const {
    if (fatal) {
        return 2;
    }
    int code = 0;
    for (const auto& row : rows) {
        if (row.status == "chain_broken") {
            return 2;
        }
        if (!isSuccess(row.status)) {
            code = 1;
        }
    }
    return code;
}

void OperationReport::print(std::ostream& out) const {
    if (fatal) {
        out << "FATAL: " << fatalError << std::endl;
    }
    size_t groupWidth = 5;
    size_t subjectWidth = 7;
    for (const auto& row : rows) {
        groupWidth = std::max(groupWidth, row.group.size());
        subjectWidth = std::max(subjectWidth, row.subject.size());
    }
    if (rows.empty()) {
        return;
    }
    out << std::left << std::setw(groupWidth + 2) << "GROUP" << std::setw(subjectWidth + 2) << "DATASET"
        << std::setw(19) << "STATUS" << "DETAIL" << std::endl;
    for (const auto& row : rows) {
        out << std::left << std::setw(groupWidth + 2) << row.group << std::setw(subjectWidth + 2) << row.subject
            << std::setw(19) << row.status << row.detail << std::endl;
    }
}

BackupManager::BackupManager(Configuration config, std::shared_ptr<SnapshotProvider> provider,
                             std::shared_ptr<RemoteChannel> channel, std::shared_ptr<MetricsCollector> metrics,
                             const CancellationToken* cancellation)
    : m_config(std::move(config)),
      m_provider(std::move(provider)),
      m_channel(std::move(channel)),
      m_metrics(std::move(metrics)),
      m_cancellation(cancellation) {
    m_config.validate();
    m_manifest = std::make_unique<ManifestStore>(m_config.general.manifest_dir);

    bool verifyAfterWrite = m_config.general.verify_after_write;
    for (const auto& [name, group] : m_config.target_groups) {
        auto remote = m_config.remoteFor(group);
        if (remote && !m_channel) {
            throw ConfigurationError("Target group " + name + " is remote but no remote channel is available");
        }
        auto& sinks = m_sinks[name];
        for (const auto& path : group.paths) {
            if (remote) {
                sinks.push_back(std::make_shared<RemoteSink>(m_channel, *remote, path, verifyAfterWrite));
            } else {
                sinks.push_back(std::make_shared<LocalSink>(path, verifyAfterWrite));
            }
        }
    }
}

BackupManager::~BackupManager() = default;

std::vector<std::shared_ptr<Sink>> BackupManager::sinksOf(const std::string& group,
                                                          const std::string& targetFilter) const {
    std::vector<std::shared_ptr<Sink>> result;
    auto it = m_sinks.find(group);
    if (it == m_sinks.end()) {
        return result;
    }
    for (const auto& sink : it->second) {
        if (startsWith(sink->id(), targetFilter)) {
            result.push_back(sink);
        }
    }
    return result;
}

std::shared_ptr<Sink> BackupManager::findSink(const std::string& group, const std::string& sinkId) const {
    for (const auto& sink : sinksOf(group)) {
        if (sink->id() == sinkId) {
            return sink;
        }
    }
    return nullptr;
}

std::map<std::string, std::vector<std::string>> BackupManager::selectDatasets(const std::string& datasetFilter) const {
    DatasetSelector selector(*m_provider);
    std::map<std::string, std::vector<std::string>> selected;
    for (const auto& source : m_config.sources) {
        for (const auto& dataset : selector.select(source, datasetFilter)) {
            auto& groups = selected[dataset];
            for (const auto& target : source.targets) {
                if (std::find(groups.begin(), groups.end(), target) == groups.end()) {
                    groups.push_back(target);
                }
            }
        }
    }
    for (auto& [dataset, groups] : selected) {
        std::sort(groups.begin(), groups.end());
    }
    return selected;
}

OperationReport BackupManager::initializeTargets() {
    OperationReport report;
    for (const auto& [group, sinks] : m_sinks) {
        for (const auto& sink : sinks) {
            try {
                if (sink->isInitialized()) {
                    report.rows.push_back({group, sink->id(), "initialized", "already initialized"});
                    continue;
                }
                sink->initialize();
                spdlog::info("Initialized {}", sink->id());
                report.rows.push_back({group, sink->id(), "initialized", ""});
            } catch (const IOError& e) {
                report.rows.push_back({group, sink->id(), "failed", e.what()});
            } catch (const TransportError& e) {
                report.rows.push_back({group, sink->id(), "failed", e.what()});
            }
        }
    }
    return report;
}

OperationReport BackupManager::list(std::ostream& out, bool plain) {
    OperationReport report;
    if (plain) {
        std::set<std::pair<std::string, uint64_t>> stored;
        for (const auto& [group, sinks] : m_sinks) {
            for (const auto& entry : m_manifest->completeEntries(group, "")) {
                stored.emplace(entry.dataset, entry.sequence);
            }
        }
        for (const auto& [dataset, sequence] : stored) {
            out << dataset << "@" << formatSnapshotName(m_config.general.snapshot_prefix, sequence) << std::endl;
        }
        return report;
    }

    for (const auto& [group, sinks] : m_sinks) {
        for (const auto& dataset : m_manifest->datasets(group)) {
            out << group << ": " << dataset << std::endl;

            std::map<uint64_t, std::vector<ManifestEntry>> bySequence;
            for (auto& entry : m_manifest->entries(group, dataset)) {
                bySequence[entry.sequence].push_back(std::move(entry));
            }
            for (const auto& [sequence, entries] : bySequence) {
                const ManifestEntry& first = entries.front();
                out << "  " << first.snapshotName << "  "
                    << (first.baseSequence ? "incremental from " +
                                             formatSnapshotName(m_config.general.snapshot_prefix, *first.baseSequence)
                                           : std::string("full"));
                for (const auto& entry : entries) {
                    out << "  [" << entry.sink << ": " << toString(entry.status) << "]";
                }
                out << std::endl;
            }
        }
    }
    return report;
}

OperationReport BackupManager::backup(const BackupOptions& options) {
    OperationReport report;
    const GeneralConfig& general = m_config.general;
    auto started = std::chrono::steady_clock::now();

    std::map<std::string, std::vector<std::string>> datasets;
    try {
        datasets = selectDatasets(options.datasetFilter);
    } catch (const ConfigurationError& e) {
        report.fatal = true;
        report.fatalError = e.what();
        spdlog::error("{}", e.what());
        return report;
    }

    ChainTracker tracker(general.snapshot_prefix, general.include_intermediate_snapshots);
    std::vector<PlannedStep> planned;

    // (group, dataset) -> status decided before any step ran
    std::map<std::pair<std::string, std::string>, StatusRow> decided;
    std::vector<std::pair<std::string, std::string>> pairs;

    for (const auto& [dataset, allGroups] : datasets) {
        std::vector<std::string> groups;
        for (const auto& group : allGroups) {
            if (!sinksOf(group, options.targetFilter).empty()) {
                groups.push_back(group);
                pairs.emplace_back(group, dataset);
            }
        }
        if (groups.empty()) {
            continue;
        }

        std::set<uint64_t> sourceSequences;
        std::optional<TargetDecision> decision;
        try {
            uint64_t recordedHighest = 0;
            for (const auto& group : allGroups) {
                for (const auto& entry : m_manifest->entries(group, dataset)) {
                    recordedHighest = std::max(recordedHighest, entry.sequence);
                }
            }
            auto sequences = snapshotSequences(general.snapshot_prefix, m_provider->listSnapshots(dataset));
            decision = tracker.decideTarget(*m_provider, dataset, sequences, options.repair, recordedHighest);
            sourceSequences.insert(sequences.begin(), sequences.end());
            if (decision && decision->create) {
                std::string name = formatSnapshotName(general.snapshot_prefix, decision->sequence);
                if (options.dryRun) {
                    spdlog::info("Would create snapshot {}@{}", dataset, name);
                } else {
                    m_provider->createSnapshot(dataset, name, false);
                }
                sourceSequences.insert(decision->sequence);
            }
        } catch (const SnapshotProviderError& e) {
            spdlog::error("Cannot snapshot {}: {}", dataset, e.what());
            for (const auto& group : groups) {
                decided[{group, dataset}] = StatusRow{group, dataset, "failed", e.what()};
            }
            continue;
        }

        if (!decision) {
            for (const auto& group : groups) {
                decided[{group, dataset}] = StatusRow{group, dataset, "up_to_date", "no backup snapshot on the source"};
            }
            continue;
        }

        for (const auto& group : groups) {
            std::vector<std::string> sinkIds;
            for (const auto& sink : sinksOf(group, options.targetFilter)) {
                sinkIds.push_back(sink->id());
            }
            try {
                auto steps = tracker.planGroup(group, dataset, sinkIds, m_manifest->entries(group, dataset),
                                               sourceSequences, decision->sequence, options.forceFull);
                planned.insert(planned.end(), steps.begin(), steps.end());
            } catch (const ChainBrokenError& e) {
                spdlog::error("{}", e.what());
                decided[{group, dataset}] = StatusRow{group, dataset, "chain_broken", e.what()};
            }
        }
    }

    std::vector<PlannedStep> steps = ChainTracker::merge(planned);

    if (options.dryRun) {
        std::map<std::pair<std::string, std::string>, std::vector<std::string>> plans;
        for (const auto& step : steps) {
            std::map<std::string, size_t> perGroup;
            for (const auto& destination : step.destinations) {
                ++perGroup[destination.group];
            }
            for (const auto& [group, count] : perGroup) {
                plans[{group, step.dataset}].push_back(describeStep(step, general.snapshot_prefix) + " to " +
                                                       std::to_string(count) + " sink(s)");
            }
        }
        for (const auto& key : pairs) {
            if (auto it = decided.find(key); it != decided.end()) {
                report.rows.push_back(it->second);
            } else if (auto plan = plans.find(key); plan != plans.end()) {
                std::string detail;
                for (const auto& line : plan->second) {
                    detail += (detail.empty() ? "" : "; ") + line;
                }
                report.rows.push_back({key.first, key.second, "planned", detail});
            } else {
                report.rows.push_back({key.first, key.second, "up_to_date", ""});
            }
        }
        return report;
    }

    ReplicationPipeline pipeline(general.chunk_size, general.queue_depth,
                                 std::chrono::seconds(general.step_timeout_seconds), m_cancellation);
    StepRunner runner(*m_manifest, *m_provider, pipeline,
                      [this](const StepDestination& destination) { return findSink(destination.group, destination.sink); },
                      general.snapshot_prefix, m_metrics.get());

    StepScheduler scheduler(static_cast<size_t>(general.num_threads));
    std::vector<StepReport> stepReports(steps.size());
    std::map<std::string, size_t> lastStepOfDataset;

    for (size_t i = 0; i < steps.size(); ++i) {
        std::vector<size_t> dependencies;
        if (auto it = lastStepOfDataset.find(steps[i].dataset); it != lastStepOfDataset.end()) {
            dependencies.push_back(it->second);
        }
        std::string name = steps[i].dataset + " " + describeStep(steps[i], general.snapshot_prefix);
        lastStepOfDataset[steps[i].dataset] = scheduler.addTask(name, [&, i] {
            const PlannedStep& step = steps[i];
            if (m_cancellation && m_cancellation->cancelled()) {
                stepReports[i].step = step;
                for (const auto& destination : step.destinations) {
                    stepReports[i].destinations.push_back({destination, DestinationOutcome::FAILED, "cancelled"});
                }
                return;
            }
            try {
                stepReports[i] = runner.run(step);
            } catch (const std::exception& e) {
                // Manifest or lock failure, the step did not get to record anything
                spdlog::error("Step {} failed: {}", describeStep(step, general.snapshot_prefix), e.what());
                stepReports[i].step = step;
                stepReports[i].destinations.clear();
                for (const auto& destination : step.destinations) {
                    stepReports[i].destinations.push_back({destination, DestinationOutcome::FAILED, e.what()});
                }
            }
        }, dependencies);
    }

    scheduler.run();

    std::map<std::pair<std::string, std::string>, std::vector<std::pair<const PlannedStep*, DestinationReport>>> outcomes;
    for (const auto& stepReport : stepReports) {
        for (const auto& destination : stepReport.destinations) {
            outcomes[{destination.destination.group, stepReport.step.dataset}].emplace_back(&stepReport.step, destination);
        }
    }

    for (const auto& key : pairs) {
        if (auto it = decided.find(key); it != decided.end()) {
            report.rows.push_back(it->second);
            continue;
        }

        StatusRow row{key.first, key.second, "up_to_date", ""};
        bool failed = false;
        bool blocked = false;
        uint64_t newest = 0;
        for (const auto& [step, destination] : outcomes[key]) {
            switch (destination.outcome) {
                case DestinationOutcome::FAILED:
                    if (!failed) {
                        row.detail = destination.destination.sink + ": " + destination.detail;
                    }
                    failed = true;
                    break;
                case DestinationOutcome::BLOCKED:
                    if (!failed && !blocked) {
                        row.detail = destination.destination.sink + ": " + destination.detail;
                    }
                    blocked = true;
                    break;
                case DestinationOutcome::COMPLETE:
                    newest = std::max(newest, step->target);
                    row.status = "complete";
                    break;
                case DestinationOutcome::ALREADY_DONE:
                    break;
            }
        }
        if (failed) {
            row.status = "failed";
        } else if (blocked) {
            row.status = "blocked";
        } else if (newest > 0) {
            row.detail = "stored " + formatSnapshotName(general.snapshot_prefix, newest);
        }
        report.rows.push_back(std::move(row));
    }

    for (const auto& [group, sinks] : m_sinks) {
        try {
            m_manifest->compactIfNeeded(group);
        } catch (const IOError& e) {
            spdlog::warn("Manifest compaction for {} failed: {}", group, e.what());
        }
    }

    if (m_metrics) {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
        m_metrics->recordMetric("backup_duration_ms", std::to_string(elapsed.count()));
        m_metrics->recordMetric("steps_planned", std::to_string(steps.size()));
    }
    return report;
}

OperationReport BackupManager::verify(const VerifyOptions& options) {
    OperationReport report;
    Verifier verifier(m_config.general.num_threads);

    for (const auto& [group, allSinks] : m_sinks) {
        auto sinks = sinksOf(group, options.targetFilter);
        if (sinks.empty()) {
            continue;
        }
        std::set<std::string> sinkIds;
        for (const auto& sink : sinks) {
            sinkIds.insert(sink->id());
        }

        std::vector<ManifestEntry> entries;
        for (auto& entry : m_manifest->completeEntries(group, options.datasetFilter)) {
            if (sinkIds.count(entry.sink)) {
                entries.push_back(std::move(entry));
            }
        }

        auto findings = verifier.verifyAll(entries, [this, &group = group](const ManifestEntry& entry) {
            return findSink(group, entry.sink);
        });

        // dataset -> status -> count
        std::map<std::string, std::map<Verifier::Status, size_t>> summary;
        std::map<std::string, std::string> firstProblem;
        for (const auto& finding : findings) {
            const ManifestEntry& entry = finding.entry;
            ++summary[entry.dataset][finding.status];
            if (m_metrics) {
                m_metrics->incrementCounter("artifacts_verified");
            }
            if (finding.status != Verifier::Status::OK && !firstProblem.count(entry.dataset)) {
                firstProblem[entry.dataset] = entry.snapshotName + " on " + entry.sink + ": " + finding.detail;
            }

            if (finding.status == Verifier::Status::CHECKSUM_MISMATCH) {
                m_manifest->demote(group, entry.sink, entry.dataset, entry.sequence, EntryStatus::FAILED,
                                   "verification: " + finding.detail);
                if (options.removeCorrupted) {
                    try {
                        findSink(group, entry.sink)->remove(ArtifactKey{entry.dataset, entry.snapshotName});
                    } catch (const IOError& e) {
                        spdlog::error("Cannot remove corrupted {}: {}", entry.snapshotName, e.what());
                    } catch (const TransportError& e) {
                        spdlog::error("Cannot remove corrupted {}: {}", entry.snapshotName, e.what());
                    }
                }
            } else if (finding.status == Verifier::Status::MISSING) {
                m_manifest->demote(group, entry.sink, entry.dataset, entry.sequence, EntryStatus::MISSING,
                                   "verification: " + finding.detail);
            }
        }

        for (const auto& [dataset, counts] : summary) {
            // Worst status wins the row
            Verifier::Status worst = Verifier::Status::OK;
            for (auto status : {Verifier::Status::UNREADABLE, Verifier::Status::MISSING,
                                Verifier::Status::CHECKSUM_MISMATCH}) {
                if (counts.count(status)) {
                    worst = status;
                }
            }
            std::string detail;
            for (const auto& [status, count] : counts) {
                detail += (detail.empty() ? "" : ", ") + std::to_string(count) + " " + toString(status);
            }
            if (worst != Verifier::Status::OK) {
                detail += "; " + firstProblem[dataset];
            }
            report.rows.push_back({group, dataset, toString(worst), detail});
        }
    }
    return report;
}

OperationReport BackupManager::restore(const RestoreOptions& options) {
    OperationReport report;
    const std::string& prefix = m_config.general.snapshot_prefix;

    std::vector<std::string> groups;
    if (options.group) {
        if (!m_sinks.count(*options.group)) {
            report.fatal = true;
            report.fatalError = "Unknown target group " + *options.group;
            return report;
        }
        groups.push_back(*options.group);
    } else {
        for (const auto& [group, sinks] : m_sinks) {
            groups.push_back(group);
        }
    }

    std::set<std::string> datasets;
    for (const auto& group : groups) {
        for (const auto& dataset : m_manifest->datasets(group)) {
            if (startsWith(dataset, options.datasetFilter)) {
                datasets.insert(dataset);
            }
        }
    }

    std::string root = options.destinationRoot;
    while (root.size() > 1 && root.back() == '/') {
        root.pop_back();
    }

    Verifier verifier(m_config.general.num_threads);
    RestoreEngine engine(*m_manifest, *m_provider, verifier, prefix);

    for (const auto& dataset : datasets) {
        std::string destination = root == "." ? dataset : root + "/" + dataset;
        std::vector<std::string> failures;
        bool handled = false;

        for (const auto& group : groups) {
            if (m_manifest->entries(group, dataset).empty()) {
                continue;
            }
            RestoreRequest request{group, dataset, options.sequence, destination, options.incremental};

            if (options.dryRun) {
                std::string detail = "into " + destination;
                if (options.sequence) {
                    detail += " up to " + formatSnapshotName(prefix, *options.sequence);
                }
                report.rows.push_back({group, dataset, "planned", detail});
                handled = true;
                break;
            }

            try {
                RestoreResult result = engine.restore(request, sinksOf(group));
                std::string detail = result.applied.empty()
                    ? "already at " + formatSnapshotName(prefix, result.sequence)
                    : "applied " + std::to_string(result.applied.size()) + " artifact(s) from " + result.sink +
                          " up to " + formatSnapshotName(prefix, result.sequence) + " into " + destination;
                report.rows.push_back({group, dataset, "restored", detail});
                handled = true;
                break;
            } catch (const ChainBrokenError& e) {
                spdlog::warn("{}", e.what());
                failures.push_back(group + ": " + e.what());
            } catch (const SnapshotProviderError& e) {
                report.rows.push_back({group, dataset, "failed", e.what()});
                handled = true;
                break;
            } catch (const IOError& e) {
                report.rows.push_back({group, dataset, "failed", e.what()});
                handled = true;
                break;
            } catch (const TransportError& e) {
                report.rows.push_back({group, dataset, "failed", e.what()});
                handled = true;
                break;
            }
        }

        if (!handled) {
            std::string detail;
            for (const auto& failure : failures) {
                detail += (detail.empty() ? "" : "; ") + failure;
            }
            report.rows.push_back({options.group.value_or("*"), dataset, "chain_broken", detail});
        }
    }
    return report;
}
