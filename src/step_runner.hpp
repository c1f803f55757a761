//
// Created by garrett on 2/27/25.
//

#ifndef STEP_RUNNER_HPP
#define STEP_RUNNER_HPP

#include "chain_tracker.hpp"
#include "manifest_store.hpp"
#include "metrics_collector.hpp"
#include "replication_pipeline.hpp"
#include "snapshot_provider.hpp"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

enum class DestinationOutcome {
    COMPLETE,      // artifact stored and recorded complete
    FAILED,        // recorded failed
    BLOCKED,       // base artifact not complete on this sink
    ALREADY_DONE   // another run stored it in the meantime
};

std::string toString(DestinationOutcome outcome);

struct DestinationReport {
    StepDestination destination;
    DestinationOutcome outcome{DestinationOutcome::FAILED};
    std::string detail;
};

struct StepReport {
    PlannedStep step;
    std::vector<DestinationReport> destinations;
};

// Looks up the sink object for a (group, sink id) destination
using SinkResolver = std::function<std::shared_ptr<Sink>(const StepDestination&)>;

// Executes one planned step: locks the dataset in every involved group, re-reads the
// manifest, admits the destinations whose base is complete, streams once and records
// one manifest entry per destination.
class StepRunner {
public:
    StepRunner(ManifestStore& manifest, SnapshotProvider& provider, ReplicationPipeline& pipeline,
               SinkResolver sinks, std::string prefix, MetricsCollector* metrics = nullptr);

    StepReport run(const PlannedStep& step);

private:
    ManifestStore& m_manifest;
    SnapshotProvider& m_provider;
    ReplicationPipeline& m_pipeline;
    SinkResolver m_sinks;
    std::string m_prefix;
    MetricsCollector* m_metrics;

    ManifestEntry entryFor(const PlannedStep& step, const StepDestination& destination) const;
    void recordFailure(const PlannedStep& step, const StepDestination& destination, const std::string& error,
                       StepReport& report);
};

#endif // STEP_RUNNER_HPP
