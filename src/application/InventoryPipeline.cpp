/**
 * @file InventoryPipeline.cpp
 * @brief Implementation of InventoryPipeline.
 */

#include "application/InventoryPipeline.hpp"
#include <stdexcept>
#include "domain/TimeFormat.hpp"
#include "infrastructure/Log.hpp"

namespace bacnetinventory::application {

using infrastructure::Log;

namespace {
constexpr const char* kTag = "InventoryPipeline";
}

std::size_t RunReport::totalPoints() const {
    std::size_t total = 0;
    for (const auto& [key, d] : devices) total += d.points;
    return total;
}

std::size_t RunReport::totalAdditions() const {
    std::size_t total = 0;
    for (const auto& [key, d] : devices) total += d.additions;
    return total;
}

std::size_t RunReport::totalChanges() const {
    std::size_t total = 0;
    for (const auto& [key, d] : devices) total += d.changes;
    return total;
}

std::size_t RunReport::totalRemovals() const {
    std::size_t total = 0;
    for (const auto& [key, d] : devices) total += d.removals;
    return total;
}

int RunReport::totalArtifactFailures() const {
    int total = 0;
    for (const auto& [key, d] : devices) total += d.artifactFailures;
    return total;
}

InventoryPipeline::InventoryPipeline(ScanOrchestrator& orchestrator,
                                     std::shared_ptr<domain::CatalogRepository> catalog,
                                     std::shared_ptr<domain::ArtifactSink> artifacts,
                                     PipelineOptions options)
    : m_orchestrator(orchestrator),
      m_catalog(std::move(catalog)),
      m_artifacts(std::move(artifacts)),
      m_options(std::move(options)) {
    if (!m_catalog || !m_artifacts) {
        throw std::invalid_argument("InventoryPipeline requires a catalog and an artifact sink");
    }
}

RunReport InventoryPipeline::run(const std::vector<domain::DeviceTarget>& targets,
                                 domain::CancellationToken& cancelToken,
                                 std::time_t now) {
    RunReport report;
    report.runStamp = domain::FormatRunStamp(now);
    const std::string timestamp = domain::FormatDateTime(now);

    Log::Info(kTag, "Run " + report.runStamp + ": " + std::to_string(targets.size()) + " device(s)");

    HarvestBatch batch = m_orchestrator.harvestMany(targets, m_options.maxParallelism, cancelToken,
                                                    m_options.resolveTimeout, m_options.batchTimeout);
    report.harvestFailures = batch.totalFailures();

    bool wroteAny = false;
    for (const auto& target : targets) {
        if (report.devices.count(target.deviceKey)) continue;
        DeviceRunSummary& summary = report.devices[target.deviceKey];
        summary.deviceKey = target.deviceKey;

        auto it = batch.reports.find(target.deviceKey);
        if (it == batch.reports.end()) {
            summary.status = "Unresolved";
            continue;
        }
        const HarvestReport& harvest = it->second;
        summary.status = HarvestStatusToString(harvest.status);
        summary.readFailures = harvest.readFailures;

        if (harvest.status != HarvestStatus::Completed) {
            Log::Warn(kTag, target.deviceKey + " not reconciled (" + summary.status + ")");
            continue;
        }
        if (cancelToken.isCancelled()) {
            Log::Warn(kTag, target.deviceKey + " not reconciled (run cancelled)");
            continue;
        }

        processDevice(target, harvest, report.runStamp, timestamp, summary);
        wroteAny = wroteAny || !summary.artifacts.empty();
    }

    if (wroteAny) {
        report.summaries = m_artifacts->mergeDaily(domain::FormatDay(now));
    }

    Log::Info(kTag, "Run " + report.runStamp + " done: " +
                    std::to_string(report.totalPoints()) + " points, +" +
                    std::to_string(report.totalAdditions()) + " ~" +
                    std::to_string(report.totalChanges()) + " -" +
                    std::to_string(report.totalRemovals()) + ", " +
                    std::to_string(report.harvestFailures) + " harvest failure(s), " +
                    std::to_string(report.totalArtifactFailures()) + " artifact failure(s)");
    return report;
}

void InventoryPipeline::processDevice(const domain::DeviceTarget& target, const HarvestReport& harvest,
                                      const std::string& runStamp, const std::string& timestamp,
                                      DeviceRunSummary& summary) {
    summary.harvested = true;
    summary.points = harvest.points.size();

    const auto rows = m_catalog->fetchRows(target.deviceKey);
    const auto result = m_engine.reconcile(target.deviceKey, harvest.deviceInstance, rows, harvest.points,
                                           m_options.defaultIdentifiers);
    summary.additions = result.additions.size();
    summary.changes = result.changedIds().size();
    summary.removals = result.removals.size();

    writeArtifact(domain::ArtifactKind::Snapshot, target.deviceKey, runStamp,
                  ReconciliationEngine::BuildSnapshotRows(target.deviceKey, harvest.deviceInstance,
                                                          harvest.points, timestamp),
                  summary);

    if (!result.additions.empty()) {
        writeArtifact(domain::ArtifactKind::Delta, target.deviceKey, runStamp,
                      ReconciliationEngine::BuildDeltaRows(result, timestamp), summary);
    }

    if (!result.empty()) {
        // History and script describe the same mutation and are written as a pair.
        writeArtifact(domain::ArtifactKind::History, target.deviceKey, runStamp,
                      ReconciliationEngine::BuildHistoryRows(result, timestamp), summary);
        writeArtifact(domain::ArtifactKind::Script, target.deviceKey, runStamp,
                      ReconciliationEngine::BuildMutationScript(result, timestamp), summary);
    }

    if (m_options.applyToCatalog && !result.empty()) {
        summary.applied = m_catalog->applyReconciliation(result);
        if (!summary.applied) {
            Log::Error(kTag, "Catalog update for " + target.deviceKey + " failed; artifacts kept");
        }
    }

    Log::Info(kTag, target.deviceKey + ": " + std::to_string(summary.points) + " points, +" +
                    std::to_string(summary.additions) + " ~" + std::to_string(summary.changes) +
                    " -" + std::to_string(summary.removals));
}

bool InventoryPipeline::writeArtifact(domain::ArtifactKind kind, const std::string& deviceKey,
                                      const std::string& runStamp, const std::string& content,
                                      DeviceRunSummary& summary) {
    std::string path = m_artifacts->write(kind, deviceKey, runStamp, content);
    if (path.empty()) {
        ++summary.artifactFailures;
        Log::Warn(kTag, domain::ArtifactKindToString(kind) + " artifact for " + deviceKey + " not written");
        return false;
    }
    summary.artifacts.push_back(path);
    return true;
}

} // namespace bacnetinventory::application
