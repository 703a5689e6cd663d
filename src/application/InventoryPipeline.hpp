/**
 * @file InventoryPipeline.hpp
 * @brief End-to-end run: harvest, reconcile, write artifacts, optionally apply.
 */

#pragma once
#include <chrono>
#include <cstdint>
#include <ctime>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "application/ReconciliationEngine.hpp"
#include "application/ScanOrchestrator.hpp"
#include "domain/ArtifactSink.hpp"
#include "domain/CatalogRepository.hpp"

namespace bacnetinventory::application {

struct PipelineOptions {
    int maxParallelism = 10;
    std::chrono::milliseconds resolveTimeout{1500};
    std::chrono::milliseconds batchTimeout{0};      ///< Deadline of the harvest batch; 0 means none.
    bool applyToCatalog = false;
    domain::CatalogIdentifiers defaultIdentifiers;
};

/**
 * @struct DeviceRunSummary
 * @brief Per-device counters of one run.
 */
struct DeviceRunSummary {
    std::string deviceKey;
    bool harvested = false;             ///< Harvest completed and was reconciled.
    std::string status;                 ///< HarvestStatus text, or "Unresolved".
    std::size_t points = 0;
    std::size_t additions = 0;
    std::size_t changes = 0;            ///< Points with at least one changed column.
    std::size_t removals = 0;
    std::uint32_t readFailures = 0;
    int artifactFailures = 0;
    bool applied = false;
    std::vector<std::string> artifacts; ///< Paths written for this device.
};

/**
 * @struct RunReport
 * @brief Result of InventoryPipeline::run.
 */
struct RunReport {
    std::string runStamp;
    std::map<std::string, DeviceRunSummary> devices;
    int harvestFailures = 0;
    std::vector<std::string> summaries;     ///< Daily summary files rewritten at the end.

    std::size_t totalPoints() const;
    std::size_t totalAdditions() const;
    std::size_t totalChanges() const;
    std::size_t totalRemovals() const;
    int totalArtifactFailures() const;
};

/**
 * @class InventoryPipeline
 * @brief Drives one inventory run over an explicit device list.
 *
 * Devices whose harvest did not complete are reported but never reconciled,
 * so an unreachable device can not turn into a mass delete.
 */
class InventoryPipeline {
public:
    InventoryPipeline(ScanOrchestrator& orchestrator,
                      std::shared_ptr<domain::CatalogRepository> catalog,
                      std::shared_ptr<domain::ArtifactSink> artifacts,
                      PipelineOptions options);

    /**
     * @brief Runs the whole pipeline.
     * @param now Wall-clock time used for the run stamp and the artifact day.
     * @throws std::logic_error if reconciliation produces an inconsistent result.
     */
    RunReport run(const std::vector<domain::DeviceTarget>& targets,
                  domain::CancellationToken& cancelToken,
                  std::time_t now = std::time(nullptr));

private:
    void processDevice(const domain::DeviceTarget& target, const HarvestReport& report,
                       const std::string& runStamp, const std::string& timestamp,
                       DeviceRunSummary& summary);
    bool writeArtifact(domain::ArtifactKind kind, const std::string& deviceKey, const std::string& runStamp,
                       const std::string& content, DeviceRunSummary& summary);

    ScanOrchestrator& m_orchestrator;
    ReconciliationEngine m_engine;
    std::shared_ptr<domain::CatalogRepository> m_catalog;
    std::shared_ptr<domain::ArtifactSink> m_artifacts;
    PipelineOptions m_options;
};

} // namespace bacnetinventory::application
