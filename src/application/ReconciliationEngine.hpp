/**
 * @file ReconciliationEngine.hpp
 * @brief Classifies a harvest against the catalog and renders the resulting artifacts.
 */

#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "domain/ArtifactSink.hpp"
#include "domain/CatalogRow.hpp"
#include "domain/HarvestedPoint.hpp"
#include "domain/ReconciliationResult.hpp"

namespace bacnetinventory::application {

/**
 * @class ReconciliationEngine
 * @brief Pure functions; no I/O and no shared state.
 */
class ReconciliationEngine {
public:
    /** @brief Catalog table the mutation scripts target. */
    static constexpr const char* kCatalogTable = "P_OBJECT";

    /** @brief Prefix that marks a daily summary file. */
    static constexpr const char* kSummaryPrefix = "TOTAL_";

    /**
     * @brief Diffs one device's harvest against its catalog rows.
     *
     * Tracked columns, compared in order: OBJ_NAME, OBJ_DESC, OBJ_UNIT,
     * OBJ_DECIMAL, OBJ_TYPE. New points inherit the identifiers of the
     * device's first catalog row, or @p defaults if it has none.
     * @throws std::logic_error if the result does not partition the two id sets.
     */
    domain::ReconciliationResult reconcile(const std::string& deviceKey,
                                           std::uint32_t deviceInstance,
                                           const std::vector<domain::CatalogRow>& catalogRows,
                                           const std::vector<domain::HarvestedPoint>& harvested,
                                           const domain::CatalogIdentifiers& defaults) const;

    static const std::vector<std::string>& TrackedColumns();

    /**
     * @brief Re-runnable SQL script: guarded inserts, updates, warned deletes,
     * all inside one transaction.
     */
    static std::string BuildMutationScript(const domain::ReconciliationResult& result, const std::string& timestamp);

    /** @brief CSV: DATETIME,DEVICE_SEQ,SYSTEM_PT_ID,ACTION,COLUMN,OLD_VALUE,NEW_VALUE. */
    static std::string BuildHistoryRows(const domain::ReconciliationResult& result, const std::string& timestamp);

    /** @brief Additions in the SI upload layout. */
    static std::string BuildDeltaRows(const domain::ReconciliationResult& result, const std::string& timestamp);

    /** @brief Every harvested point in the SI upload layout. */
    static std::string BuildSnapshotRows(const std::string& deviceKey,
                                         std::uint32_t deviceInstance,
                                         const std::vector<domain::HarvestedPoint>& points,
                                         const std::string& timestamp);

    /**
     * @brief Concatenates the per-device files of one kind into a daily summary.
     *
     * Files not of @p kind and summaries (TOTAL_ prefix) are skipped. Files are
     * taken in name order; for CSV kinds the header line is written once.
     */
    static std::string MergeDailyArtifacts(const std::vector<domain::ArtifactFile>& files, domain::ArtifactKind kind);

    /** @brief Header line (without newline) of a CSV kind, "" for Script. */
    static std::string CsvHeader(domain::ArtifactKind kind);
};

} // namespace bacnetinventory::application
