/**
 * @file ReconciliationResult.hpp
 * @brief Value objects produced by reconciling a harvest against the catalog.
 */

#pragma once
#include <string>
#include <vector>
#include "domain/CatalogRow.hpp"
#include "domain/HarvestedPoint.hpp"

namespace bacnetinventory::domain {

/**
 * @struct FieldChange
 * @brief One differing tracked column of a point present in both sets.
 */
struct FieldChange {
    std::string syntheticId;
    std::string columnName;     ///< Catalog column, e.g. "OBJ_NAME".
    std::string oldValue;
    std::string newValue;
};

/**
 * @struct PointAddition
 * @brief A harvested point with no catalog row, plus the ids it inherits.
 */
struct PointAddition {
    HarvestedPoint point;
    CatalogIdentifiers identifiers;
};

/**
 * @struct ReconciliationResult
 * @brief Classification of one device's harvest against its catalog rows.
 */
struct ReconciliationResult {
    std::string deviceKey;
    std::uint32_t deviceInstance = 0;
    std::vector<PointAddition> additions;
    std::vector<FieldChange> changes;
    std::vector<std::string> removals;          ///< Synthetic ids, catalog order.
    std::vector<std::string> unchangedIds;

    bool empty() const {
        return additions.empty() && changes.empty() && removals.empty();
    }

    /** @brief Distinct synthetic ids with at least one FieldChange, first-seen order. */
    std::vector<std::string> changedIds() const {
        std::vector<std::string> ids;
        for (const auto& change : changes) {
            if (ids.empty() || ids.back() != change.syntheticId) {
                ids.push_back(change.syntheticId);
            }
        }
        return ids;
    }
};

} // namespace bacnetinventory::domain
