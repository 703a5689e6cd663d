/**
 * @file CatalogRepository.hpp
 * @brief Interface for reading and updating the committed point catalog.
 */

#pragma once
#include <string>
#include <vector>
#include "domain/CatalogRow.hpp"
#include "domain/ReconciliationResult.hpp"

namespace bacnetinventory::domain {

/**
 * @class CatalogRepository
 * @brief Narrow read/apply boundary to the catalog store.
 *
 * One reconciliation pass per device at a time is assumed; implementations do
 * not guard against concurrent external mutation.
 */
class CatalogRepository {
public:
    virtual ~CatalogRepository() = default;

    /** @brief Devices registered in the catalog (the explicit harvest list). */
    virtual std::vector<DeviceTarget> listDevices() = 0;

    /**
     * @brief Fetches the committed rows of one device.
     * @param deviceKey DEVICE_SEQ of the device.
     * @return Rows in catalog order; empty if the device has none.
     */
    virtual std::vector<CatalogRow> fetchRows(const std::string& deviceKey) = 0;

    /**
     * @brief Applies one device's additions, changes and removals as a unit.
     * @return True if the whole result was applied, false if nothing was.
     */
    virtual bool applyReconciliation(const ReconciliationResult& result) = 0;
};

} // namespace bacnetinventory::domain
