/**
 * @file JsonCatalogRepository.hpp
 * @brief CatalogRepository over a single catalog.json document.
 */

#pragma once
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "domain/CatalogRepository.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace bacnetinventory::infrastructure {

/**
 * @class JsonCatalogRepository
 * @brief Stores devices and point rows as JSON, rewritten atomically on apply.
 *
 * Layout:
 * @code
 * { "devices": [ { "device_seq", "ip", "port", "device_id", "label" } ],
 *   "points":  [ { "device_seq", "system_pt_id", "obj_name", "obj_desc", "obj_unit",
 *                  "obj_decimal", "obj_type", "obj_status": [...],
 *                  "server_id", "system_id", "order_id" } ] }
 * @endcode
 */
class JsonCatalogRepository : public domain::CatalogRepository {
public:
    JsonCatalogRepository(std::string catalogPath, std::shared_ptr<PersistenceService> persistence);

    std::vector<domain::DeviceTarget> listDevices() override;
    std::vector<domain::CatalogRow> fetchRows(const std::string& deviceKey) override;
    bool applyReconciliation(const domain::ReconciliationResult& result) override;

    /** @brief Registers or replaces a device entry (used by tests and the `run` bootstrap). */
    bool upsertDevice(const domain::DeviceTarget& device);

    const std::string& path() const { return m_path; }

private:
    /** @return The document, an empty one if the file is missing, nullopt if unreadable. */
    std::optional<nlohmann::json> loadDocument() const;
    bool storeDocument(const nlohmann::json& doc);

    std::string m_path;
    std::shared_ptr<PersistenceService> m_persistence;
    std::mutex m_mutex;
};

} // namespace bacnetinventory::infrastructure
