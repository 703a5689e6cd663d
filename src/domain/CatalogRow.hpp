/**
 * @file CatalogRow.hpp
 * @brief Persisted catalog records and device targets.
 */

#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "domain/ObjectKind.hpp"

namespace bacnetinventory::domain {

/**
 * @struct CatalogIdentifiers
 * @brief Catalog-assigned ids copied verbatim into new rows of the same device.
 */
struct CatalogIdentifiers {
    std::string serverId;
    std::string systemId;
    std::string orderId;
};

/**
 * @struct CatalogRow
 * @brief Prior record of a point, keyed by (deviceKey, syntheticId).
 */
struct CatalogRow {
    std::string deviceKey;                  ///< DEVICE_SEQ of the owning device.
    std::string syntheticId;                ///< SYSTEM_PT_ID.
    std::string name;
    std::string description;
    std::string unitSymbol;
    bool decimalFlag = false;
    int typeCode = 0;                       ///< OBJ_TYPE, see KindToTypeCode().
    std::vector<std::string> stateTexts;
    CatalogIdentifiers identifiers;
};

/**
 * @struct DeviceTarget
 * @brief A device the catalog knows about and that should be harvested.
 */
struct DeviceTarget {
    std::string deviceKey;
    std::string ip;
    std::uint16_t port = 47808;
    std::optional<std::uint32_t> deviceInstance;   ///< Unknown until resolved by Who-Is.
    std::string label;                             ///< Free text (CODE_NAME / DEVICE_CINFO).
};

} // namespace bacnetinventory::domain
