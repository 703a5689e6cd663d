/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading/saving the inventory configuration (settings.json).
 *
 * Keeps JSON parsing of settings in one place; the rest of the code base only
 * sees InventorySettings.
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "domain/CatalogRow.hpp"

namespace bacnetinventory::infrastructure {

/**
 * @struct InventorySettings
 * @brief Every tunable of a run. Defaults apply to keys missing from the file.
 */
struct InventorySettings {
    std::string subnet = "192.168.1";                   ///< AddressRange text: "a.b.c", "a.b.c.x-y" or CIDR.
    std::vector<std::string> broadcastAddresses;        ///< Empty: derived from subnet.
    std::uint16_t port = 47808;
    int discoveryTimeoutMs = 3000;
    int perHostTimeoutMs = 1500;
    int batchTimeoutMs = 600000;                        ///< Deadline of a harvest batch; 0 disables it.
    int readTimeoutMs = 1000;
    int readRetries = 2;
    int maxParallelism = 10;
    int sweepBatchSize = 25;
    int sweepBatchDelayMs = 5;
    std::string artifactDir;                            ///< Empty: PathUtils default.
    std::string catalogPath;                            ///< Empty: PathUtils default.
    bool applyToCatalog = false;
    domain::CatalogIdentifiers defaultIdentifiers;
};

class ConfigLoader {
public:
    /**
     * @brief Reads settings.json.
     * @param settingsPath Path of the file; a missing file yields defaults.
     * @return Settings with defaults for missing or invalid keys. A malformed
     *         file is logged and ignored.
     */
    static InventorySettings Load(const std::string& settingsPath);

    /**
     * @brief Writes the settings back, preserving keys this loader does not know.
     * @return True if the file was written.
     */
    static bool Save(const std::string& settingsPath, const InventorySettings& settings);
};

} // namespace bacnetinventory::infrastructure
