// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace bacnetinventory::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetDataHome();
    static std::filesystem::path GetConfigHome();

    /** @brief <data home>/bacnet-inventory, created on demand. */
    static std::filesystem::path GetInventoryDataDir();
    static std::filesystem::path GetDefaultArtifactDir();
    static std::filesystem::path GetDefaultCatalogPath();
    static std::filesystem::path GetDefaultSettingsPath();
};

} // namespace bacnetinventory::infrastructure
