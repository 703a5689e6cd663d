#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <filesystem>
#include <iostream>

namespace bacnetinventory::infrastructure {

namespace fs = std::filesystem;

namespace {

constexpr const char* kAppDir = "bacnet-inventory";

} // namespace

fs::path PathUtils::GetDataHome() {
    const char* xdgDataHome = std::getenv("XDG_DATA_HOME");
    if (xdgDataHome && *xdgDataHome) {
        return fs::path(xdgDataHome);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".local" / "share";
    }
    return fs::current_path(); // Fallback
}

fs::path PathUtils::GetConfigHome() {
    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfigHome && *xdgConfigHome) {
        return fs::path(xdgConfigHome);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".config";
    }
    return fs::current_path();
}

fs::path PathUtils::GetInventoryDataDir() {
    fs::path base = GetDataHome() / kAppDir;
    std::error_code ec;
    fs::create_directories(base, ec);
    if (ec) {
        std::cerr << "[PathUtils] Cannot create " << base << ": " << ec.message() << std::endl;
    }
    return base;
}

fs::path PathUtils::GetDefaultArtifactDir() {
    return GetInventoryDataDir() / "artifacts";
}

fs::path PathUtils::GetDefaultCatalogPath() {
    return GetInventoryDataDir() / "catalog.json";
}

fs::path PathUtils::GetDefaultSettingsPath() {
    return GetConfigHome() / kAppDir / "settings.json";
}

} // namespace bacnetinventory::infrastructure
