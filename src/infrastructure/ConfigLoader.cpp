/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include "infrastructure/Log.hpp"
#include "infrastructure/PathUtils.hpp"

namespace bacnetinventory::infrastructure {

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

constexpr const char* kTag = "ConfigLoader";

/** Reads a non-negative integer key, keeping @p target when absent or invalid. */
void ReadInt(const json& j, const char* key, int& target, int minimum = 0) {
    if (!j.contains(key)) return;
    const auto& v = j.at(key);
    if (!v.is_number_integer() || v.get<long long>() < minimum) {
        Log::Warn(kTag, std::string("Ignoring invalid '") + key + "'");
        return;
    }
    target = v.get<int>();
}

void ReadString(const json& j, const char* key, std::string& target) {
    if (!j.contains(key)) return;
    if (!j.at(key).is_string()) {
        Log::Warn(kTag, std::string("Ignoring non-string '") + key + "'");
        return;
    }
    target = j.at(key).get<std::string>();
}

} // namespace

InventorySettings ConfigLoader::Load(const std::string& settingsPath) {
    InventorySettings settings;

    if (fs::exists(settingsPath)) {
        try {
            std::ifstream f(settingsPath);
            json j = json::parse(f);

            ReadString(j, "subnet", settings.subnet);
            if (j.contains("broadcast_addresses") && j["broadcast_addresses"].is_array()) {
                for (const auto& item : j["broadcast_addresses"]) {
                    if (item.is_string()) settings.broadcastAddresses.push_back(item.get<std::string>());
                }
            }

            int port = settings.port;
            ReadInt(j, "port", port, 1);
            if (port <= 0xFFFF) settings.port = static_cast<std::uint16_t>(port);

            ReadInt(j, "discovery_timeout_ms", settings.discoveryTimeoutMs);
            ReadInt(j, "per_host_timeout_ms", settings.perHostTimeoutMs, 1);
            ReadInt(j, "batch_timeout_ms", settings.batchTimeoutMs);
            ReadInt(j, "read_timeout_ms", settings.readTimeoutMs, 1);
            ReadInt(j, "read_retries", settings.readRetries);
            ReadInt(j, "max_parallelism", settings.maxParallelism, 1);
            ReadInt(j, "sweep_batch_size", settings.sweepBatchSize, 1);
            ReadInt(j, "sweep_batch_delay_ms", settings.sweepBatchDelayMs);
            ReadString(j, "artifact_dir", settings.artifactDir);
            ReadString(j, "catalog_path", settings.catalogPath);

            if (j.contains("apply_to_catalog") && j["apply_to_catalog"].is_boolean()) {
                settings.applyToCatalog = j["apply_to_catalog"].get<bool>();
            }

            if (j.contains("default_identifiers") && j["default_identifiers"].is_object()) {
                const auto& ids = j["default_identifiers"];
                ReadString(ids, "server_id", settings.defaultIdentifiers.serverId);
                ReadString(ids, "system_id", settings.defaultIdentifiers.systemId);
                ReadString(ids, "order_id", settings.defaultIdentifiers.orderId);
            }
        } catch (const std::exception& e) {
            Log::Error(kTag, "Error reading " + settingsPath + ": " + e.what() + " (using defaults)");
            settings = InventorySettings();
        }
    }

    if (settings.maxParallelism > 50) {
        Log::Warn(kTag, "max_parallelism " + std::to_string(settings.maxParallelism) + " clamped to 50");
        settings.maxParallelism = 50;
    }
    if (settings.artifactDir.empty()) {
        settings.artifactDir = PathUtils::GetDefaultArtifactDir().string();
    }
    if (settings.catalogPath.empty()) {
        settings.catalogPath = PathUtils::GetDefaultCatalogPath().string();
    }
    return settings;
}

bool ConfigLoader::Save(const std::string& settingsPath, const InventorySettings& settings) {
    json j = json::object();

    if (fs::exists(settingsPath)) {
        try {
            std::ifstream f(settingsPath);
            j = json::parse(f);
            if (!j.is_object()) j = json::object();
        } catch (const std::exception& e) {
            Log::Warn(kTag, "Existing " + settingsPath + " unreadable, rewriting: " + e.what());
            j = json::object();
        }
    }

    j["subnet"] = settings.subnet;
    j["broadcast_addresses"] = settings.broadcastAddresses;
    j["port"] = settings.port;
    j["discovery_timeout_ms"] = settings.discoveryTimeoutMs;
    j["per_host_timeout_ms"] = settings.perHostTimeoutMs;
    j["batch_timeout_ms"] = settings.batchTimeoutMs;
    j["read_timeout_ms"] = settings.readTimeoutMs;
    j["read_retries"] = settings.readRetries;
    j["max_parallelism"] = settings.maxParallelism;
    j["sweep_batch_size"] = settings.sweepBatchSize;
    j["sweep_batch_delay_ms"] = settings.sweepBatchDelayMs;
    j["artifact_dir"] = settings.artifactDir;
    j["catalog_path"] = settings.catalogPath;
    j["apply_to_catalog"] = settings.applyToCatalog;
    j["default_identifiers"] = {
        {"server_id", settings.defaultIdentifiers.serverId},
        {"system_id", settings.defaultIdentifiers.systemId},
        {"order_id", settings.defaultIdentifiers.orderId}
    };

    try {
        fs::path path(settingsPath);
        if (path.has_parent_path()) fs::create_directories(path.parent_path());
        std::ofstream f(path);
        if (!f.is_open()) {
            Log::Error(kTag, "Cannot open " + settingsPath + " for writing");
            return false;
        }
        f << j.dump(4);
        return static_cast<bool>(f);
    } catch (const std::exception& e) {
        Log::Error(kTag, "Error writing " + settingsPath + ": " + e.what());
        return false;
    }
}

} // namespace bacnetinventory::infrastructure
