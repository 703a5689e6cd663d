/**
 * @file JsonCatalogRepository.cpp
 * @brief Implementation of JsonCatalogRepository.
 */

#include "infrastructure/JsonCatalogRepository.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include "infrastructure/Log.hpp"

namespace bacnetinventory::infrastructure {

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

constexpr const char* kTag = "JsonCatalogRepository";

json EmptyDocument() {
    return json{{"devices", json::array()}, {"points", json::array()}};
}

std::string TextOf(const json& j, const char* key) {
    if (!j.contains(key)) return "";
    const auto& v = j.at(key);
    if (v.is_string()) return v.get<std::string>();
    if (v.is_number_integer()) return std::to_string(v.get<long long>());
    return "";
}

domain::CatalogRow RowFromJson(const json& j) {
    domain::CatalogRow row;
    row.deviceKey = TextOf(j, "device_seq");
    row.syntheticId = TextOf(j, "system_pt_id");
    row.name = TextOf(j, "obj_name");
    row.description = TextOf(j, "obj_desc");
    row.unitSymbol = TextOf(j, "obj_unit");

    if (j.contains("obj_decimal")) {
        const auto& d = j["obj_decimal"];
        row.decimalFlag = d.is_boolean() ? d.get<bool>() : (d.is_number_integer() && d.get<int>() != 0);
    }
    if (j.contains("obj_type") && j["obj_type"].is_number_integer()) {
        row.typeCode = j["obj_type"].get<int>();
    }
    if (j.contains("obj_status") && j["obj_status"].is_array()) {
        for (const auto& s : j["obj_status"]) {
            row.stateTexts.push_back(s.is_string() ? s.get<std::string>() : "");
        }
    }
    row.identifiers.serverId = TextOf(j, "server_id");
    row.identifiers.systemId = TextOf(j, "system_id");
    row.identifiers.orderId = TextOf(j, "order_id");
    return row;
}

json RowToJson(const domain::HarvestedPoint& point, const std::string& deviceKey,
               const domain::CatalogIdentifiers& ids) {
    return json{
        {"device_seq", deviceKey},
        {"system_pt_id", point.syntheticId},
        {"obj_name", point.name},
        {"obj_desc", point.description},
        {"obj_unit", point.unitSymbol},
        {"obj_decimal", point.decimalFlag},
        {"obj_type", domain::KindToTypeCode(point.kind)},
        {"obj_status", point.stateTexts},
        {"server_id", ids.serverId},
        {"system_id", ids.systemId},
        {"order_id", ids.orderId}
    };
}

/** Writes one FieldChange into a point object. @throws std::invalid_argument for unknown columns. */
void ApplyChange(json& row, const domain::FieldChange& change) {
    if (change.columnName == "OBJ_NAME") {
        row["obj_name"] = change.newValue;
    } else if (change.columnName == "OBJ_DESC") {
        row["obj_desc"] = change.newValue;
    } else if (change.columnName == "OBJ_UNIT") {
        row["obj_unit"] = change.newValue;
    } else if (change.columnName == "OBJ_DECIMAL") {
        row["obj_decimal"] = change.newValue == "1";
    } else if (change.columnName == "OBJ_TYPE") {
        row["obj_type"] = std::stoi(change.newValue);
    } else {
        throw std::invalid_argument("unknown catalog column " + change.columnName);
    }
}

bool SameKey(const json& row, const std::string& deviceKey, const std::string& syntheticId) {
    return TextOf(row, "device_seq") == deviceKey && TextOf(row, "system_pt_id") == syntheticId;
}

} // namespace

JsonCatalogRepository::JsonCatalogRepository(std::string catalogPath, std::shared_ptr<PersistenceService> persistence)
    : m_path(std::move(catalogPath)), m_persistence(std::move(persistence)) {
    if (!m_persistence) {
        throw std::invalid_argument("JsonCatalogRepository requires a PersistenceService");
    }
}

std::optional<json> JsonCatalogRepository::loadDocument() const {
    if (!fs::exists(m_path)) {
        return EmptyDocument();
    }
    try {
        std::ifstream f(m_path);
        json doc = json::parse(f);
        if (!doc.is_object()) {
            Log::Error(kTag, m_path + " is not a JSON object");
            return std::nullopt;
        }
        if (!doc.contains("devices") || !doc["devices"].is_array()) doc["devices"] = json::array();
        if (!doc.contains("points") || !doc["points"].is_array()) doc["points"] = json::array();
        return doc;
    } catch (const std::exception& e) {
        Log::Error(kTag, "Error reading " + m_path + ": " + e.what());
        return std::nullopt;
    }
}

bool JsonCatalogRepository::storeDocument(const json& doc) {
    return m_persistence->saveText(m_path, doc.dump(4));
}

std::vector<domain::DeviceTarget> JsonCatalogRepository::listDevices() {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<domain::DeviceTarget> devices;
    auto doc = loadDocument();
    if (!doc) return devices;

    for (const auto& j : (*doc)["devices"]) {
        domain::DeviceTarget target;
        target.deviceKey = TextOf(j, "device_seq");
        target.ip = TextOf(j, "ip");
        if (target.deviceKey.empty() || target.ip.empty()) {
            Log::Warn(kTag, "Skipping device entry without device_seq or ip");
            continue;
        }
        if (j.contains("port") && j["port"].is_number_integer()) {
            int port = j["port"].get<int>();
            if (port > 0 && port <= 0xFFFF) target.port = static_cast<std::uint16_t>(port);
        }
        if (j.contains("device_id") && j["device_id"].is_number_integer()) {
            auto id = j["device_id"].get<long long>();
            if (id >= 0 && id <= 0x3FFFFF) {
                target.deviceInstance = static_cast<std::uint32_t>(id);
            } else {
                Log::Warn(kTag, "Device " + target.deviceKey + " has an out-of-range device_id");
            }
        }
        target.label = TextOf(j, "label");
        devices.push_back(target);
    }
    return devices;
}

std::vector<domain::CatalogRow> JsonCatalogRepository::fetchRows(const std::string& deviceKey) {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<domain::CatalogRow> rows;
    auto doc = loadDocument();
    if (!doc) return rows;

    for (const auto& j : (*doc)["points"]) {
        if (TextOf(j, "device_seq") == deviceKey) {
            rows.push_back(RowFromJson(j));
        }
    }
    return rows;
}

bool JsonCatalogRepository::applyReconciliation(const domain::ReconciliationResult& result) {
    if (result.empty()) return true;

    std::lock_guard<std::mutex> lock(m_mutex);
    auto loaded = loadDocument();
    if (!loaded) return false;

    // Work on a copy; the file is only replaced once every step succeeded.
    json doc = *loaded;
    json& points = doc["points"];

    try {
        for (const auto& change : result.changes) {
            bool found = false;
            for (auto& row : points) {
                if (SameKey(row, result.deviceKey, change.syntheticId)) {
                    ApplyChange(row, change);
                    found = true;
                    break;
                }
            }
            if (!found) {
                Log::Error(kTag, "Changed point " + change.syntheticId + " not in catalog, nothing applied");
                return false;
            }
        }

        json kept = json::array();
        for (const auto& row : points) {
            bool removed = false;
            if (TextOf(row, "device_seq") == result.deviceKey) {
                const std::string id = TextOf(row, "system_pt_id");
                for (const auto& r : result.removals) {
                    if (r == id) {
                        removed = true;
                        break;
                    }
                }
            }
            if (!removed) kept.push_back(row);
        }
        points = std::move(kept);

        for (const auto& addition : result.additions) {
            bool exists = false;
            for (const auto& row : points) {
                if (SameKey(row, result.deviceKey, addition.point.syntheticId)) {
                    exists = true;
                    break;
                }
            }
            if (!exists) points.push_back(RowToJson(addition.point, result.deviceKey, addition.identifiers));
        }
    } catch (const std::exception& e) {
        Log::Error(kTag, "Applying " + result.deviceKey + " failed: " + e.what());
        return false;
    }

    if (!storeDocument(doc)) {
        Log::Error(kTag, "Could not persist " + m_path);
        return false;
    }
    Log::Info(kTag, "Applied " + result.deviceKey + ": +" + std::to_string(result.additions.size()) +
                    " ~" + std::to_string(result.changedIds().size()) +
                    " -" + std::to_string(result.removals.size()));
    return true;
}

bool JsonCatalogRepository::upsertDevice(const domain::DeviceTarget& device) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto loaded = loadDocument();
    if (!loaded) return false;

    json doc = *loaded;
    json entry{{"device_seq", device.deviceKey}, {"ip", device.ip}, {"port", device.port}, {"label", device.label}};
    if (device.deviceInstance) entry["device_id"] = *device.deviceInstance;

    bool replaced = false;
    for (auto& existing : doc["devices"]) {
        if (TextOf(existing, "device_seq") == device.deviceKey) {
            existing = entry;
            replaced = true;
            break;
        }
    }
    if (!replaced) doc["devices"].push_back(entry);
    return storeDocument(doc);
}

} // namespace bacnetinventory::infrastructure
