#undef NDEBUG
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include "infrastructure/JsonCatalogRepository.hpp"

using namespace bacnetinventory;
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

fs::path MakeTempRoot() {
    auto ticks = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path root = fs::temp_directory_path() / ("bacnet_inventory_catalog_" + std::to_string(ticks));
    fs::create_directories(root);
    return root;
}

void WriteCatalog(const fs::path& path) {
    json doc = {
        {"devices", json::array({
            {{"device_seq", "D1"}, {"ip", "10.0.0.1"}, {"port", 47809}, {"device_id", 1200}, {"label", "AHU-1"}},
            {{"device_seq", "D2"}, {"ip", "10.0.0.2"}},
            {{"ip", "10.0.0.3"}},
            {{"device_seq", "D4"}, {"ip", "10.0.0.4"}, {"device_id", 5000000}}
        })},
        {"points", json::array({
            {{"device_seq", "D1"}, {"system_pt_id", "AI-1"}, {"obj_name", "Old Temp"}, {"obj_desc", "Supply"},
             {"obj_unit", "\xE2\x84\x83"}, {"obj_decimal", true}, {"obj_type", 0},
             {"server_id", "SRV"}, {"system_id", "SYS"}, {"order_id", 9}},
            {{"device_seq", "D2"}, {"system_pt_id", "BV-1"}, {"obj_name", "Other device"}, {"obj_type", 5}},
            {{"device_seq", "D1"}, {"system_pt_id", "AI-2"}, {"obj_name", "Humidity"}, {"obj_decimal", 1},
             {"obj_type", 0}},
            {{"device_seq", "D1"}, {"system_pt_id", "MSV-3"}, {"obj_name", "Mode"}, {"obj_type", 8},
             {"obj_status", {"Off", "On"}}}
        })}
    };
    std::ofstream(path) << doc.dump(2);
}

} // namespace

static void TestRead(infrastructure::JsonCatalogRepository& repo) {
    std::cout << "[Test] Devices and rows..." << std::endl;
    auto devices = repo.listDevices();
    assert(devices.size() == 3);
    assert(devices[0].deviceKey == "D1" && devices[0].port == 47809);
    assert(devices[0].deviceInstance && *devices[0].deviceInstance == 1200);
    assert(devices[0].label == "AHU-1");
    assert(devices[1].port == 47808 && !devices[1].deviceInstance);
    assert(devices[2].deviceKey == "D4" && !devices[2].deviceInstance);

    auto rows = repo.fetchRows("D1");
    assert(rows.size() == 3);
    assert(rows[0].syntheticId == "AI-1" && rows[1].syntheticId == "AI-2" && rows[2].syntheticId == "MSV-3");
    assert(rows[0].name == "Old Temp" && rows[0].unitSymbol == "\xE2\x84\x83");
    assert(rows[0].decimalFlag && rows[1].decimalFlag && !rows[2].decimalFlag);
    assert(rows[0].identifiers.serverId == "SRV" && rows[0].identifiers.orderId == "9");
    assert(rows[2].typeCode == 8);
    assert(rows[2].stateTexts.size() == 2 && rows[2].stateTexts[1] == "On");

    assert(repo.fetchRows("nobody").empty());
}

static void TestApply(infrastructure::JsonCatalogRepository& repo) {
    std::cout << "[Test] Applying a reconciliation..." << std::endl;
    domain::ReconciliationResult result;
    result.deviceKey = "D1";
    result.changes.push_back(domain::FieldChange{"AI-1", "OBJ_NAME", "Old Temp", "New Temp"});
    result.changes.push_back(domain::FieldChange{"AI-1", "OBJ_DECIMAL", "1", "0"});
    result.removals.push_back("AI-2");

    domain::HarvestedPoint added;
    added.syntheticId = "BV-3";
    added.kind = domain::ObjectKind::BV;
    added.instance = 3;
    added.name = "Pump";
    result.additions.push_back(domain::PointAddition{added, domain::CatalogIdentifiers{"SRV", "SYS", "9"}});

    assert(repo.applyReconciliation(result));

    auto rows = repo.fetchRows("D1");
    assert(rows.size() == 3);
    assert(rows[0].syntheticId == "AI-1" && rows[0].name == "New Temp" && !rows[0].decimalFlag);
    assert(rows[1].syntheticId == "MSV-3");
    assert(rows[2].syntheticId == "BV-3" && rows[2].typeCode == 5 && rows[2].identifiers.systemId == "SYS");
    assert(repo.fetchRows("D2").size() == 1);

    // Re-applying the same result changes nothing further.
    assert(repo.applyReconciliation(result));
    assert(repo.fetchRows("D1").size() == 3);

    assert(repo.applyReconciliation(domain::ReconciliationResult{}));
}

static void TestApplyIsAllOrNothing(infrastructure::JsonCatalogRepository& repo) {
    std::cout << "[Test] A failing step applies nothing..." << std::endl;
    domain::ReconciliationResult result;
    result.deviceKey = "D1";
    result.removals.push_back("MSV-3");
    result.changes.push_back(domain::FieldChange{"AI-99", "OBJ_NAME", "", "Ghost"});
    assert(!repo.applyReconciliation(result));
    assert(repo.fetchRows("D1").size() == 3);

    domain::ReconciliationResult badColumn;
    badColumn.deviceKey = "D1";
    badColumn.changes.push_back(domain::FieldChange{"AI-1", "NOT_A_COLUMN", "", "x"});
    assert(!repo.applyReconciliation(badColumn));
    assert(repo.fetchRows("D1")[0].name == "New Temp");
}

static void TestUpsertAndMissingFile(const fs::path& root) {
    std::cout << "[Test] Device registration on a fresh catalog..." << std::endl;
    auto persistence = std::make_shared<infrastructure::PersistenceService>();
    infrastructure::JsonCatalogRepository repo((root / "fresh" / "catalog.json").string(), persistence);
    assert(repo.listDevices().empty());

    domain::DeviceTarget target;
    target.deviceKey = "D9";
    target.ip = "10.9.9.9";
    target.deviceInstance = 99u;
    assert(repo.upsertDevice(target));
    target.ip = "10.9.9.10";
    assert(repo.upsertDevice(target));

    auto devices = repo.listDevices();
    assert(devices.size() == 1);
    assert(devices[0].ip == "10.9.9.10" && *devices[0].deviceInstance == 99);
}

static void TestMalformedFile(const fs::path& root) {
    std::cout << "[Test] Malformed catalog file..." << std::endl;
    const fs::path path = root / "broken.json";
    std::ofstream(path) << "{ \"devices\": [ ";

    auto persistence = std::make_shared<infrastructure::PersistenceService>();
    infrastructure::JsonCatalogRepository repo(path.string(), persistence);
    assert(repo.listDevices().empty());
    assert(repo.fetchRows("D1").empty());

    domain::ReconciliationResult result;
    result.deviceKey = "D1";
    result.removals.push_back("AI-1");
    assert(!repo.applyReconciliation(result));
}

int main() {
    std::cout << "[Test] JsonCatalogRepository" << std::endl;
    const fs::path root = MakeTempRoot();
    const fs::path catalog = root / "catalog.json";
    WriteCatalog(catalog);

    auto persistence = std::make_shared<infrastructure::PersistenceService>();
    infrastructure::JsonCatalogRepository repo(catalog.string(), persistence);
    TestRead(repo);
    TestApply(repo);
    TestApplyIsAllOrNothing(repo);
    TestUpsertAndMissingFile(root);
    TestMalformedFile(root);

    fs::remove_all(root);
    std::cout << "[PASS] JsonCatalogRepository" << std::endl;
    return 0;
}
