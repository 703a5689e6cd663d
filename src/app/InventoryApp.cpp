/**
 * @file InventoryApp.cpp
 * @brief Implementation of the InventoryApp command line front end.
 */

#include "app/InventoryApp.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <iostream>

#include "application/ReconciliationEngine.hpp"
#include "domain/AddressRange.hpp"
#include "domain/TimeFormat.hpp"
#include "infrastructure/FileArtifactWriter.hpp"
#include "infrastructure/JsonCatalogRepository.hpp"
#include "infrastructure/Log.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/bacnet/BacnetIpPropertyClient.hpp"

namespace bacnetinventory::app {

using infrastructure::Log;

namespace {

constexpr const char* kTag = "InventoryApp";

bool IsDay(const std::string& text) {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') return false;
    for (size_t i = 0; i < text.size(); ++i) {
        if (i == 4 || i == 7) continue;
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) return false;
    }
    return true;
}

void PrintDevice(const domain::DiscoveredDevice& d) {
    std::cout << std::left << std::setw(10) << d.deviceId
              << std::setw(18) << d.ip
              << std::setw(8) << d.vendorId
              << std::setw(8) << d.maxFrameSize
              << static_cast<int>(d.segmentationCapability) << std::endl;
}

} // namespace

void InventoryApp::PrintUsage() {
    std::cout << "Usage: bacnet-inventory <command> [options]\n"
              << "\n"
              << "Commands:\n"
              << "  discover            Who-Is broadcast and unicast sweep of the configured subnet\n"
              << "  resolve <ip>        Resolve the device instance of one address\n"
              << "  harvest             Enumerate the points of every catalog device\n"
              << "  run                 Harvest, reconcile against the catalog and write artifacts\n"
              << "  merge [yyyy-MM-dd]  Rebuild the daily summaries (default: today)\n"
              << "\n"
              << "Options:\n"
              << "  --config <file>     Settings file (default: "
              << infrastructure::PathUtils::GetDefaultSettingsPath().string() << ")\n"
              << "  --subnet <range>    Override the discovery range (a.b.c, a.b.c.x-y, a.b.c.d/n)\n"
              << "  --apply             Apply reconciliation results to the catalog\n"
              << "  --help              Show this text\n";
}

int InventoryApp::Run(int argc, char** argv) {
    std::string settingsPath = infrastructure::PathUtils::GetDefaultSettingsPath().string();
    std::string subnetOverride;
    bool applyOverride = false;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            PrintUsage();
            return 0;
        } else if (arg == "--config" || arg == "--subnet") {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << std::endl;
                PrintUsage();
                return 2;
            }
            (arg == "--config" ? settingsPath : subnetOverride) = argv[++i];
        } else if (arg == "--apply") {
            applyOverride = true;
        } else if (arg.rfind("--", 0) == 0) {
            std::cerr << "Unknown option " << arg << std::endl;
            PrintUsage();
            return 2;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.empty()) {
        PrintUsage();
        return 2;
    }

    try {
        m_settings = infrastructure::ConfigLoader::Load(settingsPath);
        if (!subnetOverride.empty()) m_settings.subnet = subnetOverride;
        if (applyOverride) m_settings.applyToCatalog = true;
        Init();

        const std::string& command = positional[0];
        if (command == "discover") return CmdDiscover();
        if (command == "harvest") return CmdHarvest();
        if (command == "run") return CmdRun();
        if (command == "resolve") {
            if (positional.size() < 2) {
                std::cerr << "resolve needs an IPv4 address" << std::endl;
                return 2;
            }
            return CmdResolve(positional[1]);
        }
        if (command == "merge") {
            std::string day = positional.size() > 1 ? positional[1] : domain::FormatDay(std::time(nullptr));
            if (!IsDay(day)) {
                std::cerr << "merge expects a date as yyyy-MM-dd, got '" << day << "'" << std::endl;
                return 2;
            }
            return CmdMerge(day);
        }

        std::cerr << "Unknown command " << command << std::endl;
        PrintUsage();
        return 2;
    } catch (const std::exception& e) {
        Log::Error(kTag, std::string("Fatal: ") + e.what());
        return 1;
    }
}

void InventoryApp::Init() {
    // Composition root
    application::AppServices services;
    services.persistenceService = std::make_shared<infrastructure::PersistenceService>();

    infrastructure::bacnet::DiscoverySettings discovery;
    discovery.port = m_settings.port;
    discovery.broadcastAddresses = m_settings.broadcastAddresses;
    discovery.sweepBatchSize = static_cast<std::size_t>(m_settings.sweepBatchSize);
    discovery.sweepBatchDelay = std::chrono::milliseconds(m_settings.sweepBatchDelayMs);
    services.discoveryTransport = std::make_shared<infrastructure::bacnet::DiscoveryTransport>(discovery);

    services.catalogRepository = std::make_shared<infrastructure::JsonCatalogRepository>(
        m_settings.catalogPath, services.persistenceService);
    services.artifactSink = std::make_shared<infrastructure::FileArtifactWriter>(
        m_settings.artifactDir, services.persistenceService, &application::ReconciliationEngine::MergeDailyArtifacts);

    infrastructure::bacnet::PropertyClientSettings client;
    client.timeout = std::chrono::milliseconds(m_settings.readTimeoutMs);
    client.retries = m_settings.readRetries;
    services.scanOrchestrator = std::make_unique<application::ScanOrchestrator>(
        services.discoveryTransport,
        [client]() -> std::unique_ptr<domain::PropertyReader> {
            return std::make_unique<infrastructure::bacnet::BacnetIpPropertyClient>(client);
        });

    application::PipelineOptions options;
    options.maxParallelism = m_settings.maxParallelism;
    options.resolveTimeout = std::chrono::milliseconds(m_settings.perHostTimeoutMs);
    options.batchTimeout = std::chrono::milliseconds(m_settings.batchTimeoutMs);
    options.applyToCatalog = m_settings.applyToCatalog;
    options.defaultIdentifiers = m_settings.defaultIdentifiers;
    services.pipeline = std::make_unique<application::InventoryPipeline>(
        *services.scanOrchestrator, services.catalogRepository, services.artifactSink, options);

    m_services = std::move(services);
}

int InventoryApp::CmdDiscover() {
    auto range = domain::AddressRange::Parse(m_settings.subnet);
    if (!range) {
        Log::Error(kTag, "Invalid subnet '" + m_settings.subnet + "'");
        return 1;
    }

    Log::Info(kTag, "Discovering " + range->toString() + " (" + std::to_string(range->size()) + " hosts)");
    auto devices = m_services.discoveryTransport->discover(
        *range, std::chrono::milliseconds(m_settings.discoveryTimeoutMs), *m_cancel);

    std::cout << std::left << std::setw(10) << "DEVICE" << std::setw(18) << "IP" << std::setw(8) << "VENDOR"
              << std::setw(8) << "APDU" << "SEG" << std::endl;
    for (const auto& d : devices) PrintDevice(d);
    Log::Info(kTag, std::to_string(devices.size()) + " device(s) found");
    return 0;
}

int InventoryApp::CmdResolve(const std::string& ip) {
    if (!domain::AddressRange::ParseIpv4(ip)) {
        std::cerr << "Not an IPv4 address: " << ip << std::endl;
        return 2;
    }
    auto device = m_services.discoveryTransport->resolveDevice(
        ip, *m_cancel, std::chrono::milliseconds(m_settings.perHostTimeoutMs));
    if (!device) {
        Log::Warn(kTag, "No I-Am from " + ip);
        return 1;
    }
    PrintDevice(*device);
    return 0;
}

std::vector<domain::DeviceTarget> InventoryApp::LoadTargets() {
    auto targets = m_services.catalogRepository->listDevices();
    if (targets.empty()) {
        Log::Warn(kTag, "No devices registered in " + m_settings.catalogPath);
    }
    return targets;
}

int InventoryApp::CmdHarvest() {
    auto targets = LoadTargets();
    if (targets.empty()) return 1;

    auto batch = m_services.scanOrchestrator->harvestMany(
        targets, m_settings.maxParallelism, *m_cancel, std::chrono::milliseconds(m_settings.perHostTimeoutMs),
        std::chrono::milliseconds(m_settings.batchTimeoutMs));

    const std::string stamp = domain::FormatRunStamp(std::time(nullptr));
    const std::string timestamp = domain::FormatDateTime(std::time(nullptr));
    for (const auto& target : targets) {
        auto it = batch.reports.find(target.deviceKey);
        if (it == batch.reports.end()) {
            std::cout << target.deviceKey << ": unresolved" << std::endl;
            continue;
        }
        const auto& report = it->second;
        std::cout << target.deviceKey << ": " << application::HarvestStatusToString(report.status)
                  << ", " << report.points.size() << " points of " << report.objectCount << " objects"
                  << ", " << report.skippedUnsupported << " unsupported"
                  << ", " << report.readFailures << " read failures" << std::endl;

        if (report.status == application::HarvestStatus::Completed) {
            m_services.artifactSink->write(
                domain::ArtifactKind::Snapshot, target.deviceKey, stamp,
                application::ReconciliationEngine::BuildSnapshotRows(target.deviceKey, report.deviceInstance,
                                                                     report.points, timestamp));
        }
    }
    return batch.totalFailures() == 0 ? 0 : 1;
}

int InventoryApp::CmdRun() {
    auto targets = LoadTargets();
    if (targets.empty()) return 1;

    auto report = m_services.pipeline->run(targets, *m_cancel);
    for (const auto& [key, d] : report.devices) {
        std::cout << key << ": " << d.status;
        if (d.harvested) {
            std::cout << ", " << d.points << " points, +" << d.additions << " ~" << d.changes << " -" << d.removals;
            if (d.applied) std::cout << " (applied)";
            if (d.artifactFailures > 0) std::cout << ", " << d.artifactFailures << " artifact failure(s)";
        }
        std::cout << std::endl;
    }
    for (const auto& summary : report.summaries) {
        std::cout << "summary: " << summary << std::endl;
    }
    return (report.harvestFailures == 0 && report.totalArtifactFailures() == 0) ? 0 : 1;
}

int InventoryApp::CmdMerge(const std::string& day) {
    auto written = m_services.artifactSink->mergeDaily(day);
    for (const auto& path : written) {
        std::cout << path << std::endl;
    }
    return 0;
}

} // namespace bacnetinventory::app
