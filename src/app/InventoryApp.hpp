/**
 * @file InventoryApp.hpp
 * @brief Command line front end of the BACnet inventory.
 */

#pragma once

#include <memory>
#include <string>
#include <vector>
#include "application/AppServices.hpp"
#include "domain/CancellationToken.hpp"
#include "infrastructure/ConfigLoader.hpp"

namespace bacnetinventory::app {

/**
 * @class InventoryApp
 * @brief Parses the command line, wires the services and runs one command.
 *
 * Commands: discover, resolve <ip>, harvest, run, merge [yyyy-MM-dd].
 */
class InventoryApp {
public:
    /**
     * @brief Runs the command named on the command line.
     * @return Exit code (0 for success, 1 for failures, 2 for usage errors).
     */
    int Run(int argc, char** argv);

    static void PrintUsage();

private:
    /** @brief Builds the service graph from m_settings (composition root). */
    void Init();

    int CmdDiscover();
    int CmdResolve(const std::string& ip);
    int CmdHarvest();
    int CmdRun();
    int CmdMerge(const std::string& day);

    std::vector<domain::DeviceTarget> LoadTargets();

    infrastructure::InventorySettings m_settings;
    application::AppServices m_services;
    std::shared_ptr<domain::CancellationToken> m_cancel = std::make_shared<domain::CancellationToken>();
};

} // namespace bacnetinventory::app
