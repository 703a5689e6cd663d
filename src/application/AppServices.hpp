/**
 * @file AppServices.hpp
 * @brief Container for application-level services to facilitate dependency injection.
 */

#pragma once

#include <memory>
#include "application/InventoryPipeline.hpp"
#include "application/ScanOrchestrator.hpp"
#include "domain/ArtifactSink.hpp"
#include "domain/CatalogRepository.hpp"
#include "infrastructure/PersistenceService.hpp"
#include "infrastructure/bacnet/DiscoveryTransport.hpp"

namespace bacnetinventory::application {

/**
 * Declaration order matters: the pipeline holds a reference to the
 * orchestrator and is destroyed first.
 */
struct AppServices {
    std::shared_ptr<infrastructure::PersistenceService> persistenceService;
    std::shared_ptr<infrastructure::bacnet::DiscoveryTransport> discoveryTransport;
    std::shared_ptr<domain::CatalogRepository> catalogRepository;
    std::shared_ptr<domain::ArtifactSink> artifactSink;
    std::unique_ptr<ScanOrchestrator> scanOrchestrator;
    std::unique_ptr<InventoryPipeline> pipeline;
};

} // namespace bacnetinventory::application
