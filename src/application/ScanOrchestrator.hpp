/**
 * @file ScanOrchestrator.hpp
 * @brief Bounded-parallel fan-out of resolve and harvest work.
 */

#pragma once
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "application/PointEnumerator.hpp"
#include "domain/CancellationToken.hpp"
#include "domain/CatalogRow.hpp"
#include "domain/DeviceResolver.hpp"
#include "domain/DiscoveredDevice.hpp"
#include "domain/PropertyReader.hpp"
#include "domain/ScanSession.hpp"

namespace bacnetinventory::application {

/** @brief Creates one PropertyReader (one socket) per unit of work. */
using PropertyReaderFactory = std::function<std::unique_ptr<domain::PropertyReader>()>;

/**
 * @struct HarvestBatch
 * @brief Aggregated results of one harvestMany call, keyed by device key.
 */
struct HarvestBatch {
    std::map<std::string, std::vector<domain::HarvestedPoint>> points;  ///< Completed harvests only.
    std::map<std::string, HarvestReport> reports;
    std::map<std::string, int> failures;    ///< +1 per device whose harvest failed.

    int totalFailures() const {
        int total = 0;
        for (const auto& [key, count] : failures) total += count;
        return total;
    }
};

/**
 * @class ScanOrchestrator
 * @brief Admits per-host work through an AsyncTaskManager gate sized to maxParallelism.
 *
 * A failing host never affects the others; its result is simply absent.
 */
class ScanOrchestrator {
public:
    ScanOrchestrator(std::shared_ptr<domain::DeviceResolver> resolver, PropertyReaderFactory readerFactory);

    /**
     * @brief Resolves every address concurrently.
     *
     * @p roundTimeout bounds the whole call. Each resolve waits at most
     * min(@p perHostTimeout, time left in the round); addresses not admitted
     * before the round ends are skipped.
     * @return One entry per device id, ordered by device id.
     */
    std::vector<domain::DiscoveredDevice> scanRange(const std::vector<std::string>& addresses,
                                                    int maxParallelism,
                                                    std::chrono::milliseconds perHostTimeout,
                                                    std::chrono::milliseconds roundTimeout,
                                                    domain::CancellationToken& cancelToken);

    std::vector<domain::DiscoveredDevice> scanRange(const domain::ScanSession& session);

    /**
     * @brief Harvests every target concurrently.
     *
     * Targets without a known device instance are resolved first, bounded by
     * @p resolveTimeout. A device key listed twice is harvested once.
     *
     * A positive @p batchTimeout is an overall deadline for the batch: when it
     * passes, the work still running is cancelled and every device without a
     * completed harvest is reported as TimedOut and counted as a failure.
     */
    HarvestBatch harvestMany(const std::vector<domain::DeviceTarget>& targets,
                             int maxParallelism,
                             domain::CancellationToken& cancelToken,
                             std::chrono::milliseconds resolveTimeout = std::chrono::milliseconds(1500),
                             std::chrono::milliseconds batchTimeout = std::chrono::milliseconds(0));

    HarvestBatch harvestMany(const domain::ScanSession& session);

private:
    std::shared_ptr<domain::DeviceResolver> m_resolver;
    PropertyReaderFactory m_readerFactory;
};

} // namespace bacnetinventory::application
