/**
 * @file PointEnumerator.hpp
 * @brief Enumerates a device's object list and harvests point attributes.
 */

#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "domain/CancellationToken.hpp"
#include "domain/DiscoveredDevice.hpp"
#include "domain/HarvestedPoint.hpp"
#include "domain/PropertyReader.hpp"

namespace bacnetinventory::application {

/**
 * @enum HarvestStatus
 * @brief Outcome of one device harvest.
 */
enum class HarvestStatus {
    Completed,              ///< Object list walked (possibly zero points).
    DirectoryUnavailable,   ///< Object-list length could not be read.
    Cancelled,
    TimedOut                ///< Batch deadline passed before the harvest finished.
};

std::string HarvestStatusToString(HarvestStatus status);

/**
 * @struct HarvestReport
 * @brief Points of one device plus the counters of the pass that produced them.
 */
struct HarvestReport {
    domain::DeviceAddress address;
    std::uint32_t deviceInstance = 0;
    HarvestStatus status = HarvestStatus::Completed;
    std::vector<domain::HarvestedPoint> points;     ///< Device enumeration order.
    domain::PointIndex index;
    std::uint32_t objectCount = 0;
    std::uint32_t skippedUnsupported = 0;
    std::uint32_t readFailures = 0;
};

/**
 * @class PointEnumerator
 * @brief Walks the device object's object-list one index at a time.
 *
 * Uses the reader it was given for every request, so one enumerator belongs
 * to one worker.
 */
class PointEnumerator {
public:
    explicit PointEnumerator(domain::PropertyReader& reader);

    HarvestReport harvest(const domain::DeviceAddress& address,
                          std::uint32_t deviceInstance,
                          domain::CancellationToken& cancelToken);

    HarvestReport harvest(const domain::DiscoveredDevice& device, domain::CancellationToken& cancelToken);

private:
    std::string readText(const domain::DeviceAddress& address, const domain::ObjectId& object,
                         std::uint32_t property, HarvestReport& report);
    std::string readUnit(const domain::DeviceAddress& address, const domain::ObjectId& object,
                         HarvestReport& report);
    std::vector<std::string> readStateTexts(const domain::DeviceAddress& address, const domain::ObjectId& object,
                                            HarvestReport& report);

    domain::PropertyReader& m_reader;
};

} // namespace bacnetinventory::application
