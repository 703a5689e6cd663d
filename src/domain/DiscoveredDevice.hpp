/**
 * @file DiscoveredDevice.hpp
 * @brief Domain entity for a device that answered a Who-Is.
 */

#pragma once
#include <cstdint>
#include <string>

namespace bacnetinventory::domain {

/**
 * @struct DiscoveredDevice
 * @brief One I-Am response, keyed by deviceId within a scan session.
 */
struct DiscoveredDevice {
    std::uint32_t deviceId = 0;             ///< Device instance (22 bits).
    std::string ip;                         ///< Sender address of the I-Am.
    std::uint16_t port = 47808;             ///< Sender UDP port.
    std::uint16_t vendorId = 0;
    std::uint16_t maxFrameSize = 0;         ///< Max APDU length accepted.
    std::uint8_t segmentationCapability = 0;
};

} // namespace bacnetinventory::domain
