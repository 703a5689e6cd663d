/**
 * @file DeviceResolver.hpp
 * @brief Interface for resolving the device instance behind an address.
 */

#pragma once
#include <chrono>
#include <optional>
#include <string>
#include "domain/CancellationToken.hpp"
#include "domain/DiscoveredDevice.hpp"

namespace bacnetinventory::domain {

/**
 * @class DeviceResolver
 * @brief Targeted bounded-wait lookup; implementations must allow concurrent calls.
 */
class DeviceResolver {
public:
    virtual ~DeviceResolver() = default;

    virtual std::optional<DiscoveredDevice> resolveDevice(const std::string& ip,
                                                          CancellationToken& cancelToken,
                                                          std::chrono::milliseconds maxWait,
                                                          std::chrono::milliseconds pollInterval) = 0;
};

} // namespace bacnetinventory::domain
