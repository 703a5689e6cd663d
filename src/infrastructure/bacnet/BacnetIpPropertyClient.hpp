/**
 * @file BacnetIpPropertyClient.hpp
 * @brief PropertyReader over BACnet/IP confirmed ReadProperty.
 */

#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "domain/PropertyReader.hpp"
#include "infrastructure/bacnet/UdpSocket.hpp"

namespace bacnetinventory::infrastructure::bacnet {

/**
 * @struct PropertyClientSettings
 * @brief Timing of a single ReadProperty exchange.
 */
struct PropertyClientSettings {
    std::chrono::milliseconds timeout{1000};    ///< Per attempt.
    int retries = 2;                            ///< Extra attempts after a timeout.
    std::string bindIp = "0.0.0.0";
};

/**
 * @class BacnetIpPropertyClient
 * @brief One socket and one invoke-id sequence per instance; not thread-safe.
 *
 * Error, Reject and Abort replies fail the read immediately; only timeouts
 * are retried.
 */
class BacnetIpPropertyClient : public domain::PropertyReader {
public:
    explicit BacnetIpPropertyClient(PropertyClientSettings settings = PropertyClientSettings());

    std::optional<std::vector<domain::PropertyValue>> readProperty(const domain::DeviceAddress& address,
                                                                   const domain::ObjectId& object,
                                                                   std::uint32_t property,
                                                                   std::optional<std::uint32_t> arrayIndex = std::nullopt) override;

private:
    bool ensureOpen();

    PropertyClientSettings m_settings;
    UdpSocket m_socket;
    std::uint8_t m_nextInvokeId = 1;
};

} // namespace bacnetinventory::infrastructure::bacnet
