/**
 * @file DiscoveryTransport.hpp
 * @brief Who-Is / I-Am exchange over BACnet/IP.
 */

#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "domain/AddressRange.hpp"
#include "domain/CancellationToken.hpp"
#include "domain/DeviceResolver.hpp"
#include "domain/DiscoveredDevice.hpp"

namespace bacnetinventory::infrastructure::bacnet {

constexpr std::uint16_t kBacnetIpPort = 47808;

/**
 * @struct DiscoverySettings
 * @brief Knobs of a discovery round.
 */
struct DiscoverySettings {
    std::uint16_t port = kBacnetIpPort;             ///< Destination port of every request.
    std::vector<std::string> broadcastAddresses;    ///< Empty: derived from the scanned range.
    bool unicastSweep = true;
    std::size_t sweepBatchSize = 25;
    std::chrono::milliseconds sweepBatchDelay{5};
    std::string bindIp = "0.0.0.0";
};

/**
 * @class DiscoveryTransport
 * @brief Opens one socket per call; safe to use from several threads at once.
 */
class DiscoveryTransport : public domain::DeviceResolver {
public:
    explicit DiscoveryTransport(DiscoverySettings settings = DiscoverySettings());

    /**
     * @brief Broadcast + unicast sweep discovery of a range.
     *
     * Sends Who-Is to each broadcast address, then to every host of @p scope,
     * then collects I-Am replies. @p timeout bounds the whole round: hosts not
     * yet swept when it expires are skipped.
     * @return Devices in arrival order, one per device id (first reply wins).
     */
    std::vector<domain::DiscoveredDevice> discover(const domain::AddressRange& scope,
                                                   std::chrono::milliseconds timeout,
                                                   domain::CancellationToken& cancelToken);

    /**
     * @brief Resolves the device instance answering at one address.
     *
     * Sends a unicast Who-Is, polls every @p pollInterval for at most
     * @p maxWait and repeats the Who-Is every 5 polls. Only an I-Am whose
     * sender is @p ip is accepted. A non-positive @p maxWait sends nothing.
     */
    std::optional<domain::DiscoveredDevice> resolveDevice(const std::string& ip,
                                                          domain::CancellationToken& cancelToken,
                                                          std::chrono::milliseconds maxWait = std::chrono::milliseconds(1500),
                                                          std::chrono::milliseconds pollInterval = std::chrono::milliseconds(100)) override;

    const DiscoverySettings& settings() const { return m_settings; }

private:
    DiscoverySettings m_settings;
};

} // namespace bacnetinventory::infrastructure::bacnet
