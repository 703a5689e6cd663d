/**
 * @file FrameCodec.hpp
 * @brief Pure encode/decode of the Who-Is and I-Am discovery frames.
 */

#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include "domain/DiscoveredDevice.hpp"
#include "domain/bacnet/WireFormat.hpp"

namespace bacnetinventory::domain::bacnet {

/**
 * @enum DiscoveryScope
 * @brief Selects the BVLC function of a discovery request.
 */
enum class DiscoveryScope {
    Broadcast,  ///< Original-Broadcast-NPDU (0x0B).
    Unicast     ///< Original-Unicast-NPDU (0x0A).
};

/**
 * @class FrameCodec
 * @brief Stateless discovery frame codec. No I/O, never throws on input bytes.
 */
class FrameCodec {
public:
    /** @brief Smallest datagram that can hold a complete I-Am. */
    static constexpr std::size_t kMinIAmLength = 15;

    /**
     * @brief Builds the fixed 8-byte Who-Is frame (no instance range limits).
     */
    static Bytes EncodeDiscoveryRequest(DiscoveryScope scope);

    /**
     * @brief Decodes an I-Am datagram.
     *
     * Checks run in a fixed order: minimum length, BVLC marker, BVLC function,
     * NPDU version, unconfirmed I-Am service, device object type. The payload
     * is the tagged sequence (object id, max APDU, segmentation, vendor id).
     * @param frame Raw datagram.
     * @param senderIp Source address of the datagram.
     * @param senderPort Source port of the datagram.
     * @return The device, or nullopt for anything that is not a well-formed I-Am.
     */
    static std::optional<DiscoveredDevice> TryDecodeDiscoveryResponse(const Bytes& frame,
                                                                      const std::string& senderIp,
                                                                      std::uint16_t senderPort);

    /**
     * @brief Builds an I-Am frame in the same layout a device sends.
     */
    static Bytes EncodeSyntheticIAmFrame(std::uint32_t deviceId,
                                         std::uint16_t vendorId,
                                         std::uint16_t maxFrame,
                                         std::uint8_t segmentation,
                                         DiscoveryScope scope = DiscoveryScope::Broadcast);
};

} // namespace bacnetinventory::domain::bacnet
