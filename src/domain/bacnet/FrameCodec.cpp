/**
 * @file FrameCodec.cpp
 * @brief Implementation of FrameCodec.
 */

#include "domain/bacnet/FrameCodec.hpp"
#include "domain/ObjectKind.hpp"

namespace bacnetinventory::domain::bacnet {

namespace {

constexpr std::uint8_t kUnconfirmedRequest = 0x10;
constexpr std::uint8_t kServiceIAm = 0x00;
constexpr std::uint8_t kServiceWhoIs = 0x08;

std::uint8_t BvlcFunction(DiscoveryScope scope) {
    return scope == DiscoveryScope::Broadcast ? kBvlcOriginalBroadcast : kBvlcOriginalUnicast;
}

/** Reads one application-tagged unsigned/enumerated of at most 4 bytes. */
std::optional<std::uint32_t> ReadAppValue(const Bytes& frame, std::size_t& pos, std::uint8_t expectedTag) {
    auto tag = ReadTag(frame, pos, frame.size());
    if (!tag || tag->isContext || tag->number != expectedTag) return std::nullopt;
    if (tag->length < 1 || tag->length > 4) return std::nullopt;
    const std::size_t content = pos + tag->headerSize;
    pos = content + tag->length;
    return ReadUnsigned(&frame[content], tag->length);
}

} // namespace

Bytes FrameCodec::EncodeDiscoveryRequest(DiscoveryScope scope) {
    return Bytes{kBvlcType, BvlcFunction(scope), 0x00, 0x08,
                 kNpduVersion, 0x00, kUnconfirmedRequest, kServiceWhoIs};
}

std::optional<DiscoveredDevice> FrameCodec::TryDecodeDiscoveryResponse(const Bytes& frame,
                                                                       const std::string& senderIp,
                                                                       std::uint16_t senderPort) {
    if (frame.size() < kMinIAmLength) return std::nullopt;
    if (frame[0] != kBvlcType) return std::nullopt;
    if (frame[1] != kBvlcOriginalUnicast && frame[1] != kBvlcOriginalBroadcast) return std::nullopt;
    if (frame[4] != kNpduVersion) return std::nullopt;

    auto apdu = LocateApdu(frame);
    if (!apdu || *apdu + 2 > frame.size()) return std::nullopt;
    std::size_t pos = *apdu;
    if (frame[pos] != kUnconfirmedRequest || frame[pos + 1] != kServiceIAm) return std::nullopt;
    pos += 2;

    auto oidTag = ReadTag(frame, pos, frame.size());
    if (!oidTag || oidTag->isContext || oidTag->number != AppTag::ObjectIdentifier || oidTag->length != 4) {
        return std::nullopt;
    }
    const ObjectId oid = ObjectId::FromPacked(ReadUnsigned(&frame[pos + oidTag->headerSize], 4));
    if (oid.type != kDeviceObjectType) return std::nullopt;
    pos += oidTag->headerSize + 4;

    auto maxApdu = ReadAppValue(frame, pos, AppTag::Unsigned);
    if (!maxApdu || *maxApdu > 0xFFFF) return std::nullopt;
    auto segmentation = ReadAppValue(frame, pos, AppTag::Enumerated);
    if (!segmentation || *segmentation > 0xFF) return std::nullopt;
    auto vendor = ReadAppValue(frame, pos, AppTag::Unsigned);
    if (!vendor || *vendor > 0xFFFF) return std::nullopt;

    DiscoveredDevice device;
    device.deviceId = oid.instance;
    device.ip = senderIp;
    device.port = senderPort;
    device.maxFrameSize = static_cast<std::uint16_t>(*maxApdu);
    device.segmentationCapability = static_cast<std::uint8_t>(*segmentation);
    device.vendorId = static_cast<std::uint16_t>(*vendor);
    return device;
}

Bytes FrameCodec::EncodeSyntheticIAmFrame(std::uint32_t deviceId,
                                          std::uint16_t vendorId,
                                          std::uint16_t maxFrame,
                                          std::uint8_t segmentation,
                                          DiscoveryScope scope) {
    Bytes frame{kBvlcType, BvlcFunction(scope), 0x00, 0x00,
                kNpduVersion, 0x00, kUnconfirmedRequest, kServiceIAm};

    PutTag(frame, AppTag::ObjectIdentifier, false, 4);
    PutU32(frame, ObjectId{kDeviceObjectType, deviceId}.packed());
    PutUnsignedTagged(frame, AppTag::Unsigned, false, maxFrame);
    PutUnsignedTagged(frame, AppTag::Enumerated, false, segmentation);
    PutUnsignedTagged(frame, AppTag::Unsigned, false, vendorId);

    FinishBvlc(frame);
    return frame;
}

} // namespace bacnetinventory::domain::bacnet
