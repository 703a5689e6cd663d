/**
 * @file WireFormat.hpp
 * @brief BVLC/NPDU framing and application tag primitives shared by the codecs.
 */

#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace bacnetinventory::domain::bacnet {

using Bytes = std::vector<std::uint8_t>;

constexpr std::uint8_t kBvlcType = 0x81;
constexpr std::uint8_t kBvlcOriginalUnicast = 0x0A;
constexpr std::uint8_t kBvlcOriginalBroadcast = 0x0B;
constexpr std::uint8_t kNpduVersion = 0x01;

/** @brief Application tag numbers. */
namespace AppTag {
constexpr std::uint8_t Null = 0;
constexpr std::uint8_t Boolean = 1;
constexpr std::uint8_t Unsigned = 2;
constexpr std::uint8_t Signed = 3;
constexpr std::uint8_t Real = 4;
constexpr std::uint8_t Double = 5;
constexpr std::uint8_t OctetString = 6;
constexpr std::uint8_t CharacterString = 7;
constexpr std::uint8_t BitString = 8;
constexpr std::uint8_t Enumerated = 9;
constexpr std::uint8_t Date = 10;
constexpr std::uint8_t Time = 11;
constexpr std::uint8_t ObjectIdentifier = 12;
} // namespace AppTag

/**
 * @struct Tag
 * @brief Decoded tag header.
 *
 * For opening/closing tags @c length is 0. For application booleans the value
 * lives in @c lvt and no content bytes follow.
 */
struct Tag {
    std::uint8_t number = 0;
    bool isContext = false;
    bool isOpening = false;
    bool isClosing = false;
    std::uint8_t lvt = 0;                   ///< Raw length/value/type nibble.
    std::uint32_t length = 0;               ///< Content bytes following the header.
    std::size_t headerSize = 0;
};

void PutU16(Bytes& out, std::uint16_t v);
void PutU32(Bytes& out, std::uint32_t v);

/** @brief Big-endian read of @p count (1..4) bytes. */
std::uint32_t ReadUnsigned(const std::uint8_t* p, std::size_t count);

/**
 * @brief Decodes the tag header at @p pos.
 * @return nullopt if the header or its declared content would run past @p end.
 */
std::optional<Tag> ReadTag(const Bytes& frame, std::size_t pos, std::size_t end);

/** @brief Appends a tag header (application or context) with the given length. */
void PutTag(Bytes& out, std::uint8_t number, bool isContext, std::uint32_t length);

/** @brief Appends an unsigned value using the fewest bytes. */
void PutUnsignedTagged(Bytes& out, std::uint8_t number, bool isContext, std::uint32_t value);

/**
 * @brief Walks the BVLC header and NPDU to the first APDU byte.
 *
 * Destination and source specifiers are skipped; network layer messages are
 * rejected. Forwarded-NPDU (0x04) frames are accepted with their 6-byte
 * originator address skipped.
 * @return Offset of the APDU, or nullopt if the frame is not a BACnet/IP APDU.
 */
std::optional<std::size_t> LocateApdu(const Bytes& frame);

/** @brief Writes the 2-byte BVLC length field once the frame is complete. */
void FinishBvlc(Bytes& frame);

} // namespace bacnetinventory::domain::bacnet
