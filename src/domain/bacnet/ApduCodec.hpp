/**
 * @file ApduCodec.hpp
 * @brief Confirmed ReadProperty request/reply codec.
 */

#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "domain/ObjectKind.hpp"
#include "domain/PropertyValue.hpp"
#include "domain/bacnet/WireFormat.hpp"

namespace bacnetinventory::domain::bacnet {

/**
 * @enum ReplyKind
 * @brief PDU type of a reply to a confirmed request.
 */
enum class ReplyKind {
    Ack,            ///< ReadProperty-ACK with values.
    Error,          ///< Error PDU with class and code.
    Reject,
    Abort,
    Unsupported     ///< Segmented ACK or another service's reply.
};

/**
 * @struct ReadPropertyRequest
 * @brief Decoded fields of a ReadProperty request.
 */
struct ReadPropertyRequest {
    std::uint8_t invokeId = 0;
    ObjectId object;
    std::uint32_t property = 0;
    std::optional<std::uint32_t> arrayIndex;
};

/**
 * @struct ReadPropertyReply
 * @brief Decoded reply. Only the fields matching @c kind are meaningful.
 */
struct ReadPropertyReply {
    ReplyKind kind = ReplyKind::Unsupported;
    std::uint8_t invokeId = 0;
    ObjectId object;
    std::uint32_t property = 0;
    std::optional<std::uint32_t> arrayIndex;
    std::vector<PropertyValue> values;
    std::uint32_t errorClass = 0;
    std::uint32_t errorCode = 0;
    std::uint8_t reason = 0;            ///< Reject or abort reason.
};

/**
 * @class ApduCodec
 * @brief Stateless ReadProperty codec over complete BACnet/IP frames.
 */
class ApduCodec {
public:
    static Bytes EncodeReadPropertyRequest(const ReadPropertyRequest& request);

    static std::optional<ReadPropertyRequest> TryDecodeReadPropertyRequest(const Bytes& frame);

    /**
     * @brief Decodes an ACK, Error, Reject or Abort frame.
     * @return nullopt if the frame is not a well-formed confirmed reply.
     */
    static std::optional<ReadPropertyReply> TryDecodeReply(const Bytes& frame);

    /**
     * @brief Builds a ReadProperty-ACK.
     *
     * Text is encoded as a UTF-8 character string, integral non-negative
     * numbers as unsigned and other numbers as real.
     */
    static Bytes EncodeReadPropertyAck(const ReadPropertyRequest& request,
                                       const std::vector<PropertyValue>& values);

    static Bytes EncodeError(std::uint8_t invokeId, std::uint32_t errorClass, std::uint32_t errorCode);

    static Bytes EncodeReject(std::uint8_t invokeId, std::uint8_t reason);

    /**
     * @brief Converts character string content (charset byte + data) to UTF-8.
     *
     * Supports UTF-8, UCS-2 (big endian) and ISO-8859-1. Invalid sequences and
     * unknown character sets yield U+FFFD.
     */
    static std::string DecodeCharacterString(const std::uint8_t* data, std::size_t length);
};

} // namespace bacnetinventory::domain::bacnet
