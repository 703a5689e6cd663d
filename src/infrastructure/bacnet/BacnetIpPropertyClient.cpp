/**
 * @file BacnetIpPropertyClient.cpp
 * @brief Implementation of BacnetIpPropertyClient.
 */

#include "infrastructure/bacnet/BacnetIpPropertyClient.hpp"
#include "domain/bacnet/ApduCodec.hpp"
#include "infrastructure/Log.hpp"

namespace bacnetinventory::infrastructure::bacnet {

using domain::bacnet::ApduCodec;
using domain::bacnet::ReadPropertyRequest;
using domain::bacnet::ReplyKind;
using Clock = std::chrono::steady_clock;

namespace {

constexpr const char* kTag = "PropertyClient";

std::string Describe(const domain::ObjectId& object, std::uint32_t property,
                     const std::optional<std::uint32_t>& arrayIndex) {
    std::string text = std::to_string(object.type) + ":" + std::to_string(object.instance) +
                       " prop " + std::to_string(property);
    if (arrayIndex) text += "[" + std::to_string(*arrayIndex) + "]";
    return text;
}

} // namespace

BacnetIpPropertyClient::BacnetIpPropertyClient(PropertyClientSettings settings)
    : m_settings(std::move(settings)) {
    if (m_settings.retries < 0) m_settings.retries = 0;
}

bool BacnetIpPropertyClient::ensureOpen() {
    if (m_socket.isOpen()) return true;
    if (!m_socket.open(m_settings.bindIp, 0, false)) {
        Log::Error(kTag, "Cannot open socket: " + m_socket.lastError());
        return false;
    }
    return true;
}

std::optional<std::vector<domain::PropertyValue>> BacnetIpPropertyClient::readProperty(const domain::DeviceAddress& address,
                                                                                       const domain::ObjectId& object,
                                                                                       std::uint32_t property,
                                                                                       std::optional<std::uint32_t> arrayIndex) {
    if (!ensureOpen()) return std::nullopt;

    const std::string what = Describe(object, property, arrayIndex) + " @ " + address.ip;

    for (int attempt = 0; attempt <= m_settings.retries; ++attempt) {
        ReadPropertyRequest request;
        request.invokeId = m_nextInvokeId++;
        request.object = object;
        request.property = property;
        request.arrayIndex = arrayIndex;

        if (!m_socket.sendTo(ApduCodec::EncodeReadPropertyRequest(request), address.ip, address.port)) {
            Log::Debug(kTag, "Send failed for " + what + ": " + m_socket.lastError());
            return std::nullopt;
        }

        const auto deadline = Clock::now() + m_settings.timeout;
        Datagram datagram;
        while (true) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
            if (remaining.count() <= 0) break;

            auto status = m_socket.receiveFrom(datagram, remaining);
            if (status == ReceiveStatus::Timeout) break;
            if (status == ReceiveStatus::Error) {
                Log::Debug(kTag, "Receive failed for " + what + ": " + m_socket.lastError());
                return std::nullopt;
            }
            if (datagram.senderIp != address.ip) continue;

            auto reply = ApduCodec::TryDecodeReply(datagram.payload);
            if (!reply || reply->invokeId != request.invokeId) continue;

            switch (reply->kind) {
                case ReplyKind::Ack:
                    if (reply->object != object || reply->property != property) {
                        Log::Debug(kTag, "Mismatched ACK for " + what);
                        return std::nullopt;
                    }
                    return std::move(reply->values);
                case ReplyKind::Error:
                    Log::Debug(kTag, "Error reply for " + what + " (class " + std::to_string(reply->errorClass) +
                                     ", code " + std::to_string(reply->errorCode) + ")");
                    return std::nullopt;
                case ReplyKind::Reject:
                case ReplyKind::Abort:
                    Log::Debug(kTag, std::string(reply->kind == ReplyKind::Reject ? "Reject" : "Abort") +
                                     " for " + what + " (reason " + std::to_string(reply->reason) + ")");
                    return std::nullopt;
                case ReplyKind::Unsupported:
                    Log::Debug(kTag, "Unsupported reply for " + what);
                    return std::nullopt;
            }
        }
        Log::Debug(kTag, "Timeout on " + what + " (attempt " + std::to_string(attempt + 1) + ")");
    }
    return std::nullopt;
}

} // namespace bacnetinventory::infrastructure::bacnet
