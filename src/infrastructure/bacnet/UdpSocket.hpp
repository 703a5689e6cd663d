/**
 * @file UdpSocket.hpp
 * @brief RAII owner of one IPv4 datagram socket.
 */

#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include "domain/bacnet/WireFormat.hpp"

namespace bacnetinventory::infrastructure::bacnet {

/**
 * @struct Datagram
 * @brief One received datagram and its sender.
 */
struct Datagram {
    domain::bacnet::Bytes payload;
    std::string senderIp;
    std::uint16_t senderPort = 0;
};

enum class ReceiveStatus {
    Received,
    Timeout,
    Error       ///< e.g. ICMP port unreachable surfaced as ECONNREFUSED.
};

/**
 * @class UdpSocket
 * @brief Move-only datagram endpoint. Not shared between threads.
 */
class UdpSocket {
public:
    UdpSocket() = default;
    ~UdpSocket();

    UdpSocket(const UdpSocket&) = delete;
    UdpSocket& operator=(const UdpSocket&) = delete;
    UdpSocket(UdpSocket&& other) noexcept;
    UdpSocket& operator=(UdpSocket&& other) noexcept;

    /**
     * @brief Creates and binds the socket.
     * @param bindIp Local address, "0.0.0.0" for any.
     * @param port Local port, 0 for ephemeral.
     * @param enableBroadcast Sets SO_BROADCAST.
     */
    bool open(const std::string& bindIp = "0.0.0.0", std::uint16_t port = 0, bool enableBroadcast = false);

    void close();

    bool isOpen() const { return m_fd >= 0; }

    /** @brief Bound local port, 0 if closed. */
    std::uint16_t localPort() const;

    bool sendTo(const domain::bacnet::Bytes& payload, const std::string& ip, std::uint16_t port);

    /**
     * @brief Waits up to @p timeout for one datagram.
     */
    ReceiveStatus receiveFrom(Datagram& out, std::chrono::milliseconds timeout);

    /** @brief Description of the last failed call. */
    const std::string& lastError() const { return m_lastError; }

private:
    int m_fd = -1;
    std::string m_lastError;
};

} // namespace bacnetinventory::infrastructure::bacnet
