/**
 * @file UdpSocket.cpp
 * @brief POSIX implementation of UdpSocket.
 */

#include "infrastructure/bacnet/UdpSocket.hpp"
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace bacnetinventory::infrastructure::bacnet {

namespace {

constexpr std::size_t kMaxDatagram = 1500;

bool ToSockAddr(const std::string& ip, std::uint16_t port, sockaddr_in& addr) {
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    return inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) == 1;
}

} // namespace

UdpSocket::~UdpSocket() {
    close();
}

UdpSocket::UdpSocket(UdpSocket&& other) noexcept
    : m_fd(other.m_fd), m_lastError(std::move(other.m_lastError)) {
    other.m_fd = -1;
}

UdpSocket& UdpSocket::operator=(UdpSocket&& other) noexcept {
    if (this != &other) {
        close();
        m_fd = other.m_fd;
        m_lastError = std::move(other.m_lastError);
        other.m_fd = -1;
    }
    return *this;
}

bool UdpSocket::open(const std::string& bindIp, std::uint16_t port, bool enableBroadcast) {
    close();

    m_fd = ::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
    if (m_fd < 0) {
        m_lastError = std::string("socket: ") + std::strerror(errno);
        return false;
    }

    if (enableBroadcast) {
        int on = 1;
        if (::setsockopt(m_fd, SOL_SOCKET, SO_BROADCAST, &on, sizeof(on)) < 0) {
            m_lastError = std::string("SO_BROADCAST: ") + std::strerror(errno);
            close();
            return false;
        }
    }

    sockaddr_in local{};
    if (!ToSockAddr(bindIp, port, local)) {
        m_lastError = "invalid bind address " + bindIp;
        close();
        return false;
    }
    if (::bind(m_fd, reinterpret_cast<sockaddr*>(&local), sizeof(local)) < 0) {
        m_lastError = "bind " + bindIp + ":" + std::to_string(port) + ": " + std::strerror(errno);
        close();
        return false;
    }
    return true;
}

void UdpSocket::close() {
    if (m_fd >= 0) {
        ::close(m_fd);
        m_fd = -1;
    }
}

std::uint16_t UdpSocket::localPort() const {
    if (m_fd < 0) return 0;
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (::getsockname(m_fd, reinterpret_cast<sockaddr*>(&addr), &len) < 0) return 0;
    return ntohs(addr.sin_port);
}

bool UdpSocket::sendTo(const domain::bacnet::Bytes& payload, const std::string& ip, std::uint16_t port) {
    if (m_fd < 0) {
        m_lastError = "socket not open";
        return false;
    }
    sockaddr_in dest{};
    if (!ToSockAddr(ip, port, dest)) {
        m_lastError = "invalid address " + ip;
        return false;
    }
    ssize_t sent = ::sendto(m_fd, payload.data(), payload.size(), 0,
                            reinterpret_cast<sockaddr*>(&dest), sizeof(dest));
    if (sent < 0 || static_cast<std::size_t>(sent) != payload.size()) {
        m_lastError = "sendto " + ip + ": " + (sent < 0 ? std::strerror(errno) : "short write");
        return false;
    }
    return true;
}

ReceiveStatus UdpSocket::receiveFrom(Datagram& out, std::chrono::milliseconds timeout) {
    if (m_fd < 0) {
        m_lastError = "socket not open";
        return ReceiveStatus::Error;
    }

    pollfd pfd{};
    pfd.fd = m_fd;
    pfd.events = POLLIN;
    const int waitMs = timeout.count() < 0 ? 0 : static_cast<int>(timeout.count());
    int ready = ::poll(&pfd, 1, waitMs);
    if (ready == 0) return ReceiveStatus::Timeout;
    if (ready < 0) {
        if (errno == EINTR) return ReceiveStatus::Timeout;
        m_lastError = std::string("poll: ") + std::strerror(errno);
        return ReceiveStatus::Error;
    }

    std::uint8_t buffer[kMaxDatagram];
    sockaddr_in sender{};
    socklen_t senderLen = sizeof(sender);
    ssize_t n = ::recvfrom(m_fd, buffer, sizeof(buffer), 0,
                           reinterpret_cast<sockaddr*>(&sender), &senderLen);
    if (n < 0) {
        m_lastError = std::string("recvfrom: ") + std::strerror(errno);
        return ReceiveStatus::Error;
    }

    char ipText[INET_ADDRSTRLEN] = {0};
    inet_ntop(AF_INET, &sender.sin_addr, ipText, sizeof(ipText));
    out.payload.assign(buffer, buffer + n);
    out.senderIp = ipText;
    out.senderPort = ntohs(sender.sin_port);
    return ReceiveStatus::Received;
}

} // namespace bacnetinventory::infrastructure::bacnet
