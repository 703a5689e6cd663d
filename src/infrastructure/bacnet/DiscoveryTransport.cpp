/**
 * @file DiscoveryTransport.cpp
 * @brief Implementation of DiscoveryTransport.
 */

#include "infrastructure/bacnet/DiscoveryTransport.hpp"
#include <algorithm>
#include <set>
#include "domain/bacnet/FrameCodec.hpp"
#include "infrastructure/Log.hpp"
#include "infrastructure/bacnet/UdpSocket.hpp"

namespace bacnetinventory::infrastructure::bacnet {

using domain::bacnet::DiscoveryScope;
using domain::bacnet::FrameCodec;
using Clock = std::chrono::steady_clock;

namespace {

constexpr const char* kTag = "DiscoveryTransport";
constexpr int kResendEveryPolls = 5;
constexpr std::chrono::milliseconds kReceiveSlice{100};

/** Accumulates I-Am replies, first reply per device id wins. */
class DeviceCollector {
public:
    void accept(const Datagram& datagram) {
        auto device = FrameCodec::TryDecodeDiscoveryResponse(datagram.payload, datagram.senderIp, datagram.senderPort);
        if (!device) {
            Log::Debug(kTag, "Ignored " + std::to_string(datagram.payload.size()) + "-byte frame from " + datagram.senderIp);
            return;
        }
        if (!m_seen.insert(device->deviceId).second) {
            return;
        }
        Log::Debug(kTag, "I-Am device " + std::to_string(device->deviceId) + " at " + device->ip);
        m_devices.push_back(*device);
    }

    std::vector<domain::DiscoveredDevice> take() { return std::move(m_devices); }

private:
    std::set<std::uint32_t> m_seen;
    std::vector<domain::DiscoveredDevice> m_devices;
};

/** Reads whatever is already queued without blocking. */
void Drain(UdpSocket& socket, DeviceCollector& collector) {
    Datagram datagram;
    while (socket.receiveFrom(datagram, std::chrono::milliseconds(0)) == ReceiveStatus::Received) {
        collector.accept(datagram);
    }
}

} // namespace

DiscoveryTransport::DiscoveryTransport(DiscoverySettings settings)
    : m_settings(std::move(settings)) {
    m_settings.sweepBatchSize = std::max<std::size_t>(1, m_settings.sweepBatchSize);
}

std::vector<domain::DiscoveredDevice> DiscoveryTransport::discover(const domain::AddressRange& scope,
                                                                   std::chrono::milliseconds timeout,
                                                                   domain::CancellationToken& cancelToken) {
    // The round timeout covers sending as well as receiving.
    const auto deadline = Clock::now() + timeout;
    auto remainingTime = [deadline]() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
    };

    UdpSocket socket;
    if (!socket.open(m_settings.bindIp, 0, true)) {
        Log::Error(kTag, "Cannot open discovery socket: " + socket.lastError());
        return {};
    }

    DeviceCollector collector;

    const auto broadcastFrame = FrameCodec::EncodeDiscoveryRequest(DiscoveryScope::Broadcast);
    const auto broadcasts = m_settings.broadcastAddresses.empty()
        ? scope.broadcastAddresses()
        : m_settings.broadcastAddresses;
    for (const auto& address : broadcasts) {
        if (cancelToken.isCancelled()) return collector.take();
        if (!socket.sendTo(broadcastFrame, address, m_settings.port)) {
            Log::Debug(kTag, "Broadcast failed: " + socket.lastError());
        }
    }

    if (m_settings.unicastSweep) {
        const auto unicastFrame = FrameCodec::EncodeDiscoveryRequest(DiscoveryScope::Unicast);
        const auto hosts = scope.hosts();
        std::size_t sent = 0;
        for (const auto& host : hosts) {
            if (cancelToken.isCancelled()) return collector.take();
            if (remainingTime().count() <= 0) break;
            if (!socket.sendTo(unicastFrame, host, m_settings.port)) {
                Log::Debug(kTag, "Unicast failed: " + socket.lastError());
            }
            if (++sent % m_settings.sweepBatchSize == 0) {
                Drain(socket, collector);
                const auto settle = std::min(m_settings.sweepBatchDelay, std::max(std::chrono::milliseconds(0), remainingTime()));
                if (!cancelToken.waitFor(settle)) {
                    return collector.take();
                }
            }
        }
        if (sent < hosts.size()) {
            Log::Info(kTag, "Round timeout reached after " + std::to_string(sent) + " of " +
                            std::to_string(hosts.size()) + " hosts in " + scope.toString());
        } else {
            Log::Info(kTag, "Swept " + std::to_string(sent) + " hosts in " + scope.toString());
        }
    }

    Datagram datagram;
    while (!cancelToken.isCancelled()) {
        auto remaining = remainingTime();
        if (remaining.count() <= 0) break;

        auto status = socket.receiveFrom(datagram, std::min(remaining, kReceiveSlice));
        if (status == ReceiveStatus::Received) {
            collector.accept(datagram);
        } else if (status == ReceiveStatus::Error) {
            Log::Debug(kTag, "Receive: " + socket.lastError());
        }
    }
    Drain(socket, collector);

    auto devices = collector.take();
    Log::Info(kTag, "Discovered " + std::to_string(devices.size()) + " device(s)");
    return devices;
}

std::optional<domain::DiscoveredDevice> DiscoveryTransport::resolveDevice(const std::string& ip,
                                                                          domain::CancellationToken& cancelToken,
                                                                          std::chrono::milliseconds maxWait,
                                                                          std::chrono::milliseconds pollInterval) {
    if (maxWait.count() <= 0) return std::nullopt;

    UdpSocket socket;
    if (!socket.open(m_settings.bindIp, 0, false)) {
        Log::Error(kTag, "Cannot open resolve socket: " + socket.lastError());
        return std::nullopt;
    }

    const auto request = FrameCodec::EncodeDiscoveryRequest(DiscoveryScope::Unicast);
    if (pollInterval.count() <= 0) pollInterval = std::chrono::milliseconds(100);
    const auto start = Clock::now();
    const auto deadline = start + maxWait;

    Datagram datagram;
    for (long long poll = 0; Clock::now() < deadline; ++poll) {
        if (cancelToken.isCancelled()) return std::nullopt;

        if (poll % kResendEveryPolls == 0 && !socket.sendTo(request, ip, m_settings.port)) {
            Log::Debug(kTag, "Who-Is to " + ip + " failed: " + socket.lastError());
        }

        const auto pollEnd = std::min<Clock::time_point>(deadline, start + pollInterval * (poll + 1));
        while (true) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(pollEnd - Clock::now());
            if (remaining.count() <= 0) break;

            auto status = socket.receiveFrom(datagram, remaining);
            if (status == ReceiveStatus::Timeout) break;
            if (status == ReceiveStatus::Error) {
                Log::Debug(kTag, "Resolve " + ip + ": " + socket.lastError());
                if (!cancelToken.waitFor(remaining)) return std::nullopt;
                break;
            }
            if (datagram.senderIp != ip) continue;

            auto device = FrameCodec::TryDecodeDiscoveryResponse(datagram.payload, datagram.senderIp, datagram.senderPort);
            if (device) {
                Log::Debug(kTag, "Resolved " + ip + " -> device " + std::to_string(device->deviceId));
                return device;
            }
        }
    }

    Log::Debug(kTag, "No I-Am from " + ip + " within " + std::to_string(maxWait.count()) + " ms");
    return std::nullopt;
}

} // namespace bacnetinventory::infrastructure::bacnet
