/**
 * @file LoopbackDevice.hpp
 * @brief Simulated BACnet/IP device on 127.0.0.1 for the network tests.
 */

#pragma once
#include <atomic>
#include <map>
#include <mutex>
#include <optional>
#include <thread>
#include <tuple>
#include <vector>
#include "domain/bacnet/ApduCodec.hpp"
#include "domain/bacnet/FrameCodec.hpp"
#include "infrastructure/bacnet/UdpSocket.hpp"

namespace bacnetinventory::test {

/**
 * Answers Who-Is with an I-Am and ReadProperty with the configured values
 * (Error for anything unknown). In silent mode requests are counted but
 * never answered.
 */
class LoopbackDevice {
public:
    explicit LoopbackDevice(std::uint32_t deviceId, std::uint16_t vendorId = 7)
        : m_deviceId(deviceId), m_vendorId(vendorId) {}

    ~LoopbackDevice() { stop(); }

    bool start() {
        if (!m_socket.open("127.0.0.1", 0, false)) return false;
        m_running = true;
        m_thread = std::thread([this] { loop(); });
        return true;
    }

    void stop() {
        m_running = false;
        if (m_thread.joinable()) m_thread.join();
        m_socket.close();
    }

    std::uint16_t port() const { return m_socket.localPort(); }

    void setProperty(const domain::ObjectId& object, std::uint32_t property, std::optional<std::uint32_t> index,
                     std::vector<domain::PropertyValue> values) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_properties[Key(object, property, index)] = std::move(values);
    }

    void setSilent(bool silent) { m_silent = silent; }

    int whoIsCount() const { return m_whoIs.load(); }
    int readCount() const { return m_reads.load(); }

private:
    using PropertyKey = std::tuple<std::uint32_t, std::uint32_t, long long>;

    static PropertyKey Key(const domain::ObjectId& object, std::uint32_t property, std::optional<std::uint32_t> index) {
        return PropertyKey{object.packed(), property, index ? static_cast<long long>(*index) : -1};
    }

    void loop() {
        using namespace domain::bacnet;
        infrastructure::bacnet::Datagram datagram;
        while (m_running) {
            auto status = m_socket.receiveFrom(datagram, std::chrono::milliseconds(20));
            if (status != infrastructure::bacnet::ReceiveStatus::Received) continue;

            const auto& frame = datagram.payload;
            if (frame.size() == 8 && frame[6] == 0x10 && frame[7] == 0x08) {
                ++m_whoIs;
                if (m_silent) continue;
                m_socket.sendTo(FrameCodec::EncodeSyntheticIAmFrame(m_deviceId, m_vendorId, 1476, 3,
                                                                    DiscoveryScope::Unicast),
                                datagram.senderIp, datagram.senderPort);
                continue;
            }

            auto request = ApduCodec::TryDecodeReadPropertyRequest(frame);
            if (!request) continue;
            ++m_reads;
            if (m_silent) continue;

            Bytes reply;
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                auto it = m_properties.find(Key(request->object, request->property, request->arrayIndex));
                if (it == m_properties.end()) {
                    reply = ApduCodec::EncodeError(request->invokeId, 2, 32);   // property, unknown-property
                } else {
                    reply = ApduCodec::EncodeReadPropertyAck(*request, it->second);
                }
            }
            m_socket.sendTo(reply, datagram.senderIp, datagram.senderPort);
        }
    }

    std::uint32_t m_deviceId;
    std::uint16_t m_vendorId;
    infrastructure::bacnet::UdpSocket m_socket;
    std::thread m_thread;
    std::atomic<bool> m_running{false};
    std::atomic<bool> m_silent{false};
    std::atomic<int> m_whoIs{0};
    std::atomic<int> m_reads{0};
    std::mutex m_mutex;
    std::map<PropertyKey, std::vector<domain::PropertyValue>> m_properties;
};

} // namespace bacnetinventory::test
