/**
 * @file AddressRange.hpp
 * @brief IPv4 host range targeted by a scan.
 */

#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace bacnetinventory::domain {

/**
 * @class AddressRange
 * @brief Contiguous IPv4 host range plus the broadcast addresses that cover it.
 *
 * Accepted forms: "172.16.130" (hosts .1-.254), "172.16.130.98" (one host),
 * "172.16.130.10-40" (last-octet range) and "172.16.130.0/24" (prefix 16..32).
 */
class AddressRange {
public:
    static std::optional<AddressRange> Parse(const std::string& text);

    /** @brief Every host address in the range, ascending. */
    std::vector<std::string> hosts() const;

    /** @brief Number of hosts. */
    std::size_t size() const { return static_cast<std::size_t>(m_last - m_first) + 1; }

    /**
     * @brief Directed broadcast of the range's network, the /16 supernet
     * broadcast when it differs, and the limited broadcast.
     */
    std::vector<std::string> broadcastAddresses() const;

    std::string toString() const;

    static std::optional<std::uint32_t> ParseIpv4(const std::string& text);
    static std::string FormatIpv4(std::uint32_t address);

private:
    AddressRange(std::uint32_t first, std::uint32_t last, int prefixLength)
        : m_first(first), m_last(last), m_prefixLength(prefixLength) {}

    std::uint32_t m_first;
    std::uint32_t m_last;
    int m_prefixLength;
};

} // namespace bacnetinventory::domain
