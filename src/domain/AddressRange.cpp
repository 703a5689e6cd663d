/**
 * @file AddressRange.cpp
 * @brief Implementation of AddressRange.
 */

#include "domain/AddressRange.hpp"
#include <sstream>

namespace bacnetinventory::domain {

namespace {

std::vector<std::string> Split(const std::string& text, char sep) {
    std::vector<std::string> parts;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, sep)) {
        parts.push_back(item);
    }
    if (!text.empty() && text.back() == sep) parts.push_back("");
    return parts;
}

std::optional<std::uint32_t> ParseNumber(const std::string& text, std::uint32_t maxValue) {
    if (text.empty() || text.size() > 10) return std::nullopt;
    std::uint64_t v = 0;
    for (char c : text) {
        if (c < '0' || c > '9') return std::nullopt;
        v = v * 10 + static_cast<std::uint64_t>(c - '0');
    }
    if (v > maxValue) return std::nullopt;
    return static_cast<std::uint32_t>(v);
}

std::string Trimmed(const std::string& s) {
    size_t first = s.find_first_not_of(" \t");
    if (first == std::string::npos) return "";
    size_t last = s.find_last_not_of(" \t");
    return s.substr(first, last - first + 1);
}

} // namespace

std::optional<std::uint32_t> AddressRange::ParseIpv4(const std::string& text) {
    auto parts = Split(text, '.');
    if (parts.size() != 4) return std::nullopt;
    std::uint32_t address = 0;
    for (const auto& part : parts) {
        auto octet = ParseNumber(part, 255);
        if (!octet) return std::nullopt;
        address = (address << 8) | *octet;
    }
    return address;
}

std::string AddressRange::FormatIpv4(std::uint32_t address) {
    return std::to_string((address >> 24) & 0xFF) + "." +
           std::to_string((address >> 16) & 0xFF) + "." +
           std::to_string((address >> 8) & 0xFF) + "." +
           std::to_string(address & 0xFF);
}

std::optional<AddressRange> AddressRange::Parse(const std::string& textIn) {
    const std::string text = Trimmed(textIn);
    if (text.empty()) return std::nullopt;

    auto slash = text.find('/');
    if (slash != std::string::npos) {
        auto base = ParseIpv4(text.substr(0, slash));
        auto prefix = ParseNumber(text.substr(slash + 1), 32);
        if (!base || !prefix || *prefix < 16) return std::nullopt;
        const std::uint32_t mask = (*prefix == 0) ? 0 : (0xFFFFFFFFu << (32 - *prefix));
        const std::uint32_t network = *base & mask;
        const std::uint32_t broadcast = network | ~mask;
        if (*prefix >= 31) {
            return AddressRange(network, broadcast, static_cast<int>(*prefix));
        }
        return AddressRange(network + 1, broadcast - 1, static_cast<int>(*prefix));
    }

    auto parts = Split(text, '.');
    if (parts.size() == 3) {
        auto head = ParseIpv4(text + ".0");
        if (!head) return std::nullopt;
        return AddressRange(*head + 1, *head + 254, 24);
    }
    if (parts.size() != 4) return std::nullopt;

    auto dash = parts[3].find('-');
    if (dash == std::string::npos) {
        auto single = ParseIpv4(text);
        if (!single) return std::nullopt;
        return AddressRange(*single, *single, 32);
    }

    auto head = ParseIpv4(parts[0] + "." + parts[1] + "." + parts[2] + ".0");
    auto from = ParseNumber(parts[3].substr(0, dash), 255);
    auto to = ParseNumber(parts[3].substr(dash + 1), 255);
    if (!head || !from || !to || *from > *to) return std::nullopt;
    return AddressRange(*head + *from, *head + *to, 24);
}

std::vector<std::string> AddressRange::hosts() const {
    std::vector<std::string> out;
    out.reserve(size());
    for (std::uint64_t a = m_first; a <= m_last; ++a) {
        out.push_back(FormatIpv4(static_cast<std::uint32_t>(a)));
    }
    return out;
}

std::vector<std::string> AddressRange::broadcastAddresses() const {
    std::vector<std::string> out;
    const int prefix = m_prefixLength >= 31 ? 24 : m_prefixLength;
    const std::uint32_t mask = 0xFFFFFFFFu << (32 - prefix);
    const std::uint32_t directed = (m_first & mask) | ~mask;
    out.push_back(FormatIpv4(directed));

    const std::uint32_t supernet = (m_first & 0xFFFF0000u) | 0x0000FFFFu;
    if (supernet != directed) {
        out.push_back(FormatIpv4(supernet));
    }
    out.push_back("255.255.255.255");
    return out;
}

std::string AddressRange::toString() const {
    if (m_first == m_last) return FormatIpv4(m_first);
    return FormatIpv4(m_first) + "-" + FormatIpv4(m_last);
}

} // namespace bacnetinventory::domain
