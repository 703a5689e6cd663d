/**
 * @file PointText.cpp
 * @brief Implementation of PointText.
 */

#include "domain/PointText.hpp"
#include <map>

namespace bacnetinventory::domain {

namespace {

const std::string kReplacementChar = "\xEF\xBF\xBD";

const std::map<std::uint32_t, std::string>& UnitTable() {
    static const std::map<std::uint32_t, std::string> table = {
        {19, "kWh"},
        {27, "Hz"},
        {48, "kW"},
        {53, "Pa"},
        {54, "kPa"},
        {62, "\xE2\x84\x83"},     // degrees Celsius
        {98, "%"},
        {111, "rpm"},
        {135, "m\xC2\xB3/h"},
        {206, "mmAq"},
    };
    return table;
}

} // namespace

std::string PointText::Sanitize(const std::string& raw) {
    if (raw.find(kReplacementChar) != std::string::npos) {
        return "";
    }

    std::string out;
    out.reserve(raw.size());
    for (char ch : raw) {
        if (static_cast<unsigned char>(ch) < 0x20) continue;
        out.push_back(ch);
    }

    size_t first = out.find_first_not_of(' ');
    if (first == std::string::npos) return "";
    size_t last = out.find_last_not_of(' ');
    return out.substr(first, last - first + 1);
}

std::string PointText::UnitSymbol(std::optional<std::uint32_t> unitCode) {
    if (!unitCode) return "";
    auto it = UnitTable().find(*unitCode);
    if (it != UnitTable().end()) {
        return it->second;
    }
    return std::to_string(*unitCode);
}

} // namespace bacnetinventory::domain
