/**
 * @file PointText.hpp
 * @brief Text clean-up and unit display helpers applied to harvested attributes.
 */

#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace bacnetinventory::domain {

class PointText {
public:
    /**
     * @brief Cleans a device-supplied string.
     *
     * A field holding the decode replacement character (U+FFFD) is treated as
     * unrecoverable and becomes empty. Otherwise control bytes 0x00-0x1F are
     * removed and surrounding whitespace trimmed.
     */
    static std::string Sanitize(const std::string& raw);

    /**
     * @brief Maps an engineering unit code to its display symbol.
     * @param unitCode BACnet units enumeration, nullopt if the object has none.
     * @return Symbol for known codes, the decimal code for unknown ones, "" when absent.
     */
    static std::string UnitSymbol(std::optional<std::uint32_t> unitCode);
};

} // namespace bacnetinventory::domain
