/**
 * @file PropertyReader.hpp
 * @brief Interface for reading a property of an object on a remote device.
 */

#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "domain/ObjectKind.hpp"
#include "domain/PropertyValue.hpp"

namespace bacnetinventory::domain {

/**
 * @brief BACnet property identifiers used by the inventory.
 */
namespace PropertyId {
constexpr std::uint32_t Description = 28;
constexpr std::uint32_t ObjectList = 76;
constexpr std::uint32_t ObjectName = 77;
constexpr std::uint32_t PresentValue = 85;
constexpr std::uint32_t StateText = 110;
constexpr std::uint32_t Units = 117;
} // namespace PropertyId

/**
 * @struct DeviceAddress
 * @brief Where a device object lives on the network.
 */
struct DeviceAddress {
    std::string ip;
    std::uint16_t port = 47808;
};

/**
 * @class PropertyReader
 * @brief Abstract "read named property of an object" capability.
 *
 * Implementations are not required to be thread-safe; callers create one
 * reader per concurrent unit of work.
 */
class PropertyReader {
public:
    virtual ~PropertyReader() = default;

    /**
     * @brief Reads one property.
     * @param address Device address.
     * @param object Target object.
     * @param property Property identifier.
     * @param arrayIndex Optional array index (0 returns the array length).
     * @return The decoded values, or nullopt if the read failed for any reason.
     */
    virtual std::optional<std::vector<PropertyValue>> readProperty(const DeviceAddress& address,
                                                                   const ObjectId& object,
                                                                   std::uint32_t property,
                                                                   std::optional<std::uint32_t> arrayIndex = std::nullopt) = 0;
};

} // namespace bacnetinventory::domain
