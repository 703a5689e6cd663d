/**
 * @file ObjectKind.hpp
 * @brief Value objects describing the BACnet object types tracked by the inventory.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace bacnetinventory::domain {

/**
 * @enum ObjectKind
 * @brief Monitorable object kinds, in catalog type-code order (OBJ_TYPE 0..8).
 */
enum class ObjectKind {
    AI,     ///< Analog input.
    AO,     ///< Analog output.
    AV,     ///< Analog value.
    BI,     ///< Binary input.
    BO,     ///< Binary output.
    BV,     ///< Binary value.
    MSI,    ///< Multi-state input.
    MSO,    ///< Multi-state output.
    MSV     ///< Multi-state value.
};

/** @brief BACnet object type number of the device object. */
constexpr std::uint16_t kDeviceObjectType = 8;

/**
 * @struct ObjectId
 * @brief Protocol-level object identifier (10-bit type, 22-bit instance).
 */
struct ObjectId {
    std::uint16_t type = 0;
    std::uint32_t instance = 0;

    std::uint32_t packed() const {
        return (static_cast<std::uint32_t>(type & 0x3FF) << 22) | (instance & 0x3FFFFF);
    }

    static ObjectId FromPacked(std::uint32_t raw) {
        return ObjectId{static_cast<std::uint16_t>((raw >> 22) & 0x3FF), raw & 0x3FFFFF};
    }

    bool operator==(const ObjectId& other) const {
        return type == other.type && instance == other.instance;
    }
    bool operator!=(const ObjectId& other) const { return !(*this == other); }
};

/**
 * @brief Catalog type code (OBJ_TYPE) of a kind.
 */
inline int KindToTypeCode(ObjectKind kind) {
    return static_cast<int>(kind);
}

inline std::optional<ObjectKind> KindFromTypeCode(int code) {
    if (code < 0 || code > static_cast<int>(ObjectKind::MSV)) return std::nullopt;
    return static_cast<ObjectKind>(code);
}

/**
 * @brief Display prefix used in synthetic point ids ("AI", "MSV", ...).
 */
inline std::string KindPrefix(ObjectKind kind) {
    switch (kind) {
        case ObjectKind::AI: return "AI";
        case ObjectKind::AO: return "AO";
        case ObjectKind::AV: return "AV";
        case ObjectKind::BI: return "BI";
        case ObjectKind::BO: return "BO";
        case ObjectKind::BV: return "BV";
        case ObjectKind::MSI: return "MSI";
        case ObjectKind::MSO: return "MSO";
        case ObjectKind::MSV: return "MSV";
    }
    return "AI";
}

inline std::optional<ObjectKind> KindFromPrefix(const std::string& prefix) {
    if (prefix == "AI") return ObjectKind::AI;
    if (prefix == "AO") return ObjectKind::AO;
    if (prefix == "AV") return ObjectKind::AV;
    if (prefix == "BI") return ObjectKind::BI;
    if (prefix == "BO") return ObjectKind::BO;
    if (prefix == "BV") return ObjectKind::BV;
    if (prefix == "MSI") return ObjectKind::MSI;
    if (prefix == "MSO") return ObjectKind::MSO;
    if (prefix == "MSV") return ObjectKind::MSV;
    return std::nullopt;
}

/**
 * @brief BACnet object type number for a kind.
 */
inline std::uint16_t KindToObjectType(ObjectKind kind) {
    switch (kind) {
        case ObjectKind::AI: return 0;
        case ObjectKind::AO: return 1;
        case ObjectKind::AV: return 2;
        case ObjectKind::BI: return 3;
        case ObjectKind::BO: return 4;
        case ObjectKind::BV: return 5;
        case ObjectKind::MSI: return 13;
        case ObjectKind::MSO: return 14;
        case ObjectKind::MSV: return 19;
    }
    return 0;
}

/**
 * @brief Maps a BACnet object type back to a tracked kind.
 * @return nullopt for every type outside the supported set.
 */
inline std::optional<ObjectKind> KindFromObjectType(std::uint16_t type) {
    switch (type) {
        case 0: return ObjectKind::AI;
        case 1: return ObjectKind::AO;
        case 2: return ObjectKind::AV;
        case 3: return ObjectKind::BI;
        case 4: return ObjectKind::BO;
        case 5: return ObjectKind::BV;
        case 13: return ObjectKind::MSI;
        case 14: return ObjectKind::MSO;
        case 19: return ObjectKind::MSV;
        default: return std::nullopt;
    }
}

inline bool IsAnalog(ObjectKind kind) {
    return kind == ObjectKind::AI || kind == ObjectKind::AO || kind == ObjectKind::AV;
}

inline bool IsMultiState(ObjectKind kind) {
    return kind == ObjectKind::MSI || kind == ObjectKind::MSO || kind == ObjectKind::MSV;
}

} // namespace bacnetinventory::domain
