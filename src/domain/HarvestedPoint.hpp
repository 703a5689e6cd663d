/**
 * @file HarvestedPoint.hpp
 * @brief Domain entity for a point read from a live device.
 */

#pragma once
#include <cctype>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "domain/ObjectKind.hpp"

namespace bacnetinventory::domain {

/** @brief Number of state-text columns kept for multi-state points. */
constexpr std::size_t kStateTextSlots = 10;

/**
 * @struct HarvestedPoint
 * @brief One monitorable object discovered on a device during one harvest pass.
 */
struct HarvestedPoint {
    std::string syntheticId;                ///< "{Prefix}-{Instance}", e.g. "AI-12".
    ObjectKind kind = ObjectKind::AI;
    std::uint32_t instance = 0;
    std::string name;
    std::string description;
    std::string unitSymbol;
    bool decimalFlag = false;               ///< True for analog kinds.
    std::vector<std::string> stateTexts;    ///< kStateTextSlots entries for multi-state kinds, else empty.
};

/**
 * @brief Explicit synthetic id -> protocol object map for one device session.
 */
using PointIndex = std::map<std::string, ObjectId>;

inline std::string FormatSyntheticId(ObjectKind kind, std::uint32_t instance) {
    return KindPrefix(kind) + "-" + std::to_string(instance);
}

/**
 * @brief Parses "AI-1" style ids back into a protocol object id.
 * @return nullopt for unknown prefixes, missing or non-numeric instances.
 */
inline std::optional<ObjectId> ParseSyntheticId(const std::string& syntheticId) {
    auto dash = syntheticId.find('-');
    if (dash == std::string::npos || dash == 0 || dash + 1 >= syntheticId.size()) return std::nullopt;

    std::string prefix;
    for (size_t i = 0; i < dash; ++i) {
        char c = syntheticId[i];
        if (c == ' ') continue;
        prefix.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    auto kind = KindFromPrefix(prefix);
    if (!kind) return std::nullopt;

    std::uint64_t instance = 0;
    for (size_t i = dash + 1; i < syntheticId.size(); ++i) {
        char c = syntheticId[i];
        if (c < '0' || c > '9') return std::nullopt;
        instance = instance * 10 + static_cast<std::uint64_t>(c - '0');
        if (instance > 0x3FFFFF) return std::nullopt;
    }
    return ObjectId{KindToObjectType(*kind), static_cast<std::uint32_t>(instance)};
}

} // namespace bacnetinventory::domain
