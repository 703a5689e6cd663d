/**
 * @file ScanSession.hpp
 * @brief Parameters of one orchestration call.
 */

#pragma once
#include <algorithm>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "domain/AddressRange.hpp"
#include "domain/CancellationToken.hpp"
#include "domain/CatalogRow.hpp"

namespace bacnetinventory::domain {

constexpr int kMinParallelism = 1;
constexpr int kMaxParallelism = 50;

inline int ClampParallelism(int requested) {
    return std::clamp(requested, kMinParallelism, kMaxParallelism);
}

/**
 * @struct ScanSession
 * @brief Lives for one scanRange/harvestMany call; never persisted.
 *
 * Exactly one of @c range and @c devices is expected to be populated.
 */
struct ScanSession {
    std::string sessionId;
    std::optional<AddressRange> range;
    std::vector<DeviceTarget> devices;
    std::chrono::milliseconds perHostTimeout{1500};
    std::chrono::milliseconds roundTimeout{5000};    ///< Whole scanRange call.
    std::chrono::milliseconds batchTimeout{0};       ///< Whole harvestMany call; 0 means no deadline.
    int maxParallelism = 10;
    std::shared_ptr<CancellationToken> cancelToken = std::make_shared<CancellationToken>();
};

/** @brief "yyyyMMdd_HHmmss-<n>" style id, unique within the process. */
std::string NewSessionId();

} // namespace bacnetinventory::domain
