/**
 * @file TimeFormat.hpp
 * @brief Local-time stamps used in artifact names and rows.
 */

#pragma once
#include <ctime>
#include <string>

namespace bacnetinventory::domain {

std::tm ToLocalTime(std::time_t tt);

/** @brief "yyyyMMdd_HHmmss", embedded in artifact file names. */
std::string FormatRunStamp(std::time_t tt);

/** @brief "yyyy-MM-dd", the daily artifact folder. */
std::string FormatDay(std::time_t tt);

/** @brief "yyyy-MM-dd HH:mm:ss", the DATETIME column and history rows. */
std::string FormatDateTime(std::time_t tt);

} // namespace bacnetinventory::domain
