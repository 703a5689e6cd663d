/**
 * @file Log.hpp
 * @brief Tagged console output shared by services and workers.
 */

#pragma once
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <string>

namespace bacnetinventory::infrastructure {

/**
 * @class Log
 * @brief "[Component] message" lines on std::cout / std::cerr.
 *
 * Writers from worker threads are serialized so lines never interleave.
 * Debug lines appear only when BACNET_INVENTORY_DEBUG is set.
 */
class Log {
public:
    static void Info(const std::string& component, const std::string& message) {
        std::lock_guard<std::mutex> lock(Mutex());
        std::cout << "[" << component << "] " << message << std::endl;
    }

    static void Warn(const std::string& component, const std::string& message) {
        std::lock_guard<std::mutex> lock(Mutex());
        std::cerr << "[" << component << "] Warning: " << message << std::endl;
    }

    static void Error(const std::string& component, const std::string& message) {
        std::lock_guard<std::mutex> lock(Mutex());
        std::cerr << "[" << component << "] Error: " << message << std::endl;
    }

    static void Debug(const std::string& component, const std::string& message) {
        if (!DebugEnabled()) return;
        std::lock_guard<std::mutex> lock(Mutex());
        std::cout << "[" << component << "] (debug) " << message << std::endl;
    }

    static bool DebugEnabled() {
        static const bool enabled = std::getenv("BACNET_INVENTORY_DEBUG") != nullptr;
        return enabled;
    }

private:
    static std::mutex& Mutex() {
        static std::mutex mutex;
        return mutex;
    }
};

} // namespace bacnetinventory::infrastructure
