/**
 * @file ScanOrchestrator.cpp
 * @brief Implementation of ScanOrchestrator.
 */

#include "application/ScanOrchestrator.hpp"
#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <thread>
#include "application/AsyncTaskManager.hpp"
#include "infrastructure/Log.hpp"

namespace bacnetinventory::application {

using infrastructure::Log;

namespace {

using Clock = std::chrono::steady_clock;

constexpr const char* kTag = "ScanOrchestrator";
constexpr std::chrono::milliseconds kPollInterval{100};
constexpr std::chrono::milliseconds kWatchInterval{10};

std::chrono::milliseconds PollIntervalFor(std::chrono::milliseconds maxWait) {
    return std::min(kPollInterval, std::max(std::chrono::milliseconds(1), maxWait));
}

std::chrono::milliseconds TimeLeft(Clock::time_point deadline) {
    return std::max(std::chrono::milliseconds(0),
                    std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()));
}

/**
 * Cancels @c child when @c parent is cancelled or the optional deadline
 * passes. Stops watching when destroyed.
 */
class DeadlineWatch {
public:
    DeadlineWatch(domain::CancellationToken& parent, domain::CancellationToken& child,
                  std::optional<Clock::time_point> deadline)
        : m_parent(parent), m_child(child), m_deadline(deadline), m_thread(&DeadlineWatch::run, this) {}

    ~DeadlineWatch() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_done = true;
        }
        m_cv.notify_all();
        m_thread.join();
    }

    DeadlineWatch(const DeadlineWatch&) = delete;
    DeadlineWatch& operator=(const DeadlineWatch&) = delete;

    bool expired() const { return m_expired.load(); }

private:
    void run() {
        std::unique_lock<std::mutex> lock(m_mutex);
        while (!m_done) {
            if (m_parent.isCancelled()) {
                m_child.cancel();
                return;
            }
            if (m_deadline && Clock::now() >= *m_deadline) {
                m_expired = true;
                m_child.cancel();
                return;
            }
            m_cv.wait_for(lock, kWatchInterval);
        }
    }

    domain::CancellationToken& m_parent;
    domain::CancellationToken& m_child;
    std::optional<Clock::time_point> m_deadline;
    std::mutex m_mutex;
    std::condition_variable m_cv;
    bool m_done = false;
    std::atomic<bool> m_expired{false};
    std::thread m_thread;
};

} // namespace

ScanOrchestrator::ScanOrchestrator(std::shared_ptr<domain::DeviceResolver> resolver, PropertyReaderFactory readerFactory)
    : m_resolver(std::move(resolver)), m_readerFactory(std::move(readerFactory)) {
    if (!m_resolver) {
        throw std::invalid_argument("ScanOrchestrator requires a device resolver");
    }
}

std::vector<domain::DiscoveredDevice> ScanOrchestrator::scanRange(const domain::ScanSession& session) {
    if (!session.range) return {};
    return scanRange(session.range->hosts(), session.maxParallelism, session.perHostTimeout, session.roundTimeout,
                     *session.cancelToken);
}

std::vector<domain::DiscoveredDevice> ScanOrchestrator::scanRange(const std::vector<std::string>& addresses,
                                                                  int maxParallelism,
                                                                  std::chrono::milliseconds perHostTimeout,
                                                                  std::chrono::milliseconds roundTimeout,
                                                                  domain::CancellationToken& cancelToken) {
    const auto deadline = Clock::now() + roundTimeout;
    const int parallelism = domain::ClampParallelism(maxParallelism);
    Log::Info(kTag, "Scanning " + std::to_string(addresses.size()) + " host(s), parallelism " +
                    std::to_string(parallelism) + ", round " + std::to_string(roundTimeout.count()) + " ms");

    std::mutex resultsMutex;
    std::map<std::uint32_t, domain::DiscoveredDevice> found;
    std::size_t admitted = 0;

    {
        AsyncTaskManager gate(parallelism);
        for (const auto& ip : addresses) {
            if (cancelToken.isCancelled()) break;
            const auto budget = std::min(perHostTimeout, TimeLeft(deadline));
            if (budget.count() <= 0) break;

            ++admitted;
            gate.SubmitTask(TaskType::Discovery, "Resolve " + ip,
                [this, ip, deadline, perHostTimeout, &cancelToken, &resultsMutex, &found](std::shared_ptr<TaskStatus>) {
                    // The slot may have been granted late; recompute what is left of the round.
                    const auto maxWait = std::min(perHostTimeout, TimeLeft(deadline));
                    if (maxWait.count() <= 0) return;
                    try {
                        auto device = m_resolver->resolveDevice(ip, cancelToken, maxWait, PollIntervalFor(maxWait));
                        if (!device) {
                            Log::Debug(kTag, "No device at " + ip);
                            return;
                        }
                        std::lock_guard<std::mutex> lock(resultsMutex);
                        found.emplace(device->deviceId, *device);
                    } catch (const std::exception& e) {
                        Log::Error(kTag, "Resolve " + ip + " failed: " + e.what());
                    }
                });
        }
        gate.WaitAll();
    }

    if (admitted < addresses.size() && !cancelToken.isCancelled()) {
        Log::Info(kTag, "Round timeout reached; " + std::to_string(addresses.size() - admitted) +
                        " host(s) not tried");
    }

    std::vector<domain::DiscoveredDevice> devices;
    devices.reserve(found.size());
    for (auto& [id, device] : found) {
        devices.push_back(std::move(device));
    }
    Log::Info(kTag, "Scan finished: " + std::to_string(devices.size()) + " device(s)");
    return devices;
}

HarvestBatch ScanOrchestrator::harvestMany(const domain::ScanSession& session) {
    return harvestMany(session.devices, session.maxParallelism, *session.cancelToken, session.perHostTimeout,
                       session.batchTimeout);
}

HarvestBatch ScanOrchestrator::harvestMany(const std::vector<domain::DeviceTarget>& targets,
                                           int maxParallelism,
                                           domain::CancellationToken& cancelToken,
                                           std::chrono::milliseconds resolveTimeout,
                                           std::chrono::milliseconds batchTimeout) {
    const int parallelism = domain::ClampParallelism(maxParallelism);
    HarvestBatch batch;
    std::mutex batchMutex;

    std::optional<Clock::time_point> deadline;
    if (batchTimeout.count() > 0) deadline = Clock::now() + batchTimeout;
    domain::CancellationToken batchToken;
    DeadlineWatch watch(cancelToken, batchToken, deadline);

    auto recordFailure = [&batch, &batchMutex](const std::string& key) {
        std::lock_guard<std::mutex> lock(batchMutex);
        batch.failures[key] += 1;
    };

    std::set<std::string> admitted;
    {
        AsyncTaskManager gate(parallelism);
        for (const auto& target : targets) {
            if (cancelToken.isCancelled() || batchToken.isCancelled()) break;
            if (!admitted.insert(target.deviceKey).second) {
                Log::Warn(kTag, "Device " + target.deviceKey + " listed more than once; harvesting it once");
                continue;
            }

            gate.SubmitTask(TaskType::Harvest, "Harvest " + target.deviceKey,
                [this, target, resolveTimeout, &batchToken, &batch, &batchMutex, &recordFailure](std::shared_ptr<TaskStatus>) {
                    if (batchToken.isCancelled()) return;
                    try {
                        std::optional<std::uint32_t> instance = target.deviceInstance;
                        std::uint16_t port = target.port;
                        if (!instance) {
                            auto device = m_resolver->resolveDevice(target.ip, batchToken, resolveTimeout,
                                                                    PollIntervalFor(resolveTimeout));
                            if (!device) {
                                if (batchToken.isCancelled()) return;
                                Log::Warn(kTag, "Device " + target.deviceKey + " at " + target.ip + " did not answer Who-Is");
                                recordFailure(target.deviceKey);
                                return;
                            }
                            instance = device->deviceId;
                        }

                        std::unique_ptr<domain::PropertyReader> reader;
                        if (m_readerFactory) reader = m_readerFactory();
                        if (!reader) {
                            Log::Error(kTag, "No property reader for " + target.deviceKey);
                            recordFailure(target.deviceKey);
                            return;
                        }

                        PointEnumerator enumerator(*reader);
                        HarvestReport report = enumerator.harvest(domain::DeviceAddress{target.ip, port}, *instance, batchToken);

                        std::lock_guard<std::mutex> lock(batchMutex);
                        if (report.status == HarvestStatus::Completed) {
                            batch.points[target.deviceKey] = report.points;
                        } else if (report.status == HarvestStatus::DirectoryUnavailable) {
                            batch.failures[target.deviceKey] += 1;
                        }
                        batch.reports[target.deviceKey] = std::move(report);
                    } catch (const std::exception& e) {
                        Log::Error(kTag, "Harvest of " + target.deviceKey + " failed: " + e.what());
                        recordFailure(target.deviceKey);
                    }
                });
        }
        gate.WaitAll();
    }

    if (watch.expired()) {
        // Unfinished devices are failures, never empty harvests.
        std::set<std::string> reported;
        for (const auto& target : targets) {
            if (!reported.insert(target.deviceKey).second) continue;
            if (batch.points.count(target.deviceKey) || batch.failures.count(target.deviceKey)) continue;

            auto [it, created] = batch.reports.try_emplace(target.deviceKey);
            HarvestReport& report = it->second;
            if (created) {
                report.address = domain::DeviceAddress{target.ip, target.port};
                if (target.deviceInstance) report.deviceInstance = *target.deviceInstance;
            }
            report.status = HarvestStatus::TimedOut;
            report.points.clear();
            report.index.clear();
            batch.failures[target.deviceKey] += 1;
            Log::Warn(kTag, "Device " + target.deviceKey + " not harvested before the " +
                            std::to_string(batchTimeout.count()) + " ms batch deadline");
        }
    }

    Log::Info(kTag, "Harvested " + std::to_string(batch.points.size()) + " of " + std::to_string(admitted.size()) +
                    " device(s), " + std::to_string(batch.totalFailures()) + " failure(s)");
    return batch;
}

} // namespace bacnetinventory::application
