/**
 * @file AsyncTaskManager.hpp
 * @brief Background task execution behind a fixed-size admission gate.
 */

#pragma once

#include <string>
#include <functional>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <memory>
#include <algorithm>

namespace bacnetinventory::application {

/**
 * @enum TaskType
 * @brief Categories of background work.
 */
enum class TaskType {
    Discovery,
    Harvest
};

/**
 * @struct TaskStatus
 * @brief Information about a running or completed task.
 */
struct TaskStatus {
    int id;
    TaskType type;
    std::string description;
    std::atomic<bool> isCompleted{false};
    std::atomic<bool> failed{false};
    std::string errorMessage;
};

/**
 * @class AsyncTaskManager
 * @brief Runs tasks on their own threads, never more than maxConcurrent at once.
 *
 * SubmitTask blocks the caller until a slot is free. Exceptions escaping a task
 * are recorded in its TaskStatus and never reach the submitting thread.
 */
class AsyncTaskManager {
public:
    explicit AsyncTaskManager(int maxConcurrent = 10)
        : m_maxConcurrent(std::max(1, maxConcurrent)) {}

    ~AsyncTaskManager() {
        WaitAll();
    }

    AsyncTaskManager(const AsyncTaskManager&) = delete;
    AsyncTaskManager& operator=(const AsyncTaskManager&) = delete;

    /** @brief Waits for a free slot, then runs the task in the background. */
    template<typename F, typename... Args>
    std::shared_ptr<TaskStatus> SubmitTask(TaskType type, const std::string& description, F&& f, Args&&... args) {
        auto status = std::make_shared<TaskStatus>();
        status->id = m_nextId++;
        status->type = type;
        status->description = description;

        {
            std::unique_lock<std::mutex> lock(m_gateMutex);
            m_gateCv.wait(lock, [this] { return m_running < m_maxConcurrent; });
            ++m_running;
        }

        std::thread([this, status](auto userFunc, auto... userArgs) {
            try {
                userFunc(status, std::move(userArgs)...);
            } catch (const std::exception& e) {
                status->failed = true;
                status->errorMessage = e.what();
            } catch (...) {
                status->failed = true;
                status->errorMessage = "Unknown error during task execution.";
            }
            status->isCompleted = true;
            Release();
        }, std::forward<F>(f), std::forward<Args>(args)...).detach();

        return status;
    }

    /** @brief Blocks until every submitted task has finished. */
    void WaitAll() {
        std::unique_lock<std::mutex> lock(m_gateMutex);
        m_gateCv.wait(lock, [this] { return m_running == 0; });
    }

    int GetMaxConcurrent() const { return m_maxConcurrent; }

private:
    // Notifies under the lock: a waiter in the destructor must not run before we are done with m_gateCv.
    void Release() {
        std::lock_guard<std::mutex> lock(m_gateMutex);
        --m_running;
        m_gateCv.notify_all();
    }

    const int m_maxConcurrent;
    int m_running = 0;
    std::mutex m_gateMutex;
    std::condition_variable m_gateCv;

    std::atomic<int> m_nextId{0};
};

} // namespace bacnetinventory::application
