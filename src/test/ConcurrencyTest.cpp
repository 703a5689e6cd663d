#include <iostream>
#include <thread>
#include <vector>
#include <chrono>
#include <atomic>
#include <stdexcept>
#undef NDEBUG
#include <cassert>
#include "application/AsyncTaskManager.hpp"

using bacnetinventory::application::AsyncTaskManager;
using bacnetinventory::application::TaskStatus;
using bacnetinventory::application::TaskType;

int main() {
    std::cout << "[Test] Starting Concurrency Stress Test..." << std::endl;

    const int NUM_TASKS = 60;
    const int LIMIT = 8;

    std::atomic<int> running{0};
    std::atomic<int> peak{0};
    std::atomic<int> completed{0};
    std::vector<std::shared_ptr<TaskStatus>> statuses;

    {
        AsyncTaskManager gate(LIMIT);
        assert(gate.GetMaxConcurrent() == LIMIT);

        std::cout << "[Test] Submitting " << NUM_TASKS << " tasks through a gate of " << LIMIT << "..." << std::endl;
        for (int i = 0; i < NUM_TASKS; ++i) {
            statuses.push_back(gate.SubmitTask(TaskType::Harvest, "Task " + std::to_string(i),
                [i, &running, &peak, &completed](std::shared_ptr<TaskStatus> status) {
                    int now = ++running;
                    int seen = peak.load();
                    while (now > seen && !peak.compare_exchange_weak(seen, now)) {}

                    std::this_thread::sleep_for(std::chrono::milliseconds(5));
                    assert(!status->isCompleted.load());
                    --running;

                    if (i % 10 == 9) {
                        throw std::runtime_error("device " + std::to_string(i) + " unreachable");
                    }
                    ++completed;
                }));
        }
        gate.WaitAll();
    }

    std::cout << "[Test] Peak concurrency: " << peak.load() << std::endl;
    assert(peak.load() >= 1 && peak.load() <= LIMIT);
    assert(completed.load() == NUM_TASKS - NUM_TASKS / 10);

    int failed = 0;
    for (const auto& status : statuses) {
        assert(status->isCompleted.load());
        if (status->failed.load()) {
            ++failed;
            assert(status->errorMessage.find("unreachable") != std::string::npos);
        } else {
            assert(status->errorMessage.empty());
        }
    }
    assert(failed == NUM_TASKS / 10);

    // A gate of zero still admits one task at a time.
    AsyncTaskManager serial(0);
    assert(serial.GetMaxConcurrent() == 1);

    std::cout << "[PASS] Concurrency gate holds." << std::endl;
    return 0;
}
