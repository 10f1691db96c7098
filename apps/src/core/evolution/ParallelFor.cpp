#include "ParallelFor.h"

#include <algorithm>
#include <atomic>
#include <thread>
#include <vector>

namespace GeneticCars {

int resolveWorkerCount(int requested, size_t taskCount)
{
    int resolved = requested;
    if (resolved <= 0) {
        const unsigned int cores = std::thread::hardware_concurrency();
        resolved = cores > 0 ? static_cast<int>(cores) : 1;
    }

    if (taskCount > 0 && static_cast<size_t>(resolved) > taskCount) {
        resolved = static_cast<int>(taskCount);
    }
    return std::max(resolved, 1);
}

void parallelFor(size_t count, int workerCount, const std::function<void(size_t)>& body)
{
    if (count == 0) {
        return;
    }

    const int threads = resolveWorkerCount(workerCount, count);
    if (threads <= 1) {
        for (size_t i = 0; i < count; ++i) {
            body(i);
        }
        return;
    }

    std::atomic<size_t> next{ 0 };
    auto drain = [&]() {
        while (true) {
            const size_t index = next.fetch_add(1);
            if (index >= count) {
                return;
            }
            body(index);
        }
    };

    std::vector<std::thread> workers;
    workers.reserve(static_cast<size_t>(threads - 1));
    for (int i = 1; i < threads; ++i) {
        workers.emplace_back(drain);
    }

    drain();

    for (auto& worker : workers) {
        worker.join();
    }
}

} // namespace GeneticCars
