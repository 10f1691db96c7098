#pragma once

#include <cstddef>
#include <functional>

namespace GeneticCars {

// 0 or less means one worker per hardware thread; never more workers than tasks.
int resolveWorkerCount(int requested, size_t taskCount);

/**
 * Runs body(i) for every i in [0, count) across `workerCount` threads, the calling thread
 * included, and returns once all calls have finished.
 *
 * Indices are handed out dynamically, so `body` must only write to state owned by its
 * index. `body` must not throw.
 */
void parallelFor(size_t count, int workerCount, const std::function<void(size_t)>& body);

} // namespace GeneticCars
