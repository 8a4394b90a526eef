#ifndef dcx_WORKER_POOL_H
#define dcx_WORKER_POOL_H

#include <cstddef>
#include <functional>

/*
 * Runs work(i) for every i in [0, count) on up to max_workers threads.
 * Workers pull indices from a shared counter, so each index runs exactly once.
 * All threads are joined before returning; the first exception thrown by a
 * work item is rethrown afterwards and stops further items from starting.
 * max_workers <= 1 runs everything on the calling thread.
 */
void dcx_parallel_for(size_t count, int max_workers, const std::function<void(size_t)>& work);

#endif // dcx_WORKER_POOL_H
