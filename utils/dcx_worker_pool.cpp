#include "dcx_worker_pool.h"
#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

void dcx_parallel_for(size_t count, int max_workers, const std::function<void(size_t)>& work)
{
  if (count == 0) {
    return;
  }
  if (max_workers <= 1 || count == 1) {
    for (size_t i = 0; i < count; ++i) {
      work(i);
    }
    return;
  }

  std::atomic<size_t> next(0);
  std::atomic<bool> failed(false);
  std::exception_ptr first_error;
  std::mutex error_mutex;

  auto worker = [&]() {
    while (!failed) {
      size_t i = next++;
      if (i >= count) {
        return;
      }
      try {
        work(i);
      } catch (...) {
        std::lock_guard<std::mutex> lock(error_mutex);
        if (!first_error) {
          first_error = std::current_exception();
        }
        failed = true;
      }
    }
  };

  size_t thread_count = std::min(count, static_cast<size_t>(max_workers));
  std::vector<std::thread> threads;
  threads.reserve(thread_count);
  for (size_t t = 0; t < thread_count; ++t) {
    threads.emplace_back(worker);
  }
  for (auto& thread : threads) {
    thread.join();
  }

  if (first_error) {
    std::rethrow_exception(first_error);
  }
}
