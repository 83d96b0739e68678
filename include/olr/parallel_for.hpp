#pragma once

#include <algorithm>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

namespace olr {

/// Splits the range [0, size) into contiguous chunks processed by threads.
///
/// resolve() uses it to dispatch the overlap groups, indexed in emission
/// order, to the resolution workers.
///
/// @param[in] worker Lambda function called in each thread launched. Lambda
/// function must have the following signature:
/// @code
/// void worker(size_t start, size_t stop);
/// @endcode
/// @param[in] size Number of items to process.
/// @param[in] num_threads The number of threads to use for the computation. If
/// 0 all CPUs are used. If 1 is given, the worker is called directly on the
/// calling thread.
/// @param[in] min_size Below this number of items the range is processed
/// sequentially.
/// @tparam Lambda Lambda function
/// @throw The first exception thrown by a worker, once all threads are joined.
template <typename Lambda>
void parallel_for(Lambda worker, size_t size, size_t num_threads,
                  size_t min_size = 1) {
  if (num_threads == 0) {
    num_threads = std::max<size_t>(std::thread::hardware_concurrency(), 1);
  }
  num_threads = std::min(num_threads, std::max<size_t>(size, 1));

  if (num_threads == 1 || size <= min_size) {
    worker(0, size);
    return;
  }

  std::vector<std::thread> threads;
  std::exception_ptr exception = nullptr;
  std::mutex exception_mutex;

  size_t shift = size / num_threads;
  size_t remainder = size % num_threads;

  threads.reserve(num_threads);

  size_t start = 0;
  for (size_t ix = 0; ix < num_threads; ++ix) {
    size_t end = start + shift + (ix < remainder ? 1 : 0);

    threads.emplace_back(
        [worker, start, end, &exception, &exception_mutex]() mutable {
          try {
            worker(start, end);
          } catch (...) {
            // Rethrown on the calling thread after the join.
            std::lock_guard<std::mutex> lock(exception_mutex);
            if (!exception) {
              exception = std::current_exception();
            }
          }
        });

    start = end;
  }

  for (auto &thread : threads) {
    if (thread.joinable()) {
      thread.join();
    }
  }

  if (exception) {
    std::rethrow_exception(exception);
  }
}

}  // namespace olr
