#pragma once

#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <optional>
#include <stop_token>
#include <thread>
#include <vector>

// Runs fn(i) for every i in [0, count) on at most `limit` worker threads.
// Each worker checks the stop token before taking the next index, so a stop
// request leaves the remaining indices untouched. The first exception thrown
// by fn stops the other workers and is rethrown to the caller once all of
// them have joined.
template <typename Fn>
void for_each_bounded(size_t count, unsigned limit,
                      std::optional<std::stop_token> stoken, Fn&& fn) {
  if (count == 0) return;
  const size_t worker_count =
      std::min<size_t>(count, std::max<unsigned>(limit, 1));

  std::atomic<size_t> next = 0;
  std::stop_source failure;
  std::exception_ptr first_error;
  std::mutex error_mutex;

  auto stopped = [&] {
    return failure.stop_requested() || (stoken && stoken->stop_requested());
  };

  auto worker = [&] {
    while (!stopped()) {
      const size_t i = next.fetch_add(1);
      if (i >= count) return;
      try {
        fn(i);
      } catch (...) {
        std::scoped_lock lock(error_mutex);
        if (!first_error) first_error = std::current_exception();
        failure.request_stop();
        return;
      }
    }
  };

  if (worker_count == 1) {
    worker();
  } else {
    std::vector<std::jthread> workers;
    workers.reserve(worker_count);
    for (size_t w = 0; w < worker_count; ++w) workers.emplace_back(worker);
  }

  if (first_error) std::rethrow_exception(first_error);
}
