#pragma once

// warden/worker_pool.hpp - Bounded fan-out over an indexed job list.
//
// Workers pull job indices from one atomic counter until the list is
// exhausted. The callable receives the job index and must write only to the
// slot it owns; callers re-sort collected results afterwards, so scheduling
// order never reaches the output.
//
// INVARIANT: with workers <= 1 the jobs run inline on the calling thread, in
// index order. Tests rely on this for reproducible issue ordering.

#include <atomic>
#include <cstddef>
#include <thread>
#include <vector>

namespace warden {

template <typename Fn>
void parallel_for(std::size_t jobs, std::size_t workers, Fn&& fn) {
  if (jobs == 0) return;
  if (workers <= 1 || jobs == 1) {
    for (std::size_t i = 0; i < jobs; ++i) fn(i);
    return;
  }
  std::atomic<std::size_t> next_job{0};
  std::vector<std::thread> pool;
  pool.reserve(workers);
  for (std::size_t w = 0; w < workers; ++w) {
    pool.emplace_back([&]() {
      for (;;) {
        const std::size_t idx = next_job.fetch_add(1);
        if (idx >= jobs) break;
        fn(idx);
      }
    });
  }
  for (auto& t : pool) t.join();
}

}  // namespace warden
