#pragma once
// Fork/join parallel_for over disjoint index ranges. Each chunk writes its own
// slice of the output, so results do not depend on the thread count.
#include <cstddef>
#include <algorithm>
#include <exception>
#include <thread>
#include <utility>
#include <vector>

#include "mos/parallel/config.hpp"

namespace mos { namespace parallel {

template <class Fn>
inline void parallel_for(std::size_t n, std::size_t grain, Fn&& body) {
  using std::size_t;

  const size_t Tcap = get_max_threads();
  const size_t T    = std::max<size_t>(1, std::min(Tcap, n));

  if (T == 1 || n == 0 || serial_override()) {
    body(0, n);
    return;
  }

  const size_t chunks = (grain == 0)
      ? T
      : std::max<size_t>(1, std::min(T, (n + grain - 1) / grain));

  if (chunks == 1) {
    body(0, n);
    return;
  }

  auto k_block = [&](size_t k)->std::pair<size_t,size_t> {
    const size_t q = n / chunks, r = n % chunks;
    const size_t lo = k * q + (k < r ? k : r);
    return {lo, lo + q + (k < r)};
  };

  std::vector<std::exception_ptr> errors(chunks);
  auto run = [&](size_t k) {
    NestedParallelGuard _nested;
    const auto range = k_block(k);
    try {
      if (range.second > range.first) body(range.first, range.second);
    } catch (...) {
      errors[k] = std::current_exception();
    }
  };

  std::vector<std::thread> workers;
  workers.reserve(chunks - 1);
  for (size_t k = 1; k < chunks; ++k) workers.emplace_back(run, k);
  run(0);
  for (auto& w : workers) w.join();

  for (auto& ep : errors) if (ep) std::rethrow_exception(ep);
}

template <class Fn>
inline void parallel_for(std::size_t n, Fn&& body) {
  parallel_for(n, /*grain=*/0, std::forward<Fn>(body));
}

}} // namespace mos::parallel
