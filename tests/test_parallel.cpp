#include "test_framework.hpp"
#include "mos/parallel/parallel_for.hpp"
#include "mos/parallel/config.hpp"
#include "mos/core/log.hpp"

#include <vector>
#include <atomic>
#include <cstdlib>
#include <string>
#include <stdexcept>
#include <thread>

using mos::parallel::parallel_for;
using mos::parallel::set_max_threads;
using mos::parallel::get_max_threads;
using mos::parallel::ScopedSerial;

namespace {

// Restores the thread cap on scope exit.
struct ThreadCap {
  std::size_t saved;
  explicit ThreadCap(std::size_t n) : saved(get_max_threads()) { set_max_threads(n); }
  ~ThreadCap() { set_max_threads(saved); }
};

bool all_marked_once(const std::vector<int>& marks) {
  for (size_t i = 0; i < marks.size(); ++i)
    if (marks[i] != 1) return false;
  return true;
}

} // namespace

TEST("parallel/basic_cover_no_overlap") {
  ThreadCap cap(8);
  const std::size_t n = 10000;
  std::vector<int> marks(n, 0);
  parallel_for(n, /*grain=*/128, [&](std::size_t i0, std::size_t i1){
    for (std::size_t i = i0; i < i1; ++i) marks[i] += 1;
  });
  ASSERT_TRUE(all_marked_once(marks));
}

TEST("parallel/single_chunk_when_grain_covers_range") {
  ThreadCap cap(8);
  const std::size_t n = 100;
  std::size_t calls = 0, got0 = 999, got1 = 999;
  parallel_for(n, /*grain=*/1000, [&](std::size_t i0, std::size_t i1){
    ++calls; got0 = i0; got1 = i1;
  });
  ASSERT_TRUE(calls == 1);
  ASSERT_TRUE(got0 == 0 && got1 == n);
}

TEST("parallel/chunks_capped_by_max_threads") {
  ThreadCap cap(3);
  std::atomic<std::size_t> chunks{0};
  parallel_for(1000, /*grain=*/100, [&](std::size_t, std::size_t){ ++chunks; });
  // ceil(1000/100) = 10 chunks wanted, 3 threads allowed
  ASSERT_TRUE(chunks.load() == 3);
}

TEST("parallel/nested_call_runs_inline") {
  ThreadCap cap(4);
  const std::size_t n = 4096;
  std::vector<int> marks(n, 0);
  std::atomic<int> inner_multi{0};
  parallel_for(n, /*grain=*/256, [&](std::size_t i0, std::size_t i1){
    int inner_calls = 0;
    parallel_for(i1 - i0, /*grain=*/64, [&](std::size_t j0, std::size_t j1){
      ++inner_calls;
      for (std::size_t j = j0; j < j1; ++j) marks[i0 + j] += 1;
    });
    if (inner_calls != 1) ++inner_multi;
  });
  ASSERT_TRUE(all_marked_once(marks));
  ASSERT_TRUE(inner_multi.load() == 0);
}

TEST("parallel/scoped_serial_forces_one_chunk") {
  ThreadCap cap(8);
  ScopedSerial serial;
  std::size_t calls = 0;
  parallel_for(100000, /*grain=*/16, [&](std::size_t i0, std::size_t i1){
    ++calls;
    ASSERT_TRUE(i0 == 0 && i1 == 100000);
  });
  ASSERT_TRUE(calls == 1);
}

TEST("parallel/worker_exception_is_rethrown") {
  ThreadCap cap(4);
  ASSERT_THROWS(parallel_for(4000, /*grain=*/100, [&](std::size_t i0, std::size_t i1){
    for (std::size_t i = i0; i < i1; ++i)
      if (i == 3999) throw std::runtime_error("boom");
  }), std::runtime_error);
}

TEST("parallel/threads_from_env_parses_and_falls_back") {
  const char* prev = std::getenv("MOS_THREADS");
  const std::string saved = prev ? prev : "";
  const auto level = mos::log::level();
  mos::log::set_level(mos::log::Level::Error);  // keep the warning off the test output

  const unsigned hw = std::thread::hardware_concurrency();
  const std::size_t fallback = hw ? hw : 4;

  setenv("MOS_THREADS", "3", 1);
  ASSERT_TRUE(mos::parallel::threads_from_env() == 3);
  setenv("MOS_THREADS", "0", 1);
  ASSERT_TRUE(mos::parallel::threads_from_env() == 1);
  setenv("MOS_THREADS", "four", 1);
  ASSERT_TRUE(mos::parallel::threads_from_env() == fallback);
  ASSERT_TRUE(mos::log::level() == mos::log::Level::Error);

  mos::log::set_level(level);
  if (prev) setenv("MOS_THREADS", saved.c_str(), 1);
  else unsetenv("MOS_THREADS");
}
