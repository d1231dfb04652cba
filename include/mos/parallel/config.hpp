#pragma once
#include <atomic>
#include <cstddef>
#include <cstdlib>
#include <thread>

#include "mos/core/log.hpp"

namespace mos { namespace parallel {

// Worker cap for parallel_for. Starts at MOS_THREADS when that is a positive
// integer, otherwise at the hardware concurrency (4 if unknown).
inline std::size_t threads_from_env() {
  const unsigned hw = std::thread::hardware_concurrency();
  const std::size_t fallback = hw ? hw : 4;
  const char* env = std::getenv("MOS_THREADS");
  if (!env || !*env) return fallback;
  char* end = nullptr;
  const unsigned long v = std::strtoul(env, &end, 10);
  if (*end != '\0') {
    MOS_LOG_WARN("MOS_THREADS='%s' is not a number; using %zu threads", env, fallback);
    return fallback;
  }
  return v == 0 ? 1 : std::size_t(v);
}

inline std::atomic<std::size_t>& threads_cap_() {
  static std::atomic<std::size_t> cap{threads_from_env()};
  return cap;
}
inline void set_max_threads(std::size_t n) {
  if (n == 0) n = 1;
  threads_cap_().store(n, std::memory_order_relaxed);
}
inline std::size_t get_max_threads() {
  return threads_cap_().load(std::memory_order_relaxed);
}

// ---------- ScopedSerial (TLS depth) ----------
struct ScopedSerial {
  ScopedSerial(){ ++depth_ref(); }
  ~ScopedSerial(){ --depth_ref(); }
  ScopedSerial(const ScopedSerial&) = delete;
  ScopedSerial& operator=(const ScopedSerial&) = delete;
  static int depth(){ return depth_ref(); }
private:
  static int& depth_ref(){ static thread_local int d = 0; return d; }
};

// ---------- Nested guard: inner parallel_for runs serial ----------
inline bool& nesting_flag() { static thread_local bool f = false; return f; }
struct NestedParallelGuard {
  NestedParallelGuard(){ nesting_flag() = true; }
  ~NestedParallelGuard(){ nesting_flag() = false; }
  NestedParallelGuard(const NestedParallelGuard&) = delete;
  NestedParallelGuard& operator=(const NestedParallelGuard&) = delete;
};

inline bool serial_override() {
  return ScopedSerial::depth() > 0 || nesting_flag() || get_max_threads() <= 1;
}

}} // namespace mos::parallel
