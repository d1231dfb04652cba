#include "mos/ops/rng_extras.hpp"
#include "mos/ops/tensor_utils.hpp"
#include <atomic>
#include <stdexcept>

namespace mos {

namespace {
constexpr uint64_t kDefaultSeed = 88172645463393265ull;

// The first thread to draw gets kDefaultSeed; every later thread starts its own
// stream so masks drawn on fresh threads are not copies of each other.
uint64_t next_thread_seed() {
  static std::atomic<uint64_t> streams{0};
  const uint64_t k = streams.fetch_add(1, std::memory_order_relaxed);
  const uint64_t s = kDefaultSeed ^ (k * 0x9E3779B97F4A7C15ull);
  return s ? s : kDefaultSeed;
}

struct ThreadStream {
  uint64_t seed;
  RNG rng;
  ThreadStream() : seed(next_thread_seed()), rng(seed) {}
};

ThreadStream& stream() {
  static thread_local ThreadStream ts;
  return ts;
}
} // anon

RNG& global_rng() { return stream().rng; }

void set_global_seed(uint64_t seed) {
  if (seed == 0) seed = kDefaultSeed;
  stream().rng = RNG(seed);
  stream().seed = seed;
}

uint64_t get_global_seed() { return stream().seed; }

Variable bernoulli_mask(const std::vector<std::size_t>& shape, double keep, double scale) {
  if (keep < 0.0 || keep > 1.0) throw std::invalid_argument("bernoulli_mask: keep must be in [0,1]");
  auto& rng = global_rng();
  std::vector<double> m(detail::numel(shape));
  for (auto& v : m) v = (rng.next_uniform01() < keep) ? scale : 0.0;
  return Variable(m, shape, /*requires_grad=*/false);
}

} // namespace mos
