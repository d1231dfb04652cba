#pragma once
#include "mos/core/rng.hpp"
#include "mos/core/variables.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace mos {

// Thread-local global RNG accessor and seed control. Each thread starts on its
// own stream; set_global_seed reseeds the calling thread only.
RNG& global_rng();
void set_global_seed(uint64_t seed);
uint64_t get_global_seed();

// No-grad Bernoulli mask drawn from the global RNG: each element is `scale`
// with probability `keep` and 0 otherwise.
Variable bernoulli_mask(const std::vector<std::size_t>& shape, double keep, double scale = 1.0);

} // namespace mos
