#pragma once
#include "mos/core/variables.hpp"
#include "mos/ops/rng_extras.hpp"

namespace mos::nn::init {

// In-place U(lo, hi) from the global RNG. Writes through the handle, so tied
// Variables see the new values.
inline void uniform_(Variable& v, double lo, double hi) {
  auto& rng = mos::global_rng();
  for (auto& x : v.mutable_value()) x = rng.next_uniform(lo, hi);
}

inline void zeros_(Variable& v) {
  for (auto& x : v.mutable_value()) x = 0.0;
}

} // namespace mos::nn::init
