// ============================
// File: src/mos/nn/layers/locked_dropout.cpp
// ============================
#include "mos/nn/layers/locked_dropout.hpp"
#include "mos/core/errors.hpp"
#include "mos/ops/elementwise.hpp"
#include "mos/ops/rng_extras.hpp"

namespace mos::nn {

LockedDropout::LockedDropout(double p_) : p(p_) {
  check_probability(p, "LockedDropout");
}

Variable LockedDropout::forward(const Variable& x, Mode mode) const {
  return apply(x, p, mode);
}

Variable LockedDropout::apply(const Variable& x, double p, Mode mode) {
  const auto& s = x.shape();
  if (s.size() != 3) throw ShapeError("LockedDropout expects x shape [T,B,F]");
  check_probability(p, "LockedDropout");
  if (p == 0.0 || !masks_active(mode)) return x;

  auto mask = mos::bernoulli_mask({1, s[1], s[2]}, 1.0 - p, keep_scale(mode, p));
  return mos::mul(x, mask);
}

} // namespace mos::nn
