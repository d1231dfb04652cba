// ============================
// File: include/mos/nn/layers/locked_dropout.hpp
// ============================
#pragma once

#include "mos/nn/module.hpp"
#include "mos/nn/mode.hpp"

namespace mos::nn {

// Variational ("locked") dropout over x:[T, B, F]. One (1, B, F) mask per call,
// broadcast over the time axis.
struct LockedDropout : Module {
  double p{0.5};

  explicit LockedDropout(double p = 0.5);

  // p == 0 or Mode::Eval returns x itself. Rank != 3 throws ShapeError.
  Variable forward(const Variable& x, Mode mode) const;

  // Same as forward() with an explicit probability.
  static Variable apply(const Variable& x, double p, Mode mode);

protected:
  std::vector<Variable*> _parameters() override { return {}; }
};

} // namespace mos::nn
