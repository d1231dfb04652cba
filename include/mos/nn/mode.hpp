#pragma once

#include <string>

#include "mos/core/errors.hpp"

namespace mos::nn {

// Execution mode passed explicitly to every dropout-capable component.
//   Train          - masks drawn, kept units rescaled by 1/(1-p)
//   Eval           - no masking, inputs pass through
//   EvalMonteCarlo - masks drawn, no rescale (mc_eval)
enum class Mode {
  Train,
  Eval,
  EvalMonteCarlo
};

inline bool masks_active(Mode m) { return m != Mode::Eval; }

// Value a kept unit is multiplied by for drop probability p.
inline double keep_scale(Mode m, double p) {
  return m == Mode::Train ? 1.0 / (1.0 - p) : 1.0;
}

// Throws ConfigurationError unless p is in [0, 1).
inline void check_probability(double p, const char* who) {
  if (!(p >= 0.0 && p < 1.0))
    throw ConfigurationError(std::string(who) + ": dropout probability must be in [0, 1), got " + std::to_string(p));
}

inline const char* to_string(Mode m) {
  switch (m) {
    case Mode::Train: return "train";
    case Mode::Eval: return "eval";
    case Mode::EvalMonteCarlo: return "eval_mc";
  }
  return "unknown";
}

} // namespace mos::nn
