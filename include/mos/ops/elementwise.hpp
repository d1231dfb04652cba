#pragma once
#include "mos/core/variables.hpp"

namespace mos {

// Elementwise (broadcasting)
Variable add(const Variable& a, const Variable& b);
Variable sub(const Variable& a, const Variable& b);
Variable mul(const Variable& a, const Variable& b);
Variable div(const Variable& a, const Variable& b);
Variable neg(const Variable& x);
// exp variant in this codebase is named with 'v' suffix
Variable expv(const Variable& x);

// Constant (no-grad) tensor of shape [1]; broadcasts against anything.
Variable scalar(double v);

} // namespace mos
