#pragma once
#include "mos/core/variables.hpp"

namespace mos {

// Elementwise activations (same shape as input)
Variable sigmoid(const Variable& x);
Variable tanhv(const Variable& x);   // named tanhv to avoid clash with std::tanh
Variable logv(const Variable& x);

} // namespace mos
