#pragma once
#include "mos/core/variables.hpp"
#include <vector>

namespace mos {

// LogSumExp over axes (numerically stable via max-shift).
Variable logsumexp(const Variable& x,
                   const std::vector<int>& axes = {},
                   bool keepdims = false);

// Softmax along a single axis (default last axis). Returns same shape as x.
Variable softmax(const Variable& x, int axis = -1);

} // namespace mos
