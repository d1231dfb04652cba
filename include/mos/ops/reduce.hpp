#pragma once
#include "mos/core/variables.hpp"
#include <vector>
#include <cstddef>

namespace mos {

// Sum over 'axes'. If axes is empty, reduce all dims. If keepdims=true, reduced
// axes are kept with size 1.
Variable reduce_sum(const Variable& x,
                    const std::vector<int>& axes = {},
                    bool keepdims = false);

// Max over 'axes' (NumPy-style). Ties share the gradient equally.
Variable reduce_max(const Variable& x,
                    const std::vector<int>& axes = {},
                    bool keepdims = false);

} // namespace mos
