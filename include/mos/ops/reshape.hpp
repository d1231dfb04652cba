#pragma once
#include "mos/core/variables.hpp"
#include <cstddef>
#include <vector>


namespace mos {

// Flatten starting at start_dim into a 2D [prefix, suffix].
Variable flatten(const Variable& x, std::size_t start_dim = 1);

Variable reshape(const Variable& X, const std::vector<std::size_t>& new_shape);

// Join tensors along `axis`; all other dimensions must agree.
Variable concat(const std::vector<Variable>& xs, std::size_t axis = 0);

} // namespace mos
