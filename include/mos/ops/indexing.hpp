#pragma once
#include "mos/core/variables.hpp"
#include <cstddef>
#include <vector>

namespace mos {

// Row gather: W:[V, D], ids (flat) -> [prefix..., D] where prod(prefix) == ids.size().
// Backward scatters (accumulates) into the selected rows of W.
Variable embedding_lookup(const Variable& W,
                          const std::vector<std::size_t>& ids,
                          const std::vector<std::size_t>& prefix_shape);

} // namespace mos
