#pragma once
#include "mos/core/variables.hpp"
#include <vector>

namespace mos {

// Batched matmul: A:[B..., M, K] @ B:[C..., K, N] -> [broadcast(B...,C...), M, N]
Variable matmul(const Variable& A, const Variable& B);

// General N-D transpose (permute axes). axes is a permutation of [0..rank-1].
Variable transpose(const Variable& X, const std::vector<int>& axes);

// Swap the last two dimensions.
Variable t(const Variable& X);

} // namespace mos
