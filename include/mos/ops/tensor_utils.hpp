#pragma once
#include <vector>
#include <cstddef>

namespace mos {

// Per-dimension slice descriptor. is_index==true selects the single index in
// `start` (the dimension is kept with size 1). Otherwise start/stop/step
// describe the half-open range [start, stop); stop <= 0 means "to the end".
struct Slice {
  bool is_index = false;
  long long start = 0;
  long long stop = 0;
  long long step = 1;

  static Slice index(long long i) { Slice s; s.is_index = true; s.start = i; return s; }
  static Slice all() { return Slice{}; }
  static Slice range(long long a, long long b) { Slice s; s.start = a; s.stop = b; return s; }
};

class Variable; // forward

// Gather a strided sub-tensor. Output rank equals input rank.
Variable at(const Variable& X, const std::vector<Slice>& spec);

namespace detail {

// shape helpers
std::size_t numel(const std::vector<std::size_t>& shp);
std::vector<std::size_t> strides_for(const std::vector<std::size_t>& shp);
std::size_t ravel_index(const std::vector<std::size_t>& idx,
                        const std::vector<std::size_t>& strides);
std::vector<std::size_t> unravel_index(std::size_t linear,
                                       const std::vector<std::size_t>& dims);

// broadcasting helpers (NumPy-style, right-aligned; 1 is wildcard)
std::vector<std::size_t> broadcast_two(const std::vector<std::size_t>& A,
                                       const std::vector<std::size_t>& B);
std::vector<std::size_t> broadcast_batch(const std::vector<std::size_t>& a_batch,
                                         const std::vector<std::size_t>& b_batch);

// Flat offset into an operand of shape `ashape` for an index of the broadcast
// output of shape `out_shape`.
std::size_t map_aligned(const std::vector<std::size_t>& out_idx,
                        const std::vector<std::size_t>& out_shape,
                        const std::vector<std::size_t>& ashape,
                        const std::vector<std::size_t>& astrides);

} // namespace detail
} // namespace mos
