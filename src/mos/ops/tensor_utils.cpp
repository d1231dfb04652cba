#include "mos/ops/tensor_utils.hpp"
#include "mos/core/variables.hpp"
#include "mos/parallel/parallel_for.hpp"
#include <algorithm>
#include <functional>
#include <numeric>
#include <stdexcept>

namespace mos {
namespace detail {

std::size_t numel(const std::vector<std::size_t>& shp) {
  return std::accumulate(shp.begin(), shp.end(), std::size_t{1}, std::multiplies<>());
}

std::vector<std::size_t> strides_for(const std::vector<std::size_t>& shp) {
  std::vector<std::size_t> st(shp.size(), 1);
  for (int i = int(shp.size()) - 2; i >= 0; --i)
    st[std::size_t(i)] = st[std::size_t(i + 1)] * shp[std::size_t(i + 1)];
  return st;
}

std::size_t ravel_index(const std::vector<std::size_t>& idx,
                        const std::vector<std::size_t>& strides) {
  std::size_t off = 0;
  for (std::size_t d = 0; d < idx.size(); ++d) off += idx[d] * strides[d];
  return off;
}

std::vector<std::size_t> unravel_index(std::size_t linear,
                                       const std::vector<std::size_t>& dims) {
  std::vector<std::size_t> idx(dims.size());
  for (int i = int(dims.size()) - 1; i >= 0; --i) {
    const auto ui = std::size_t(i);
    idx[ui] = dims[ui] ? (linear % dims[ui]) : 0;
    linear /= (dims[ui] ? dims[ui] : 1);
  }
  return idx;
}

std::vector<std::size_t> broadcast_two(const std::vector<std::size_t>& A,
                                       const std::vector<std::size_t>& B) {
  const std::size_t r = std::max(A.size(), B.size());
  std::vector<std::size_t> out(r, 1);
  for (std::size_t i = 0; i < r; ++i) {
    const std::size_t ad = (i < r - A.size()) ? 1 : A[i - (r - A.size())];
    const std::size_t bd = (i < r - B.size()) ? 1 : B[i - (r - B.size())];
    if (ad != bd && ad != 1 && bd != 1)
      throw std::invalid_argument("Incompatible shapes for broadcast");
    out[i] = std::max(ad, bd);
  }
  return out;
}

std::vector<std::size_t> broadcast_batch(const std::vector<std::size_t>& a_batch,
                                         const std::vector<std::size_t>& b_batch) {
  const std::size_t ra = a_batch.size();
  const std::size_t rb = b_batch.size();
  const std::size_t r  = std::max(ra, rb);
  std::vector<std::size_t> out(r, 1);
  for (std::size_t i = 0; i < r; ++i) {
    const std::size_t ad = (i < r - ra) ? 1 : a_batch[i - (r - ra)];
    const std::size_t bd = (i < r - rb) ? 1 : b_batch[i - (r - rb)];
    if (ad != bd && ad != 1 && bd != 1)
      throw std::invalid_argument("Incompatible batch dims for matmul");
    out[i] = std::max(ad, bd);
  }
  return out;
}

std::size_t map_aligned(const std::vector<std::size_t>& out_idx,
                        const std::vector<std::size_t>& out_shape,
                        const std::vector<std::size_t>& ashape,
                        const std::vector<std::size_t>& astrides) {
  const std::size_t r = out_shape.size();
  const std::size_t ra = ashape.size();
  std::size_t off = 0;
  for (std::size_t d = r - ra; d < r; ++d) {
    const std::size_t ai = d - (r - ra);
    const std::size_t coord = (ashape[ai] == 1) ? 0 : out_idx[d];
    off += coord * astrides[ai];
  }
  return off;
}

} // namespace detail

using detail::strides_for;
using detail::unravel_index;
using detail::ravel_index;
using detail::numel;

static std::size_t norm_index(long long i, std::size_t dim) {
  long long ii = i;
  if (ii < 0) ii += (long long)dim;
  if (ii < 0 || (std::size_t)ii >= dim) throw std::out_of_range("slice index out of range");
  return (std::size_t)ii;
}

Variable at(const Variable& X, const std::vector<Slice>& spec) {
  const auto& xs = X.n->shape;
  const std::size_t R = xs.size();
  if (spec.size() != R) throw std::invalid_argument("at(): spec rank mismatch");

  std::vector<std::size_t> out_shape; out_shape.reserve(R);
  std::vector<std::size_t> starts(R), steps(R);
  for (std::size_t d = 0; d < R; ++d) {
    const auto& s = spec[d];
    const std::size_t dim = xs[d];
    std::size_t st = 0, sp = 1, sz = 0;
    if (s.is_index) {
      st = norm_index(s.start, dim);
      sz = 1;
    } else {
      std::size_t a = (std::size_t)std::max(0LL, s.start);
      std::size_t b = (s.stop <= 0) ? dim : (std::size_t)std::min<long long>(s.stop, (long long)dim);
      if (a > b) a = b;
      sp = (std::size_t)(s.step <= 0 ? 1 : s.step);
      sz = (b > a) ? ((b - a + sp - 1) / sp) : 0;
      st = a;
    }
    starts[d] = st; steps[d] = sp;
    out_shape.push_back(sz);
  }

  auto out = std::make_shared<Node>();
  out->shape = out_shape;
  const std::size_t N = numel(out_shape);
  out->value.assign(N, 0.0);
  out->grad.assign(N, 0.0);
  out->requires_grad = X.n->requires_grad;
  out->parents = {X.n};

  const auto Xstr = strides_for(xs);
  const double* Xin = X.n->value.data();
  double* O = out->value.data();
  const std::size_t GRAIN = 1024;
  mos::parallel::parallel_for(N, N < 4096 ? N : GRAIN, [&](std::size_t i0, std::size_t i1){
    std::vector<std::size_t> src_idx(R);
    for (std::size_t lin = i0; lin < i1; ++lin) {
      auto idx = unravel_index(lin, out_shape);
      for (std::size_t d = 0; d < R; ++d) src_idx[d] = starts[d] + idx[d] * steps[d];
      O[lin] = Xin[ravel_index(src_idx, Xstr)];
    }
  });

  std::weak_ptr<Node> ow = out, xw = X.n;
  out->backward = [ow, xw, xs, out_shape, starts, steps]() {
    auto o = ow.lock(); auto x = xw.lock(); if (!o || !x || !x->requires_grad) return;
    if (x->grad.size() != x->value.size()) x->grad.assign(x->value.size(), 0.0);
    const auto Xstr = strides_for(xs);
    // Serial: strided sources never overlap, but keep the scatter simple.
    std::vector<std::size_t> src_idx(xs.size());
    for (std::size_t lin = 0; lin < o->grad.size(); ++lin) {
      auto idx = unravel_index(lin, out_shape);
      for (std::size_t d = 0; d < xs.size(); ++d) src_idx[d] = starts[d] + idx[d] * steps[d];
      x->grad[ravel_index(src_idx, Xstr)] += o->grad[lin];
    }
  };

  return make_from_node(out);
}

} // namespace mos
