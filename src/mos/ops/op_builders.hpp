#pragma once
// Internal builders for elementwise autograd nodes. Not part of the public API.
#include "mos/core/variables.hpp"
#include "mos/ops/tensor_utils.hpp"
#include "mos/parallel/parallel_for.hpp"
#include <memory>

namespace mos { namespace detail {

// Parallelization params for elementwise ops
inline constexpr std::size_t ELEM_SERIAL_CUTOFF = 4096;
inline constexpr std::size_t ELEM_GRAIN = 1024;

inline std::size_t grain_for(std::size_t n) {
  return n < ELEM_SERIAL_CUTOFF ? n : ELEM_GRAIN;
}

// Shared forward/backward for broadcasting binary ops.
//   f(a, b)         -> output value
//   da(a, b, y, g)  -> contribution to dL/da
//   db(a, b, y, g)  -> contribution to dL/db
template <class F, class DA, class DB>
Variable binary_op(const Variable& A, const Variable& B, F f, DA da, DB db) {
  const auto out_shape = broadcast_two(A.n->shape, B.n->shape);
  const std::size_t oN = numel(out_shape);

  auto out = std::make_shared<Node>();
  out->shape = out_shape;
  out->value.assign(oN, 0.0);
  out->grad.assign(oN, 0.0);
  out->requires_grad = (A.n->requires_grad || B.n->requires_grad);
  out->parents = {A.n, B.n};

  const auto As = strides_for(A.n->shape), Bs = strides_for(B.n->shape);
  const bool same = (A.n->shape == out_shape) && (B.n->shape == out_shape);

  const double* aval = A.n->value.data();
  const double* bval = B.n->value.data();
  double* outp = out->value.data();
  const auto& ashape = A.n->shape;
  const auto& bshape = B.n->shape;
  mos::parallel::parallel_for(oN, grain_for(oN), [&](std::size_t l0, std::size_t l1){
    for (std::size_t lin = l0; lin < l1; ++lin) {
      if (same) { outp[lin] = f(aval[lin], bval[lin]); continue; }
      const auto idx = unravel_index(lin, out_shape);
      outp[lin] = f(aval[map_aligned(idx, out_shape, ashape, As)],
                    bval[map_aligned(idx, out_shape, bshape, Bs)]);
    }
  });

  std::weak_ptr<Node> ow = out, aw = A.n, bw = B.n;
  out->backward = [ow, aw, bw, out_shape, As, Bs, da, db]() {
    auto o = ow.lock(); if (!o) return;
    auto a = aw.lock(); auto b = bw.lock();
    if (!a || !b) return;
    const bool need_a = a->requires_grad, need_b = b->requires_grad;
    if (!need_a && !need_b) return;
    if (need_a && a->grad.size() != a->value.size()) a->grad.assign(a->value.size(), 0.0);
    if (need_b && b->grad.size() != b->value.size()) b->grad.assign(b->value.size(), 0.0);

    // Broadcast inputs may receive from several output positions; accumulate serially.
    for (std::size_t lin = 0; lin < o->value.size(); ++lin) {
      const auto idx = unravel_index(lin, out_shape);
      const std::size_t ai = map_aligned(idx, out_shape, a->shape, As);
      const std::size_t bi = map_aligned(idx, out_shape, b->shape, Bs);
      const double g = o->grad[lin];
      if (need_a) a->grad[ai] += da(a->value[ai], b->value[bi], o->value[lin], g);
      if (need_b) b->grad[bi] += db(a->value[ai], b->value[bi], o->value[lin], g);
    }
  };

  return make_from_node(out);
}

// Shared forward/backward for same-shape unary ops.
//   f(x)           -> output value
//   dx(x, y, g)    -> contribution to dL/dx
template <class F, class DX>
Variable unary_op(const Variable& X, F f, DX dx) {
  auto out = std::make_shared<Node>();
  out->shape = X.n->shape;
  const std::size_t N = numel(out->shape);
  out->value.resize(N);
  out->grad.assign(N, 0.0);
  out->requires_grad = X.n->requires_grad;
  out->parents = {X.n};

  const double* xin = X.n->value.data();
  double* outp = out->value.data();
  mos::parallel::parallel_for(N, grain_for(N), [&](std::size_t i0, std::size_t i1){
    for (std::size_t i = i0; i < i1; ++i) outp[i] = f(xin[i]);
  });

  out->backward = [Xn = std::weak_ptr<Node>(X.n), oweak = std::weak_ptr<Node>(out), dx]() {
    auto o = oweak.lock(); auto x = Xn.lock();
    if (!o || !x || !x->requires_grad) return;
    if (x->grad.size() != x->value.size()) x->grad.assign(x->value.size(), 0.0);
    const std::size_t N = o->value.size();
    const double* xv = x->value.data();
    const double* yv = o->value.data();
    const double* g_in = o->grad.data();
    double* g_out = x->grad.data();
    mos::parallel::parallel_for(N, grain_for(N), [&](std::size_t i0, std::size_t i1){
      for (std::size_t i = i0; i < i1; ++i) g_out[i] += dx(xv[i], yv[i], g_in[i]);
    });
  };
  return make_from_node(out);
}

}} // namespace mos::detail
