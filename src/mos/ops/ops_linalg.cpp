// Batched matmul and transpose wired directly to mos::Variable.
//
// Forward:  C = A @ B        where A:[...,M,K], B:[...,K,N] -> C:[...,M,N]
// Backward: dA = dC @ B^T    and  dB = A^T @ dC   (summed over broadcast batches)
//
// Row-major contiguous storage. Work is split over disjoint output rows so the
// result does not depend on the thread count.

#include <algorithm>
#include <cstddef>
#include <stdexcept>
#include <vector>

#include "mos/ops/linalg.hpp"
#include "mos/ops/tensor_utils.hpp"
#include "mos/parallel/parallel_for.hpp"

namespace mos {
using detail::numel;
using detail::strides_for;
using detail::unravel_index;
using detail::ravel_index;

namespace {

struct BatchPlan {
  std::vector<std::size_t> batch;     // broadcast batch shape
  std::vector<std::size_t> a_off;     // per output batch: element offset into A
  std::vector<std::size_t> b_off;     // per output batch: element offset into B
};

// Offset of the (M,K) / (K,N) matrix inside an operand for each output batch.
BatchPlan plan_batches(const std::vector<std::size_t>& ashape,
                       const std::vector<std::size_t>& bshape) {
  std::vector<std::size_t> ab(ashape.begin(), ashape.end() - 2);
  std::vector<std::size_t> bb(bshape.begin(), bshape.end() - 2);
  BatchPlan p;
  p.batch = detail::broadcast_batch(ab, bb);
  const std::size_t nb = numel(p.batch);
  const std::size_t a_mat = ashape[ashape.size()-2] * ashape.back();
  const std::size_t b_mat = bshape[bshape.size()-2] * bshape.back();
  const auto astr = strides_for(ab), bstr = strides_for(bb);
  p.a_off.resize(nb); p.b_off.resize(nb);
  for (std::size_t i = 0; i < nb; ++i) {
    const auto idx = unravel_index(i, p.batch);
    p.a_off[i] = (ab.empty() ? 0 : detail::map_aligned(idx, p.batch, ab, astr)) * a_mat;
    p.b_off[i] = (bb.empty() ? 0 : detail::map_aligned(idx, p.batch, bb, bstr)) * b_mat;
  }
  return p;
}

constexpr std::size_t ROW_GRAIN = 16;

} // anon

Variable matmul(const Variable& A, const Variable& B) {
  const auto& as = A.n->shape;
  const auto& bs = B.n->shape;
  if (as.size() < 2 || bs.size() < 2) throw std::invalid_argument("matmul: operands must be at least 2-D");
  const std::size_t M = as[as.size()-2], K = as.back();
  const std::size_t K2 = bs[bs.size()-2], N = bs.back();
  if (K != K2) throw std::invalid_argument("matmul: inner dimensions differ");

  const BatchPlan plan = plan_batches(as, bs);
  const std::size_t nb = numel(plan.batch);

  auto out = std::make_shared<Node>();
  out->shape = plan.batch;
  out->shape.push_back(M);
  out->shape.push_back(N);
  out->value.assign(nb * M * N, 0.0);
  out->grad.assign(nb * M * N, 0.0);
  out->requires_grad = A.n->requires_grad || B.n->requires_grad;
  out->parents = {A.n, B.n};

  const double* a = A.n->value.data();
  const double* b = B.n->value.data();
  double* c = out->value.data();
  mos::parallel::parallel_for(nb * M, ROW_GRAIN, [&](std::size_t r0, std::size_t r1){
    for (std::size_t r = r0; r < r1; ++r) {
      const std::size_t bi = r / M, i = r % M;
      const double* arow = a + plan.a_off[bi] + i * K;
      const double* bm = b + plan.b_off[bi];
      double* crow = c + (bi * M + i) * N;
      for (std::size_t k = 0; k < K; ++k) {
        const double aik = arow[k];
        const double* brow = bm + k * N;
        for (std::size_t j = 0; j < N; ++j) crow[j] += aik * brow[j];
      }
    }
  });

  std::weak_ptr<Node> ow = out, aw = A.n, bw = B.n;
  out->backward = [ow, aw, bw, plan, nb, M, K, N]() {
    auto o = ow.lock(); auto an = aw.lock(); auto bn = bw.lock();
    if (!o || !an || !bn) return;
    const double* g = o->grad.data();

    if (an->requires_grad) {
      if (an->grad.size() != an->value.size()) an->grad.assign(an->value.size(), 0.0);
      // batches in order (A may be broadcast), rows in parallel
      for (std::size_t bi = 0; bi < nb; ++bi) {
        const double* bm = bn->value.data() + plan.b_off[bi];
        double* ga = an->grad.data() + plan.a_off[bi];
        mos::parallel::parallel_for(M, ROW_GRAIN, [&](std::size_t i0, std::size_t i1){
          for (std::size_t i = i0; i < i1; ++i) {
            const double* grow = g + (bi * M + i) * N;
            for (std::size_t k = 0; k < K; ++k) {
              const double* brow = bm + k * N;
              double s = 0.0;
              for (std::size_t j = 0; j < N; ++j) s += grow[j] * brow[j];
              ga[i * K + k] += s;
            }
          }
        });
      }
    }

    if (bn->requires_grad) {
      if (bn->grad.size() != bn->value.size()) bn->grad.assign(bn->value.size(), 0.0);
      for (std::size_t bi = 0; bi < nb; ++bi) {
        const double* am = an->value.data() + plan.a_off[bi];
        double* gb = bn->grad.data() + plan.b_off[bi];
        mos::parallel::parallel_for(K, ROW_GRAIN, [&](std::size_t k0, std::size_t k1){
          for (std::size_t k = k0; k < k1; ++k) {
            double* gbrow = gb + k * N;
            for (std::size_t i = 0; i < M; ++i) {
              const double aik = am[i * K + k];
              const double* grow = g + (bi * M + i) * N;
              for (std::size_t j = 0; j < N; ++j) gbrow[j] += aik * grow[j];
            }
          }
        });
      }
    }
  };

  return make_from_node(out);
}

Variable transpose(const Variable& X, const std::vector<int>& axes) {
  const auto& xs = X.n->shape;
  const std::size_t R = xs.size();
  if (axes.size() != R) throw std::invalid_argument("transpose: axes rank mismatch");
  std::vector<std::size_t> perm(R);
  std::vector<bool> used(R, false);
  for (std::size_t d = 0; d < R; ++d) {
    int a = axes[d] < 0 ? axes[d] + int(R) : axes[d];
    if (a < 0 || a >= int(R) || used[std::size_t(a)]) throw std::invalid_argument("transpose: invalid permutation");
    used[std::size_t(a)] = true;
    perm[d] = std::size_t(a);
  }

  std::vector<std::size_t> out_shape(R);
  for (std::size_t d = 0; d < R; ++d) out_shape[d] = xs[perm[d]];
  const std::size_t N = numel(xs);

  auto out = std::make_shared<Node>();
  out->shape = out_shape;
  out->value.resize(N);
  out->grad.assign(N, 0.0);
  out->requires_grad = X.n->requires_grad;
  out->parents = {X.n};

  // src[lin_out] for every output element; reused by backward
  std::vector<std::size_t> src(N);
  const auto xstr = strides_for(xs);
  std::vector<std::size_t> xidx(R);
  for (std::size_t lin = 0; lin < N; ++lin) {
    const auto oidx = unravel_index(lin, out_shape);
    for (std::size_t d = 0; d < R; ++d) xidx[perm[d]] = oidx[d];
    src[lin] = ravel_index(xidx, xstr);
    out->value[lin] = X.n->value[src[lin]];
  }

  out->backward = [xw = std::weak_ptr<Node>(X.n), ow = std::weak_ptr<Node>(out), src = std::move(src)]() {
    auto o = ow.lock(); auto x = xw.lock();
    if (!o || !x || !x->requires_grad) return;
    if (x->grad.size() != x->value.size()) x->grad.assign(x->value.size(), 0.0);
    for (std::size_t lin = 0; lin < src.size(); ++lin) x->grad[src[lin]] += o->grad[lin];
  };
  return make_from_node(out);
}

Variable t(const Variable& X) {
  const int R = int(X.n->shape.size());
  if (R < 2) throw std::invalid_argument("t: rank must be >= 2");
  std::vector<int> axes(static_cast<std::size_t>(R));
  for (int d = 0; d < R; ++d) axes[std::size_t(d)] = d;
  std::swap(axes[std::size_t(R-1)], axes[std::size_t(R-2)]);
  return transpose(X, axes);
}

} // namespace mos
