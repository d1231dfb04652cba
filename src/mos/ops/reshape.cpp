#include "mos/ops/reshape.hpp"
#include "mos/ops/tensor_utils.hpp"
#include "mos/parallel/parallel_for.hpp"
#include <stdexcept>

namespace mos {
using detail::numel;

// Copy-based view: same flat layout, new shape; gradient passes straight through.
static Variable reshape_copy(const Variable& X, std::vector<std::size_t> new_shape) {
  auto out = std::make_shared<Node>();
  out->shape = std::move(new_shape);

  const std::size_t N = X.n->value.size();
  out->value.resize(N);

  const std::size_t COPY_SERIAL_CUTOFF = 4096;
  const std::size_t COPY_GRAIN = 1024;
  const double* xin = X.n->value.data();
  double* outp = out->value.data();
  mos::parallel::parallel_for(N, N < COPY_SERIAL_CUTOFF ? N : COPY_GRAIN, [&](std::size_t i0, std::size_t i1){
    for (std::size_t i = i0; i < i1; ++i) outp[i] = xin[i];
  });

  out->grad.assign(N, 0.0);
  out->requires_grad = X.n->requires_grad;
  out->parents = {X.n};

  out->backward = [Xn = std::weak_ptr<Node>(X.n), oweak = std::weak_ptr<Node>(out)]() {
    auto o = oweak.lock(); auto x = Xn.lock();
    if (!o || !x || !x->requires_grad) return;
    if (x->grad.size() != x->value.size()) x->grad.assign(x->value.size(), 0.0);
    for (std::size_t i = 0; i < o->grad.size(); ++i) x->grad[i] += o->grad[i];
  };
  return make_from_node(out);
}

Variable flatten(const Variable& X, std::size_t start_dim) {
  const auto& shp = X.n->shape;
  const std::size_t rank = shp.size();
  if (start_dim >= rank) return X; // no-op

  std::size_t prefix = 1;
  for (std::size_t i = 0; i < start_dim; ++i) prefix *= shp[i];
  std::size_t suffix = 1;
  for (std::size_t i = start_dim; i < rank; ++i) suffix *= shp[i];
  return reshape_copy(X, {prefix, suffix});
}

Variable reshape(const Variable& X, const std::vector<std::size_t>& new_shape) {
  if (numel(X.n->shape) != numel(new_shape)) {
    throw std::runtime_error("reshape: number of elements must remain constant");
  }
  if (new_shape == X.n->shape) return X;
  return reshape_copy(X, new_shape);
}

Variable concat(const std::vector<Variable>& xs, std::size_t axis) {
  if (xs.empty()) throw std::invalid_argument("concat: no inputs");
  const auto& s0 = xs.front().n->shape;
  if (axis >= s0.size()) throw std::invalid_argument("concat: axis out of range");

  // outer = prod(shape[:axis]), inner = prod(shape[axis+1:])
  std::size_t outer = 1, inner = 1;
  for (std::size_t d = 0; d < axis; ++d) outer *= s0[d];
  for (std::size_t d = axis + 1; d < s0.size(); ++d) inner *= s0[d];

  std::vector<std::size_t> extents; extents.reserve(xs.size());
  std::size_t total = 0;
  bool rg = false;
  for (const auto& x : xs) {
    const auto& s = x.n->shape;
    if (s.size() != s0.size()) throw std::invalid_argument("concat: rank mismatch");
    for (std::size_t d = 0; d < s.size(); ++d)
      if (d != axis && s[d] != s0[d]) throw std::invalid_argument("concat: shape mismatch off the concat axis");
    extents.push_back(s[axis]);
    total += s[axis];
    rg = rg || x.n->requires_grad;
  }

  auto out = std::make_shared<Node>();
  out->shape = s0;
  out->shape[axis] = total;
  const std::size_t N = numel(out->shape);
  out->value.resize(N);
  out->grad.assign(N, 0.0);
  out->requires_grad = rg;
  for (const auto& x : xs) out->parents.push_back(x.n);

  // block copy: for each outer index the inputs lay out back to back
  std::size_t col = 0;
  for (std::size_t k = 0; k < xs.size(); ++k) {
    const std::size_t w = extents[k] * inner;
    const double* src = xs[k].n->value.data();
    for (std::size_t o = 0; o < outer; ++o) {
      double* dst = out->value.data() + o * total * inner + col;
      for (std::size_t i = 0; i < w; ++i) dst[i] = src[o * w + i];
    }
    col += w;
  }

  std::weak_ptr<Node> ow = out;
  out->backward = [ow, extents, outer, inner, total]() {
    auto o = ow.lock(); if (!o) return;
    std::size_t col = 0;
    for (std::size_t k = 0; k < o->parents.size(); ++k) {
      const std::size_t w = extents[k] * inner;
      auto& p = o->parents[k];
      if (p && p->requires_grad) {
        if (p->grad.size() != p->value.size()) p->grad.assign(p->value.size(), 0.0);
        for (std::size_t r = 0; r < outer; ++r) {
          const double* g = o->grad.data() + r * total * inner + col;
          for (std::size_t i = 0; i < w; ++i) p->grad[r * w + i] += g[i];
        }
      }
      col += w;
    }
  };
  return make_from_node(out);
}

} // namespace mos
