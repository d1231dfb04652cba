#include "mos/ops/reduce.hpp"
#include "mos/ops/tensor_utils.hpp"
#include <algorithm>
#include <limits>
#include <numeric>
#include <stdexcept>

namespace mos {
using detail::numel;
using detail::strides_for;
using detail::unravel_index;
using detail::ravel_index;

static std::vector<std::size_t> normalize_axes(const std::vector<int>& axes_in,
                                               std::size_t rank) {
  std::vector<std::size_t> axes;
  if (axes_in.empty()) {
    axes.resize(rank);
    std::iota(axes.begin(), axes.end(), std::size_t{0});
    return axes;
  }
  axes.reserve(axes_in.size());
  for (int ax : axes_in) {
    long a = ax;
    if (a < 0) a += long(rank);
    if (a < 0 || a >= long(rank))
      throw std::invalid_argument("reduce: axis out of range");
    axes.push_back(std::size_t(a));
  }
  std::sort(axes.begin(), axes.end());
  axes.erase(std::unique(axes.begin(), axes.end()), axes.end());
  return axes;
}

static std::vector<std::size_t>
reduced_shape(const std::vector<std::size_t>& in_shape,
              const std::vector<std::size_t>& axes,
              bool keepdims) {
  if (keepdims) {
    std::vector<std::size_t> s = in_shape;
    for (auto a : axes) s[a] = 1;
    return s;
  }
  std::vector<std::size_t> s;
  std::size_t j = 0;
  for (std::size_t i = 0; i < in_shape.size(); ++i) {
    if (j < axes.size() && axes[j] == i) { ++j; continue; }
    s.push_back(in_shape[i]);
  }
  if (s.empty()) s = {1}; // represent scalar as [1]
  return s;
}

// For every input element, the flat index of the output element it reduces into.
static std::vector<std::size_t>
reduction_map(const std::vector<std::size_t>& in_shape,
              const std::vector<std::size_t>& axes) {
  std::vector<std::size_t> keep_shape = in_shape;
  for (auto a : axes) keep_shape[a] = 1;
  const auto kstr = strides_for(keep_shape);
  const std::size_t N = numel(in_shape);
  std::vector<std::size_t> map(N);
  for (std::size_t lin = 0; lin < N; ++lin) {
    auto idx = unravel_index(lin, in_shape);
    for (auto a : axes) idx[a] = 0;
    map[lin] = ravel_index(idx, kstr);
  }
  return map;
}

Variable reduce_sum(const Variable& X, const std::vector<int>& axes_in, bool keepdims) {
  const auto& shp = X.n->shape;
  const auto axes = normalize_axes(axes_in, shp.size());
  const auto out_shape = reduced_shape(shp, axes, keepdims);
  const std::size_t outN = numel(out_shape);

  auto out = std::make_shared<Node>();
  out->shape = out_shape;
  out->value.assign(outN, 0.0);
  out->grad.assign(outN, 0.0);
  out->requires_grad = X.n->requires_grad;
  out->parents = {X.n};

  auto map = reduction_map(shp, axes);
  for (std::size_t lin = 0; lin < map.size(); ++lin) out->value[map[lin]] += X.n->value[lin];

  out->backward = [xw = std::weak_ptr<Node>(X.n), ow = std::weak_ptr<Node>(out), map = std::move(map)]() {
    auto o = ow.lock(); auto x = xw.lock();
    if (!o || !x || !x->requires_grad) return;
    if (x->grad.size() != x->value.size()) x->grad.assign(x->value.size(), 0.0);
    for (std::size_t lin = 0; lin < map.size(); ++lin) x->grad[lin] += o->grad[map[lin]];
  };
  return make_from_node(out);
}

Variable reduce_max(const Variable& X, const std::vector<int>& axes_in, bool keepdims) {
  const auto& shp = X.n->shape;
  const auto axes = normalize_axes(axes_in, shp.size());
  const auto out_shape = reduced_shape(shp, axes, keepdims);
  const std::size_t outN = numel(out_shape);

  auto out = std::make_shared<Node>();
  out->shape = out_shape;
  out->value.assign(outN, -std::numeric_limits<double>::infinity());
  out->grad.assign(outN, 0.0);
  out->requires_grad = X.n->requires_grad;
  out->parents = {X.n};

  auto map = reduction_map(shp, axes);
  for (std::size_t lin = 0; lin < map.size(); ++lin)
    out->value[map[lin]] = std::max(out->value[map[lin]], X.n->value[lin]);

  out->backward = [xw = std::weak_ptr<Node>(X.n), ow = std::weak_ptr<Node>(out), map = std::move(map)]() {
    auto o = ow.lock(); auto x = xw.lock();
    if (!o || !x || !x->requires_grad) return;
    if (x->grad.size() != x->value.size()) x->grad.assign(x->value.size(), 0.0);
    std::vector<std::size_t> ties(o->value.size(), 0);
    for (std::size_t lin = 0; lin < map.size(); ++lin)
      if (x->value[lin] == o->value[map[lin]]) ++ties[map[lin]];
    for (std::size_t lin = 0; lin < map.size(); ++lin) {
      const std::size_t oi = map[lin];
      if (x->value[lin] == o->value[oi]) x->grad[lin] += o->grad[oi] / double(ties[oi]);
    }
  };
  return make_from_node(out);
}

} // namespace mos
