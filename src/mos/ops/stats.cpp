#include "mos/ops/stats.hpp"
#include "mos/ops/reduce.hpp"
#include "mos/ops/elementwise.hpp"
#include "mos/ops/activations.hpp"
#include "mos/ops/graph.hpp"
#include <stdexcept>

namespace mos {

Variable logsumexp(const Variable& X, const std::vector<int>& axes, bool keepdims) {
  // the shift is a constant for the gradient; d/dx lse = softmax either way
  auto M = stop_gradient(reduce_max(X, axes, true));
  auto S = reduce_sum(expv(sub(X, M)), axes, true);
  auto L = add(logv(S), M);
  if (keepdims) return L;
  return reduce_sum(L, axes, false);
}

Variable softmax(const Variable& X, int axis) {
  int rank = (int)X.n->shape.size();
  int ax = axis < 0 ? rank + axis : axis;
  if (ax < 0 || ax >= rank) throw std::invalid_argument("softmax: axis out of range");
  std::vector<int> axes = {ax};
  auto M = stop_gradient(reduce_max(X, axes, true));
  auto E = expv(sub(X, M));
  auto S = reduce_sum(E, axes, true);
  return div(E, S); // broadcasted division
}

} // namespace mos
