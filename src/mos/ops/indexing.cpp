#include "mos/ops/indexing.hpp"
#include "mos/ops/tensor_utils.hpp"
#include "mos/parallel/parallel_for.hpp"
#include <stdexcept>
#include <string>

namespace mos {

Variable embedding_lookup(const Variable& W,
                          const std::vector<std::size_t>& ids,
                          const std::vector<std::size_t>& prefix_shape) {
  const auto& ws = W.n->shape;
  if (ws.size() != 2) throw std::invalid_argument("embedding_lookup: table must be [V, D]");
  if (detail::numel(prefix_shape) != ids.size())
    throw std::invalid_argument("embedding_lookup: prefix shape does not match id count");
  const std::size_t V = ws[0], D = ws[1];
  for (auto id : ids)
    if (id >= V) throw std::out_of_range("embedding_lookup: token id " + std::to_string(id) + " >= " + std::to_string(V));

  auto out = std::make_shared<Node>();
  out->shape = prefix_shape;
  out->shape.push_back(D);
  out->value.resize(ids.size() * D);
  out->grad.assign(ids.size() * D, 0.0);
  out->requires_grad = W.n->requires_grad;
  out->parents = {W.n};

  const double* w = W.n->value.data();
  double* o = out->value.data();
  mos::parallel::parallel_for(ids.size(), 64, [&](std::size_t r0, std::size_t r1){
    for (std::size_t r = r0; r < r1; ++r) {
      const double* row = w + ids[r] * D;
      for (std::size_t d = 0; d < D; ++d) o[r * D + d] = row[d];
    }
  });

  out->backward = [ww = std::weak_ptr<Node>(W.n), ow = std::weak_ptr<Node>(out), ids, D]() {
    auto op = ow.lock(); auto wn = ww.lock();
    if (!op || !wn || !wn->requires_grad) return;
    if (wn->grad.size() != wn->value.size()) wn->grad.assign(wn->value.size(), 0.0);
    // repeated ids hit the same row: serial
    for (std::size_t r = 0; r < ids.size(); ++r)
      for (std::size_t d = 0; d < D; ++d) wn->grad[ids[r] * D + d] += op->grad[r * D + d];
  };
  return make_from_node(out);
}

} // namespace mos
