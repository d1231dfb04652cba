#include "mos/ops/graph.hpp"

namespace mos {

Variable stop_gradient(const Variable& x) {
  auto n = std::make_shared<Node>();
  n->shape = x.n->shape;
  n->value = x.n->value;
  n->grad.assign(n->value.size(), 0.0);
  n->requires_grad = false;
  return make_from_node(n);
}


Variable detach(const Variable& x) {
  return stop_gradient(x);
}

NoGradGuard::NoGradGuard() : prev_(mos::is_grad_enabled()) { mos::set_grad_enabled(false); }
NoGradGuard::~NoGradGuard() { mos::set_grad_enabled(prev_); }
} // namespace mos
