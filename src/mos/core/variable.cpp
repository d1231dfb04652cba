#include "mos/core/variables.hpp"
#include "mos/ops/tensor_utils.hpp"
#include <stdexcept>
#include <unordered_set>
#include <string>
#include <utility>

namespace {

// Post-order over parents, iterative: unrolled recurrences produce graphs far
// deeper than the call stack allows. reverse(order) is a valid backprop order.
std::vector<std::shared_ptr<mos::Node>> topo_order(const std::shared_ptr<mos::Node>& root) {
  std::vector<std::shared_ptr<mos::Node>> order;
  if (!root) return order;
  std::unordered_set<const mos::Node*> seen{root.get()};
  // (node, index of the next parent to visit)
  std::vector<std::pair<std::shared_ptr<mos::Node>, std::size_t>> stack;
  stack.emplace_back(root, 0);
  while (!stack.empty()) {
    auto& top = stack.back();
    if (top.second < top.first->parents.size()) {
      std::shared_ptr<mos::Node> p = top.first->parents[top.second++];
      if (p && seen.insert(p.get()).second) stack.emplace_back(std::move(p), 0);
      continue;
    }
    order.push_back(std::move(top.first));
    stack.pop_back();
  }
  return order;
}

} // anon

namespace mos {

Variable::Variable() : n(std::make_shared<Node>()) {}
Variable::Variable(std::shared_ptr<Node> node) : n(std::move(node)) {}

Variable::Variable(const std::vector<double>& value,
                   const std::vector<std::size_t>& shape,
                   bool requires_grad) {
  if (detail::numel(shape) != value.size()) throw std::invalid_argument("Variable: " + std::to_string(value.size()) + " values for a shape of " + std::to_string(detail::numel(shape)));
  n = std::make_shared<Node>();
  n->value = value;
  n->shape = shape;
  n->requires_grad = (requires_grad && mos::is_grad_enabled());
  n->grad.assign(value.size(), 0.0);
}

const std::vector<double>& Variable::value() const { return n->value; }
const std::vector<double>& Variable::grad()  const { return n->grad;  }
const std::vector<std::size_t>& Variable::shape() const { return n->shape; }
bool Variable::requires_grad() const { return n->requires_grad; }
std::size_t Variable::numel() const { return n->value.size(); }
std::vector<double>& Variable::mutable_value() { return n->value; }

Variable make_from_node(std::shared_ptr<Node> node) { return Variable(std::move(node)); }

void Variable::zero_grad() {
  for (auto& x : topo_order(n)) x->grad.assign(detail::numel(x->shape), 0.0);
}

void Variable::backward() {
  if (detail::numel(n->shape) != 1)
    throw std::invalid_argument("backward: output has " + std::to_string(detail::numel(n->shape)) + " elements; pass an explicit seed");
  backward(std::vector<double>{1.0});
}

void Variable::backward(const std::vector<double>& seed) {
  if (seed.size() != n->grad.size()) throw std::invalid_argument("backward: seed size does not match output");
  const auto order = topo_order(n);
  for (std::size_t i = 0; i < seed.size(); ++i) n->grad[i] += seed[i];

  for (auto it = order.rbegin(); it != order.rend(); ++it)
    if ((*it)->backward) (*it)->backward();

  // Release the graph so intermediate nodes can be freed. Leaf nodes (no
  // parents) keep their grad.
  for (auto& node : order) {
    if (node->parents.empty()) continue;
    node->backward = nullptr;
    node->parents.clear();
  }
}

} // namespace mos
