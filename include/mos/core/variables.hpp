#pragma once
#include <memory>
#include <vector>
#include <functional>
#include <cstddef>

namespace mos {

// Global grad mode (thread-local). Controls whether new nodes require_grad.
inline thread_local bool __grad_enabled = true;
inline bool is_grad_enabled() { return __grad_enabled; }
inline void set_grad_enabled(bool v) { __grad_enabled = v; }


struct Node {
  std::vector<double> value;                // flattened tensor, row-major
  std::vector<double> grad;                 // same size as value
  std::vector<std::size_t> shape;           // tensor shape
  bool requires_grad = false;

  std::vector<std::shared_ptr<Node>> parents; // inputs
  std::function<void()> backward;             // local VJP
};

// Handle to a Node. Copies share the same storage, so two Variables built from
// one another alias the same values and grads.
class Variable {
public:
  Variable();                                                   // empty node
  explicit Variable(std::shared_ptr<Node> node);                // wrap existing
  Variable(const std::vector<double>& value,
           const std::vector<std::size_t>& shape,
           bool requires_grad = true);

  const std::vector<double>& value() const;
  const std::vector<double>& grad()  const;
  const std::vector<std::size_t>& shape() const;
  bool requires_grad() const;
  std::size_t numel() const;

  // In-place write access for initialization and external updates. Does not
  // record anything on the graph.
  std::vector<double>& mutable_value();

  // True when both handles point at the same storage.
  bool shares_storage(const Variable& other) const { return n == other.n; }

  void zero_grad();                                // zero across reachable subgraph
  void backward();                                 // scalar output -> seed 1
  void backward(const std::vector<double>& seed);  // tensor output -> explicit seed

  // expose node handle for ops implementation
  std::shared_ptr<Node> n;
};

Variable make_from_node(std::shared_ptr<Node> node);

} // namespace mos
