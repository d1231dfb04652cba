#include "mos/ops/activations.hpp"
#include "op_builders.hpp"
#include <cmath>

namespace mos {
using detail::unary_op;

Variable sigmoid(const Variable& X) {
  return unary_op(X,
    [](double x){ return 1.0 / (1.0 + std::exp(-x)); },
    [](double, double y, double g){ return g * y * (1.0 - y); });
}

Variable tanhv(const Variable& X) {
  return unary_op(X,
    [](double x){ return std::tanh(x); },
    [](double, double y, double g){ return g * (1.0 - y * y); });
}

// No clamping: log(0) is -inf. Callers add their own floor.
Variable logv(const Variable& X) {
  return unary_op(X,
    [](double x){ return std::log(x); },
    [](double x, double, double g){ return g / x; });
}

} // namespace mos
