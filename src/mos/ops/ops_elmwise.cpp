#include "mos/ops/elementwise.hpp"
#include "op_builders.hpp"
#include <cmath>

namespace mos {
using detail::binary_op;
using detail::unary_op;

Variable add(const Variable& A, const Variable& B) {
  return binary_op(A, B,
    [](double a, double b){ return a + b; },
    [](double, double, double, double g){ return g; },
    [](double, double, double, double g){ return g; });
}

Variable sub(const Variable& A, const Variable& B) {
  return binary_op(A, B,
    [](double a, double b){ return a - b; },
    [](double, double, double, double g){ return g; },
    [](double, double, double, double g){ return -g; });
}

Variable mul(const Variable& A, const Variable& B) {
  return binary_op(A, B,
    [](double a, double b){ return a * b; },
    [](double, double b, double, double g){ return g * b; },
    [](double a, double, double, double g){ return g * a; });
}

Variable div(const Variable& A, const Variable& B) {
  return binary_op(A, B,
    [](double a, double b){ return a / b; },
    [](double, double b, double, double g){ return g / b; },
    [](double a, double b, double, double g){ return -g * a / (b * b); });
}

Variable neg(const Variable& X) {
  return unary_op(X,
    [](double x){ return -x; },
    [](double, double, double g){ return -g; });
}

Variable expv(const Variable& X) {
  return unary_op(X,
    [](double x){ return std::exp(x); },
    [](double, double y, double g){ return g * y; });
}

Variable scalar(double v) {
  return Variable(std::vector<double>{v}, {1}, /*requires_grad=*/false);
}

} // namespace mos
