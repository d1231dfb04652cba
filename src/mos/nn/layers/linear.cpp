// ============================
// File: src/mos/nn/layers/linear.cpp
// ============================
#include "mos/nn/layers/linear.hpp"
#include "mos/core/errors.hpp"
#include "mos/ops/elementwise.hpp"
#include "mos/ops/linalg.hpp"

#include <string>

namespace mos::nn {

void Linear::init_params_(double scale, unsigned long long seed) {
  if (in_features_ == 0 || out_features_ == 0)
    throw ConfigurationError("Linear: in_features and out_features must be positive");

  W_ = Variable(randu_(in_features_ * out_features_, scale, seed), {out_features_, in_features_}, /*requires_grad=*/true);
  register_parameter("weight", W_);

  if (bias_) {
    b_ = Variable(randu_(out_features_, scale, seed + 1), {out_features_}, /*requires_grad=*/true);
    register_parameter("bias", b_);
  }
}

void Linear::tie_weight(const Variable& w) {
  const auto& s = w.shape();
  if (s.size() != 2 || s[0] != out_features_ || s[1] != in_features_) {
    throw ConfigurationError("Linear::tie_weight: expected weight [" + std::to_string(out_features_) + ", " +
                             std::to_string(in_features_) + "] to tie");
  }
  W_ = w;
}

Variable Linear::forward(const Variable& x) {
  const auto& xs = x.shape();
  if (xs.size() < 2 || xs.back() != in_features_)
    throw std::invalid_argument("Linear::forward: expected x [..., " + std::to_string(in_features_) + "]");
  auto y = mos::matmul(x, mos::t(W_));
  if (bias_) y = mos::add(y, b_);
  return y;
}

} // namespace mos::nn
