// ============================
// File: src/mos/nn/layers/lstm.cpp
// ============================
#include "mos/nn/layers/lstm.hpp"
#include "mos/core/errors.hpp"
#include "mos/ops/activations.hpp"
#include "mos/ops/elementwise.hpp"
#include "mos/ops/linalg.hpp"
#include "mos/ops/reshape.hpp"
#include "mos/ops/tensor_utils.hpp"

#include <cmath>
#include <string>

namespace mos::nn {

LSTM::LSTM(std::size_t input_size, std::size_t hidden_size, bool bias, unsigned long long seed)
: input_size_(input_size), hidden_size_(hidden_size), bias_(bias) {
  if (input_size_ == 0 || hidden_size_ == 0)
    throw ConfigurationError("LSTM: input_size and hidden_size must be positive");
  init_params_(seed);
}

void LSTM::init_params_(unsigned long long seed) {
  const std::size_t I = input_size_, H = hidden_size_;
  const double scale = 1.0 / std::sqrt(double(H));

  W_ih_ = Variable(randu_(4*H*I, scale, seed + 0), {4*H, I}, /*requires_grad=*/true);
  W_hh_ = Variable(randu_(4*H*H, scale, seed + 1), {4*H, H}, /*requires_grad=*/true);
  register_parameter("weight_ih", W_ih_);
  register_parameter("weight_hh", W_hh_);

  if (bias_) {
    b_ih_ = Variable(randu_(4*H, scale, seed + 2), {4*H}, /*requires_grad=*/true);
    b_hh_ = Variable(randu_(4*H, scale, seed + 3), {4*H}, /*requires_grad=*/true);
    register_parameter("bias_ih", b_ih_);
    register_parameter("bias_hh", b_hh_);
  }
}

std::vector<Variable*> LSTM::_parameters() {
  if (bias_) return { &W_ih_, &W_hh_, &b_ih_, &b_hh_ };
  return { &W_ih_, &W_hh_ };
}

void LSTM::check_state_(const RecurrentState& state, std::size_t B) const {
  const std::vector<std::size_t> want{1, B, hidden_size_};
  if (state.h.shape() != want || state.c.shape() != want) {
    throw ShapeError("LSTM: expected h and c of shape [1, " + std::to_string(B) + ", " +
                     std::to_string(hidden_size_) + "]");
  }
}

RecurrentState LSTM::step_(const Variable& gx, const RecurrentState& state) {
  const long long H = static_cast<long long>(hidden_size_);
  auto gates = add(gx, matmul(state.h, t(W_hh_)));
  if (bias_) gates = add(gates, b_hh_);

  auto block = [&](long long k) {
    return at(gates, {Slice::all(), Slice::all(), Slice::range(k * H, (k + 1) * H)});
  };
  auto i = sigmoid(block(0));
  auto f = sigmoid(block(1));
  auto g = tanhv(block(2));
  auto o = sigmoid(block(3));

  auto c_next = add(mul(f, state.c), mul(i, g));
  auto h_next = mul(o, tanhv(c_next));
  return {h_next, c_next};
}

RecurrentState LSTM::forward_step(const Variable& x, const RecurrentState& state) {
  const auto& xs = x.shape();
  if (xs.size() != 3 || xs[0] != 1 || xs[2] != input_size_)
    throw ShapeError("LSTM::forward_step expects x shape [1, B, " + std::to_string(input_size_) + "]");
  check_state_(state, xs[1]);

  auto gx = matmul(x, t(W_ih_));
  if (bias_) gx = add(gx, b_ih_);
  return step_(gx, state);
}

std::pair<Variable, RecurrentState> LSTM::forward(const Variable& X,
                                                  const RecurrentState& state,
                                                  Mode /*mode*/) {
  const auto& s = X.shape();
  if (s.size() != 3) throw ShapeError("LSTM::forward expects X shape [T,B,I]");
  if (s[2] != input_size_)
    throw ShapeError("LSTM::forward input_size mismatch: expected " + std::to_string(input_size_) +
                     ", got " + std::to_string(s[2]));
  const std::size_t T = s[0], B = s[1];
  if (T == 0) throw ShapeError("LSTM::forward: empty sequence");
  check_state_(state, B);

  // Input projection for all steps at once: [T, B, 4H]
  auto GX = matmul(X, t(W_ih_));
  if (bias_) GX = add(GX, b_ih_);

  std::vector<Variable> hs; hs.reserve(T);
  RecurrentState cur = state;
  for (std::size_t t_ = 0; t_ < T; ++t_) {
    auto gx = at(GX, {Slice::index(static_cast<long long>(t_)), Slice::all(), Slice::all()});
    cur = step_(gx, cur);
    hs.push_back(cur.h);
  }
  return {concat(hs, 0), cur};
}

} // namespace mos::nn
