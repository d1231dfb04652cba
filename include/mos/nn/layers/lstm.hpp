// ============================
// File: include/mos/nn/layers/lstm.hpp
// ============================
#pragma once

#include <cstddef>
#include <utility>
#include <vector>
#include <random>

#include "mos/nn/module.hpp"
#include "mos/nn/mode.hpp"
#include "mos/core/variables.hpp"

namespace mos::nn {

// Carried recurrent state of one layer: h and c, each [1, B, H].
struct RecurrentState {
  Variable h;
  Variable c;
};

// A single recurrent layer that consumes a whole time-major sequence.
class RecurrentLayer : public Module {
public:
  // X: [T, B, I], state: [1, B, H] each -> (Y: [T, B, H], next state)
  virtual std::pair<Variable, RecurrentState> forward(const Variable& X,
                                                      const RecurrentState& state,
                                                      Mode mode) = 0;

  virtual std::size_t input_size() const = 0;
  virtual std::size_t hidden_size() const = 0;
};

// Single-layer LSTM (no peepholes), time-major.
// Parameters (PyTorch layout, gate blocks ordered i, f, g, o):
//   weight_ih: [4H, I]   weight_hh: [4H, H]   bias_ih, bias_hh: [4H]
// Equations:
//   i = sigmoid(x W_ii^T + b_ii + h W_hi^T + b_hi)
//   f = sigmoid(x W_if^T + b_if + h W_hf^T + b_hf)
//   g = tanh   (x W_ig^T + b_ig + h W_hg^T + b_hg)
//   o = sigmoid(x W_io^T + b_io + h W_ho^T + b_ho)
//   c' = f * c + i * g
//   h' = o * tanh(c')
// weight_hh is read from its slot on every call, so a wrapper may swap it.
class LSTM : public RecurrentLayer {
public:
  LSTM(std::size_t input_size,
       std::size_t hidden_size,
       bool bias = true,
       unsigned long long seed = 0xABCD1234ULL);

  std::pair<Variable, RecurrentState> forward(const Variable& X,
                                              const RecurrentState& state,
                                              Mode mode) override;

  // One step. x: [1, B, I]. Returns the next state.
  RecurrentState forward_step(const Variable& x, const RecurrentState& state);

  std::size_t input_size() const override { return input_size_; }
  std::size_t hidden_size() const override { return hidden_size_; }
  bool has_bias() const { return bias_; }

protected:
  std::vector<Variable*> _parameters() override;

private:
  static std::vector<double> randu_(std::size_t n, double scale, unsigned long long seed) {
    std::mt19937_64 rng(seed);
    std::uniform_real_distribution<double> dist(-scale, scale);
    std::vector<double> v(n);
    for (auto& t : v) t = dist(rng);
    return v;
  }

  void init_params_(unsigned long long seed);
  void check_state_(const RecurrentState& state, std::size_t B) const;
  // gx: input projection for one step, [1, B, 4H]
  RecurrentState step_(const Variable& gx, const RecurrentState& state);

  std::size_t input_size_ = 0;
  std::size_t hidden_size_ = 0;
  bool bias_ = true;

  Variable W_ih_;  // [4H, I]
  Variable W_hh_;  // [4H, H]
  Variable b_ih_;  // [4H]
  Variable b_hh_;  // [4H]
};

} // namespace mos::nn
