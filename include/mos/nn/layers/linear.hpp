// ============================
// File: include/mos/nn/layers/linear.hpp
// ============================
#pragma once

#include <cstddef>
#include <random>
#include <vector>

#include "mos/nn/module.hpp"
#include "mos/core/variables.hpp"

namespace mos::nn {

// A fully-connected layer: y = x @ W^T + b
// Shapes:
//   x: [..., In]
//   W: [Out, In]   (row per output unit, same layout as an embedding table)
//   b: [Out] (optional; broadcast over leading dims)
class Linear : public Module {
public:
  Linear(std::size_t in_features, std::size_t out_features, bool bias = true,
         double init_scale = 0.02, unsigned long long seed = 0xC0FFEE)
  : in_features_(in_features), out_features_(out_features), bias_(bias) {
    init_params_(init_scale, seed);
  }

  Variable forward(const Variable& x);

  // Share storage with `w` (e.g. an embedding table). Throws
  // ConfigurationError unless w is [Out, In].
  void tie_weight(const Variable& w);

  std::size_t in_features()  const { return in_features_; }
  std::size_t out_features() const { return out_features_; }
  bool has_bias() const { return bias_; }

  Variable& weight() { return W_; }
  Variable& bias() { return b_; }

protected:
  std::vector<Variable*> _parameters() override {
    if (bias_) return { &W_, &b_ };
    return { &W_ };
  }

private:
  void init_params_(double scale, unsigned long long seed);

  // Helper to fill a vector with U(-scale, scale)
  static std::vector<double> randu_(std::size_t n, double scale, unsigned long long seed) {
    std::mt19937_64 rng(seed);
    std::uniform_real_distribution<double> dist(-scale, scale);
    std::vector<double> v(n);
    for (auto& t : v) t = dist(rng);
    return v;
  }

  std::size_t in_features_  = 0;
  std::size_t out_features_ = 0;
  bool bias_ = true;

  Variable W_; // [Out, In]
  Variable b_; // [Out]
};

} // namespace mos::nn
