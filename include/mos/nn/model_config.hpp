// ============================
// File: include/mos/nn/model_config.hpp
// ============================
#pragma once

#include <cstddef>

namespace mos::nn {

// Hyper-parameters for RNNModel. Defaults follow the usual AWD/MoS setup.
struct ModelConfig {
  std::size_t ntoken   = 0;   // vocabulary size
  std::size_t ninp     = 0;   // embedding width
  std::size_t nhid     = 0;   // width of every layer but the last
  std::size_t nhidlast = 0;   // width of the last layer
  std::size_t nlayers  = 1;

  double dropout  = 0.5;      // on the last layer's output (G)
  double dropouth = 0.5;      // between recurrent layers
  double dropouti = 0.5;      // on the embedded input
  double dropoute = 0.1;      // whole vocabulary rows of the embedding table
  double wdrop    = 0.0;      // on weight_hh of every layer (0 = no wrapper)
  double dropoutl = 0.5;      // on the expert latents

  std::size_t n_experts = 10;
  bool tie_weights = false;
  // false forces every dropout probability above to 0
  bool use_dropout = true;
  // per-expert latent width; 0 means ninp
  std::size_t nlatent = 0;

  std::size_t latent_size() const { return nlatent ? nlatent : ninp; }

  // Width of layer l's output / hidden state.
  std::size_t layer_width(std::size_t l) const { return l + 1 == nlayers ? nhidlast : nhid; }

  // Dropout probability as seen by the model (0 when use_dropout is off).
  double effective(double p) const { return use_dropout ? p : 0.0; }

  // Throws ConfigurationError on non-positive sizes/counts, probabilities
  // outside [0, 1), or tying with latent_size() != ninp.
  void validate() const;
};

} // namespace mos::nn
