// ============================
// File: include/mos/nn/rnn_model.hpp
// ============================
#pragma once

#include <cstddef>
#include <vector>

#include "mos/nn/model_config.hpp"
#include "mos/nn/layers/embedding.hpp"
#include "mos/nn/layers/recurrent_stack.hpp"
#include "mos/nn/layers/mixture_of_softmaxes.hpp"

namespace mos::nn {

struct ModelOutput {
  Variable output;                        // [T, B, ntoken]
  std::vector<RecurrentState> hidden;     // carry into the next call
  // Filled only when return_h is set.
  std::vector<Variable> raw_outputs;      // per layer, before dropout
  std::vector<Variable> outputs;          // after dropout; last entry is the head's context
};

// Embedding -> LSTM stack -> mixture-of-softmaxes language model.
//
// Parameter names: encoder.weight, rnns.<l>.weight_ih|weight_hh|bias_ih|bias_hh
// (rnns.<l>.module.* when weight-dropped), head.prior.weight,
// head.latent.weight|bias, head.decoder.weight|bias. With tie_weights the
// decoder weight is the encoder table and is listed once.
class RNNModel : public Module {
public:
  // Validates cfg (ConfigurationError) and calls init_weights().
  explicit RNNModel(const ModelConfig& cfg);

  // tokens: T x B ids; hidden: as returned by init_hidden(B) or a previous call.
  ModelOutput forward(const Tokens& tokens,
                      const std::vector<RecurrentState>& hidden,
                      bool return_h = false,
                      bool return_prob = false);

  std::vector<RecurrentState> init_hidden(std::size_t batch) const;

  // encoder and decoder weights ~ U[-0.1, 0.1], decoder bias 0 (global RNG).
  void init_weights();

  // Monte-Carlo evaluation: dropout masks are drawn but never rescaled.
  void set_mc_eval(bool on) { mc_eval_ = on; }
  bool mc_eval() const { return mc_eval_; }

  // Mode used by the next forward().
  Mode mode() const;

  const ModelConfig& config() const { return cfg_; }
  Embedding& encoder() { return encoder_; }
  RecurrentStack& rnns() { return rnns_; }
  MixtureOfSoftmaxes& head() { return head_; }

protected:
  std::vector<Variable*> _parameters() override { return {}; }

private:
  ModelConfig cfg_;
  Embedding encoder_;
  RecurrentStack rnns_;
  MixtureOfSoftmaxes head_;
  bool mc_eval_ = false;
};

} // namespace mos::nn
