// ============================
// File: include/mos/nn/layers/mixture_of_softmaxes.hpp
// ============================
#pragma once

#include <cstddef>

#include "mos/nn/layers/linear.hpp"
#include "mos/nn/mode.hpp"

namespace mos::nn {

struct MixtureOutput {
  Variable output;        // [T, B, ntoken]: log(prob + 1e-8), or prob
  Variable context;       // G after output dropout, [T, B, nhidlast]
  Variable prior;         // [T*B, n_experts]
  Variable expert_prob;   // [T*B, n_experts, ntoken]
};

// Mixture-of-softmaxes output head.
//   G'   = locked_dropout(G, dropout)
//   H    = locked_dropout(tanh(latent(G')), dropoutl)      [T, B, E*L]
//   p_e  = softmax(decoder(H viewed as [T*B*E, L]))          per expert
//   pi   = softmax(prior(G'))                                prior has no bias
//   prob = sum_e pi_e * p_e
class MixtureOfSoftmaxes : public Module {
public:
  MixtureOfSoftmaxes(std::size_t nhidlast, std::size_t nlatent, std::size_t ntoken,
                     std::size_t n_experts, double dropout = 0.5, double dropoutl = 0.5);

  // G: [T, B, nhidlast]
  MixtureOutput forward(const Variable& G, Mode mode, bool return_prob = false);

  // Share the decoder weight with an embedding table [ntoken, nlatent].
  // Throws ConfigurationError on any other shape.
  void tie_decoder(const Variable& weight);

  Linear& prior()   { return prior_; }
  Linear& latent()  { return latent_; }
  Linear& decoder() { return decoder_; }

  std::size_t n_experts() const { return n_experts_; }
  std::size_t nlatent() const { return nlatent_; }
  std::size_t ntoken() const { return ntoken_; }

protected:
  std::vector<Variable*> _parameters() override { return {}; }

private:
  std::size_t nhidlast_, nlatent_, ntoken_, n_experts_;
  double dropout_, dropoutl_;

  Linear prior_;
  Linear latent_;
  Linear decoder_;
};

} // namespace mos::nn
