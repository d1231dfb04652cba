// ============================
// File: src/mos/nn/layers/mixture_of_softmaxes.cpp
// ============================
#include "mos/nn/layers/mixture_of_softmaxes.hpp"
#include "mos/nn/layers/locked_dropout.hpp"
#include "mos/core/errors.hpp"
#include "mos/ops/activations.hpp"
#include "mos/ops/elementwise.hpp"
#include "mos/ops/reduce.hpp"
#include "mos/ops/reshape.hpp"
#include "mos/ops/stats.hpp"

#include <string>

namespace mos::nn {

namespace {

std::size_t require_positive(std::size_t v, const char* name) {
  if (v == 0) throw ConfigurationError(std::string("MixtureOfSoftmaxes: ") + name + " must be positive");
  return v;
}

constexpr double kLogFloor = 1e-8;

} // namespace

MixtureOfSoftmaxes::MixtureOfSoftmaxes(std::size_t nhidlast, std::size_t nlatent, std::size_t ntoken,
                                       std::size_t n_experts, double dropout, double dropoutl)
: nhidlast_(require_positive(nhidlast, "nhidlast")),
  nlatent_(require_positive(nlatent, "nlatent")),
  ntoken_(require_positive(ntoken, "ntoken")),
  n_experts_(require_positive(n_experts, "n_experts")),
  dropout_(dropout), dropoutl_(dropoutl),
  prior_(nhidlast, n_experts, /*bias=*/false, 0.1, 0x9A10ull),
  latent_(nhidlast, n_experts * nlatent, /*bias=*/true, 0.1, 0x1A7Eull),
  decoder_(nlatent, ntoken, /*bias=*/true, 0.1, 0xDEC0ull) {
  check_probability(dropout_, "MixtureOfSoftmaxes");
  check_probability(dropoutl_, "MixtureOfSoftmaxes");
  register_module("prior", prior_);
  register_module("latent", latent_);
  register_module("decoder", decoder_);
}

void MixtureOfSoftmaxes::tie_decoder(const Variable& weight) {
  decoder_.tie_weight(weight);
}

MixtureOutput MixtureOfSoftmaxes::forward(const Variable& G, Mode mode, bool return_prob) {
  const auto& s = G.shape();
  if (s.size() != 3 || s[2] != nhidlast_)
    throw ShapeError("MixtureOfSoftmaxes: expected G shape [T, B, " + std::to_string(nhidlast_) + "]");
  const std::size_t T = s[0], B = s[1], N = T * B;

  MixtureOutput out;
  out.context = LockedDropout::apply(G, dropout_, mode);

  auto latent = tanhv(latent_.forward(out.context));                 // [T, B, E*L]
  latent = LockedDropout::apply(latent, dropoutl_, mode);
  auto logit = decoder_.forward(reshape(latent, {N * n_experts_, nlatent_}));   // [N*E, V]

  auto prior_logit = reshape(prior_.forward(out.context), {N, n_experts_});
  out.prior = softmax(prior_logit, -1);                               // [N, E]

  out.expert_prob = softmax(reshape(logit, {N, n_experts_, ntoken_}), -1);   // [N, E, V]
  auto weighted = mul(out.expert_prob, reshape(out.prior, {N, n_experts_, 1}));
  auto prob = reduce_sum(weighted, {1}, /*keepdims=*/false);          // [N, V]

  auto result = return_prob ? prob : logv(add(prob, scalar(kLogFloor)));
  out.output = reshape(result, {T, B, ntoken_});
  return out;
}

} // namespace mos::nn
