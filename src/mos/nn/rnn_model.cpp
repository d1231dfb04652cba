// ============================
// File: src/mos/nn/rnn_model.cpp
// ============================
#include "mos/nn/rnn_model.hpp"
#include "mos/nn/init.hpp"
#include "mos/nn/layers/locked_dropout.hpp"
#include "mos/core/log.hpp"

namespace mos::nn {

namespace {

const ModelConfig& validated(const ModelConfig& cfg) {
  cfg.validate();
  return cfg;
}

} // namespace

RNNModel::RNNModel(const ModelConfig& cfg)
: cfg_(validated(cfg)),
  encoder_(cfg_.ntoken, cfg_.ninp),
  rnns_(LayerSpec::from_config(cfg_), cfg_.effective(cfg_.dropouth)),
  head_(cfg_.nhidlast, cfg_.latent_size(), cfg_.ntoken, cfg_.n_experts,
        cfg_.effective(cfg_.dropout), cfg_.effective(cfg_.dropoutl)) {
  register_module("encoder", encoder_);
  register_module("rnns", rnns_);
  register_module("head", head_);

  if (cfg_.tie_weights) head_.tie_decoder(encoder_.weight());
  init_weights();

  MOS_LOG_DEBUG("RNNModel: ntoken=%zu ninp=%zu nhid=%zu nhidlast=%zu nlayers=%zu n_experts=%zu nlatent=%zu tied=%d",
                cfg_.ntoken, cfg_.ninp, cfg_.nhid, cfg_.nhidlast, cfg_.nlayers, cfg_.n_experts,
                cfg_.latent_size(), int(cfg_.tie_weights));
  MOS_LOG_DEBUG("RNNModel: dropout=%.2f dropouth=%.2f dropouti=%.2f dropoute=%.2f wdrop=%.2f dropoutl=%.2f use_dropout=%d",
                cfg_.dropout, cfg_.dropouth, cfg_.dropouti, cfg_.dropoute, cfg_.wdrop, cfg_.dropoutl,
                int(cfg_.use_dropout));
  MOS_LOG_DEBUG("RNNModel: param size: %zu", num_parameters());
}

void RNNModel::init_weights() {
  const double initrange = 0.1;
  init::uniform_(encoder_.weight(), -initrange, initrange);
  init::zeros_(head_.decoder().bias());
  init::uniform_(head_.decoder().weight(), -initrange, initrange);
}

Mode RNNModel::mode() const {
  if (mc_eval_) return Mode::EvalMonteCarlo;
  return training() ? Mode::Train : Mode::Eval;
}

std::vector<RecurrentState> RNNModel::init_hidden(std::size_t batch) const {
  return rnns_.init_hidden(batch);
}

ModelOutput RNNModel::forward(const Tokens& tokens,
                              const std::vector<RecurrentState>& hidden,
                              bool return_h,
                              bool return_prob) {
  rnns_.check_hidden(tokens.batch, hidden);
  const Mode m = mode();

  auto emb = embedded_dropout(encoder_, tokens, cfg_.effective(cfg_.dropoute), m);
  emb = LockedDropout::apply(emb, cfg_.effective(cfg_.dropouti), m);

  auto stack = rnns_.forward(emb, hidden, m);
  auto mix = head_.forward(stack.output, m, return_prob);

  ModelOutput out;
  out.output = mix.output;
  out.hidden = std::move(stack.hidden);
  if (return_h) {
    out.raw_outputs = std::move(stack.raw_outputs);
    out.outputs = std::move(stack.outputs);
    out.outputs.push_back(mix.context);
  }
  return out;
}

} // namespace mos::nn
