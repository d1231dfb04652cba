// ============================
// File: src/mos/nn/layers/recurrent_stack.cpp
// ============================
#include "mos/nn/layers/recurrent_stack.hpp"
#include "mos/nn/layers/locked_dropout.hpp"
#include "mos/core/errors.hpp"

#include <string>

namespace mos::nn {

std::vector<LayerSpec> LayerSpec::from_config(const ModelConfig& cfg) {
  std::vector<LayerSpec> specs;
  specs.reserve(cfg.nlayers);
  for (std::size_t l = 0; l < cfg.nlayers; ++l) {
    LayerSpec s;
    s.input_size  = l == 0 ? cfg.ninp : cfg.nhid;
    s.hidden_size = cfg.layer_width(l);
    s.weight_drop = cfg.wdrop > 0.0;
    s.wdrop       = cfg.effective(cfg.wdrop);
    s.seed        = 0xABCD1234ULL + 16 * l;
    specs.push_back(s);
  }
  return specs;
}

RecurrentStack::RecurrentStack(std::vector<LayerSpec> specs, double dropouth)
: specs_(std::move(specs)), dropouth_(dropouth) {
  if (specs_.empty()) throw ConfigurationError("RecurrentStack: need at least one layer");
  check_probability(dropouth_, "RecurrentStack");
  for (std::size_t l = 1; l < specs_.size(); ++l) {
    if (specs_[l].input_size != specs_[l-1].hidden_size)
      throw ConfigurationError("RecurrentStack: layer " + std::to_string(l) + " input size does not match layer " +
                               std::to_string(l - 1) + " hidden size");
  }

  layers_.reserve(specs_.size());
  for (std::size_t l = 0; l < specs_.size(); ++l) {
    const auto& s = specs_[l];
    std::shared_ptr<RecurrentLayer> layer = std::make_shared<LSTM>(s.input_size, s.hidden_size, true, s.seed);
    if (s.weight_drop) layer = std::make_shared<WeightDrop>(layer, "weight_hh", s.wdrop);
    register_module(std::to_string(l), layer);
    layers_.push_back(std::move(layer));
  }
}

void RecurrentStack::check_hidden(std::size_t batch, const std::vector<RecurrentState>& hidden) const {
  if (hidden.size() != specs_.size())
    throw ShapeError("RecurrentStack: expected " + std::to_string(specs_.size()) + " hidden states, got " +
                     std::to_string(hidden.size()));
  for (std::size_t l = 0; l < specs_.size(); ++l) {
    const std::vector<std::size_t> want{1, batch, specs_[l].hidden_size};
    if (hidden[l].h.shape() != want || hidden[l].c.shape() != want)
      throw ShapeError("RecurrentStack: hidden state " + std::to_string(l) + " must be [1, " +
                       std::to_string(batch) + ", " + std::to_string(specs_[l].hidden_size) + "]");
  }
}

StackOutput RecurrentStack::forward(const Variable& X, const std::vector<RecurrentState>& hidden, Mode mode) {
  const auto& s = X.shape();
  if (s.size() != 3 || s[2] != specs_.front().input_size)
    throw ShapeError("RecurrentStack: expected X shape [T, B, " + std::to_string(specs_.front().input_size) + "]");
  check_hidden(s[1], hidden);

  StackOutput out;
  out.hidden.reserve(layers_.size());
  out.raw_outputs.reserve(layers_.size());

  Variable cur = X;
  for (std::size_t l = 0; l < layers_.size(); ++l) {
    auto [y, next] = layers_[l]->forward(cur, hidden[l], mode);
    out.hidden.push_back(next);
    out.raw_outputs.push_back(y);
    cur = y;
    if (l + 1 != layers_.size()) {
      cur = LockedDropout::apply(cur, dropouth_, mode);
      out.outputs.push_back(cur);
    }
  }
  out.output = cur;
  return out;
}

std::vector<RecurrentState> RecurrentStack::init_hidden(std::size_t batch) const {
  std::vector<RecurrentState> hidden;
  hidden.reserve(specs_.size());
  for (const auto& s : specs_) {
    std::vector<double> zeros(batch * s.hidden_size, 0.0);
    hidden.push_back({Variable(zeros, {1, batch, s.hidden_size}, /*requires_grad=*/false),
                      Variable(zeros, {1, batch, s.hidden_size}, /*requires_grad=*/false)});
  }
  return hidden;
}

} // namespace mos::nn
