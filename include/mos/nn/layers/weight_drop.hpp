// ============================
// File: include/mos/nn/layers/weight_drop.hpp
// ============================
#pragma once

#include <memory>
#include <string>

#include "mos/nn/layers/lstm.hpp"

namespace mos::nn {

// DropConnect on one named weight of a wrapped recurrent layer.
//
// Every masked call (Train / EvalMonteCarlo with p > 0) draws a fresh element
// mask over the raw weight, installs raw * mask in the layer's slot for that
// call only and puts the raw handle back afterwards, also when the wrapped
// forward throws. The raw values are never written; gradients reach them
// through the product.
class WeightDrop : public RecurrentLayer {
public:
  // Throws ConfigurationError if `weight_name` is not a parameter of `module`.
  WeightDrop(std::shared_ptr<RecurrentLayer> module,
             const std::string& weight_name = "weight_hh",
             double p = 0.5);

  std::pair<Variable, RecurrentState> forward(const Variable& X,
                                              const RecurrentState& state,
                                              Mode mode) override;

  std::size_t input_size() const override { return module_->input_size(); }
  std::size_t hidden_size() const override { return module_->hidden_size(); }

  RecurrentLayer& module() { return *module_; }
  const std::string& weight_name() const { return weight_name_; }
  double p() const { return p_; }

  // The persistent (undropped) weight.
  const Variable& raw_weight() const { return *slot_; }

protected:
  // parameters live in the wrapped module
  std::vector<Variable*> _parameters() override { return {}; }

private:
  std::shared_ptr<RecurrentLayer> module_;
  std::string weight_name_;
  double p_ = 0.0;
  Variable* slot_ = nullptr;
};

} // namespace mos::nn
