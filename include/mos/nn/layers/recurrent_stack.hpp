// ============================
// File: include/mos/nn/layers/recurrent_stack.hpp
// ============================
#pragma once

#include <cstddef>
#include <memory>
#include <vector>

#include "mos/nn/layers/lstm.hpp"
#include "mos/nn/layers/weight_drop.hpp"
#include "mos/nn/model_config.hpp"

namespace mos::nn {

// One layer of the stack, fixed at construction.
struct LayerSpec {
  std::size_t input_size  = 0;
  std::size_t hidden_size = 0;
  bool   weight_drop = false;   // wrap the LSTM in WeightDrop("weight_hh")
  double wdrop       = 0.0;
  unsigned long long seed = 0xABCD1234ULL;

  // Layer l: ninp or nhid in, nhid (nhidlast for the last layer) out.
  // Layers are wrapped when cfg.wdrop > 0.
  static std::vector<LayerSpec> from_config(const ModelConfig& cfg);
};

struct StackOutput {
  Variable output;                       // last layer's output, [T, B, H_last]
  std::vector<RecurrentState> hidden;    // one per layer
  std::vector<Variable> raw_outputs;     // every layer's output before dropout
  std::vector<Variable> outputs;         // intermediate outputs after dropout (nlayers - 1)
};

// LSTM layers chained with locked dropout (dropouth) between consecutive
// layers. Children are registered as "0", "1", ...
class RecurrentStack : public Module {
public:
  RecurrentStack(std::vector<LayerSpec> specs, double dropouth);

  // X: [T, B, input_size of layer 0]; hidden: one (1, B, width) pair per layer.
  // Shapes are checked before anything runs (ShapeError).
  StackOutput forward(const Variable& X, const std::vector<RecurrentState>& hidden, Mode mode);

  // Throws ShapeError unless hidden matches the layer widths for `batch`.
  void check_hidden(std::size_t batch, const std::vector<RecurrentState>& hidden) const;

  // Zeroed (1, batch, width) pairs.
  std::vector<RecurrentState> init_hidden(std::size_t batch) const;

  std::size_t num_layers() const { return layers_.size(); }
  const std::vector<LayerSpec>& specs() const { return specs_; }
  RecurrentLayer& layer(std::size_t l) { return *layers_.at(l); }
  double dropouth() const { return dropouth_; }

protected:
  std::vector<Variable*> _parameters() override { return {}; }

private:
  std::vector<LayerSpec> specs_;
  double dropouth_ = 0.0;
  std::vector<std::shared_ptr<RecurrentLayer>> layers_;
};

} // namespace mos::nn
