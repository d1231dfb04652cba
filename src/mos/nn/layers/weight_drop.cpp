// ============================
// File: src/mos/nn/layers/weight_drop.cpp
// ============================
#include "mos/nn/layers/weight_drop.hpp"
#include "mos/core/errors.hpp"
#include "mos/core/log.hpp"
#include "mos/ops/elementwise.hpp"
#include "mos/ops/rng_extras.hpp"

#include <utility>

namespace mos::nn {

namespace {

// Installs `active` in `slot` and restores the previous handle on scope exit.
class SlotSwap {
public:
  SlotSwap(Variable& slot, Variable active) : slot_(slot), saved_(slot) { slot_ = std::move(active); }
  ~SlotSwap() { slot_ = saved_; }
  SlotSwap(const SlotSwap&) = delete;
  SlotSwap& operator=(const SlotSwap&) = delete;
private:
  Variable& slot_;
  Variable saved_;
};

} // namespace

WeightDrop::WeightDrop(std::shared_ptr<RecurrentLayer> module, const std::string& weight_name, double p)
: module_(std::move(module)), weight_name_(weight_name), p_(p) {
  if (!module_) throw ConfigurationError("WeightDrop: null module");
  check_probability(p_, "WeightDrop");
  slot_ = module_->find_parameter(weight_name_);
  if (!slot_) throw ConfigurationError("WeightDrop: no parameter named '" + weight_name_ + "' in wrapped module");
  register_module("module", module_);
  MOS_LOG_DEBUG("WeightDrop: '%s' p=%.3f (%zu weights)", weight_name_.c_str(), p_, slot_->numel());
}

std::pair<Variable, RecurrentState> WeightDrop::forward(const Variable& X,
                                                        const RecurrentState& state,
                                                        Mode mode) {
  if (p_ == 0.0 || !masks_active(mode)) return module_->forward(X, state, mode);

  const Variable raw = *slot_;
  auto mask = mos::bernoulli_mask(raw.shape(), 1.0 - p_, keep_scale(mode, p_));
  SlotSwap swap(*slot_, mos::mul(raw, mask));
  return module_->forward(X, state, mode);
}

} // namespace mos::nn
