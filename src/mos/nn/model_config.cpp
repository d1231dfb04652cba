#include "mos/nn/model_config.hpp"
#include "mos/core/errors.hpp"

#include <string>

namespace mos::nn {

namespace {

void require_positive(std::size_t v, const char* name) {
  if (v == 0) throw ConfigurationError(std::string("ModelConfig: ") + name + " must be positive");
}

void require_probability(double p, const char* name) {
  if (!(p >= 0.0 && p < 1.0))
    throw ConfigurationError(std::string("ModelConfig: ") + name + " must be in [0, 1), got " + std::to_string(p));
}

} // namespace

void ModelConfig::validate() const {
  require_positive(ntoken, "ntoken");
  require_positive(ninp, "ninp");
  require_positive(nhidlast, "nhidlast");
  require_positive(nlayers, "nlayers");
  require_positive(n_experts, "n_experts");
  if (nlayers > 1) require_positive(nhid, "nhid");

  require_probability(dropout, "dropout");
  require_probability(dropouth, "dropouth");
  require_probability(dropouti, "dropouti");
  require_probability(dropoute, "dropoute");
  require_probability(wdrop, "wdrop");
  require_probability(dropoutl, "dropoutl");

  if (tie_weights && latent_size() != ninp) {
    throw ConfigurationError("ModelConfig: tie_weights needs nlatent == ninp (" +
                             std::to_string(latent_size()) + " != " + std::to_string(ninp) + ")");
  }
}

} // namespace mos::nn
