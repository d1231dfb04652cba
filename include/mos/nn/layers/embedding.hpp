// ============================
// File: include/mos/nn/layers/embedding.hpp
// ============================
#pragma once

#include <cstddef>
#include <random>
#include <utility>
#include <vector>

#include "mos/nn/module.hpp"
#include "mos/nn/mode.hpp"
#include "mos/core/variables.hpp"

namespace mos::nn {

// Time-major token batch: ids[t * batch + b].
struct Tokens {
  std::vector<std::size_t> ids;
  std::size_t steps = 0;
  std::size_t batch = 0;

  Tokens() = default;
  Tokens(std::vector<std::size_t> ids_, std::size_t steps_, std::size_t batch_)
  : ids(std::move(ids_)), steps(steps_), batch(batch_) {}
};

// Lookup table W:[num_embeddings, embedding_dim]. forward(tokens) -> [T, B, D].
class Embedding : public Module {
public:
  Embedding(std::size_t num_embeddings, std::size_t embedding_dim,
            double init_scale = 0.1, unsigned long long seed = 0xE11BEDull);

  Variable forward(const Tokens& tokens);

  std::size_t num_embeddings() const { return num_embeddings_; }
  std::size_t embedding_dim()  const { return embedding_dim_; }

  Variable& weight() { return W_; }

protected:
  std::vector<Variable*> _parameters() override { return { &W_ }; }

private:
  std::size_t num_embeddings_ = 0;
  std::size_t embedding_dim_  = 0;
  Variable W_;
};

// Vocabulary-row dropout. With masks active and p > 0 a (V, 1) Bernoulli(1-p)
// mask (scaled by keep_scale) is multiplied into the whole table before the
// lookup, so a dropped token is zero at every position of this call. The
// stored table is left untouched.
Variable embedded_dropout(Embedding& embed, const Tokens& tokens, double p, Mode mode);

} // namespace mos::nn
