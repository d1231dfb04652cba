// ============================
// File: src/mos/nn/layers/embedding.cpp
// ============================
#include "mos/nn/layers/embedding.hpp"
#include "mos/core/errors.hpp"
#include "mos/ops/elementwise.hpp"
#include "mos/ops/indexing.hpp"
#include "mos/ops/rng_extras.hpp"

#include <stdexcept>
#include <string>

namespace mos::nn {

namespace {

void check_tokens(const Tokens& tokens, std::size_t vocab) {
  if (tokens.steps == 0 || tokens.batch == 0)
    throw ShapeError("Tokens: steps and batch must be positive");
  if (tokens.ids.size() != tokens.steps * tokens.batch)
    throw ShapeError("Tokens: expected " + std::to_string(tokens.steps * tokens.batch) +
                     " ids, got " + std::to_string(tokens.ids.size()));
  for (auto id : tokens.ids)
    if (id >= vocab) throw std::out_of_range("Tokens: id " + std::to_string(id) + " >= vocabulary size " + std::to_string(vocab));
}

} // namespace

Embedding::Embedding(std::size_t num_embeddings, std::size_t embedding_dim,
                     double init_scale, unsigned long long seed)
: num_embeddings_(num_embeddings), embedding_dim_(embedding_dim) {
  if (num_embeddings_ == 0 || embedding_dim_ == 0)
    throw ConfigurationError("Embedding: sizes must be positive");
  std::mt19937_64 rng(seed);
  std::uniform_real_distribution<double> dist(-init_scale, init_scale);
  std::vector<double> w(num_embeddings_ * embedding_dim_);
  for (auto& v : w) v = dist(rng);
  W_ = Variable(w, {num_embeddings_, embedding_dim_}, /*requires_grad=*/true);
  register_parameter("weight", W_);
}

Variable Embedding::forward(const Tokens& tokens) {
  check_tokens(tokens, num_embeddings_);
  return mos::embedding_lookup(W_, tokens.ids, {tokens.steps, tokens.batch});
}

Variable embedded_dropout(Embedding& embed, const Tokens& tokens, double p, Mode mode) {
  check_probability(p, "embedded_dropout");
  if (!masks_active(mode) || p == 0.0) return embed.forward(tokens);

  check_tokens(tokens, embed.num_embeddings());
  auto mask = mos::bernoulli_mask({embed.num_embeddings(), 1}, 1.0 - p, keep_scale(mode, p));
  auto masked = mos::mul(embed.weight(), mask);
  return mos::embedding_lookup(masked, tokens.ids, {tokens.steps, tokens.batch});
}

} // namespace mos::nn
