// ============================
// File: tests/test_nn_mixture.cpp
// ============================
#include "test_framework.hpp"
#include "mos/nn/layers/mixture_of_softmaxes.hpp"
#include "mos/core/errors.hpp"
#include "mos/ops/reduce.hpp"
#include "mos/ops/rng_extras.hpp"

#include <cmath>
#include <random>
#include <string>
#include <vector>

using mos::Variable;
using mos::nn::MixtureOfSoftmaxes;
using mos::nn::Mode;

namespace {

constexpr std::size_t T = 3, B = 4, NH = 5, L = 3, V = 7, E = 3;

Variable context(bool requires_grad = false) {
    std::mt19937 rng(4);
    std::uniform_real_distribution<double> d(-1.0, 1.0);
    std::vector<double> v(T*B*NH);
    for (auto& x : v) x = d(rng);
    return Variable(v, {T,B,NH}, requires_grad);
}

// Sums of consecutive groups of `width` values.
std::vector<double> group_sums(const std::vector<double>& v, std::size_t width) {
    std::vector<double> s(v.size() / width, 0.0);
    for (std::size_t i = 0; i < v.size(); ++i) s[i / width] += v[i];
    return s;
}

} // namespace

TEST("nn/mixture/distributions_sum_to_one") {
    MixtureOfSoftmaxes head(NH, L, V, E, 0.0, 0.0);
    auto out = head.forward(context(), Mode::Eval, /*return_prob=*/true);

    ASSERT_TRUE((out.output.shape() == std::vector<std::size_t>{T, B, V}));
    ASSERT_TRUE((out.prior.shape() == std::vector<std::size_t>{T*B, E}));
    ASSERT_TRUE((out.expert_prob.shape() == std::vector<std::size_t>{T*B, E, V}));

    for (double s : group_sums(out.output.value(), V)) ASSERT_NEAR(s, 1.0, 1e-12);
    for (double s : group_sums(out.prior.value(), E)) ASSERT_NEAR(s, 1.0, 1e-12);
    for (double s : group_sums(out.expert_prob.value(), V)) ASSERT_NEAR(s, 1.0, 1e-12);
}

TEST("nn/mixture/output_is_prior_weighted_expert_sum") {
    MixtureOfSoftmaxes head(NH, L, V, E, 0.0, 0.0);
    auto out = head.forward(context(), Mode::Eval, /*return_prob=*/true);
    const auto& pi = out.prior.value();
    const auto& pe = out.expert_prob.value();
    for (std::size_t n = 0; n < T*B; ++n)
        for (std::size_t v = 0; v < V; ++v) {
            double want = 0.0;
            for (std::size_t e = 0; e < E; ++e) want += pi[n*E + e] * pe[(n*E + e)*V + v];
            ASSERT_NEAR(out.output.value()[n*V + v], want, 1e-14);
        }
}

TEST("nn/mixture/log_output_has_floor") {
    MixtureOfSoftmaxes head(NH, L, V, E, 0.0, 0.0);
    auto prob = head.forward(context(), Mode::Eval, true).output.value();
    auto logp = head.forward(context(), Mode::Eval, false).output.value();
    for (std::size_t i = 0; i < prob.size(); ++i)
        ASSERT_NEAR(logp[i], std::log(prob[i] + 1e-8), 1e-12);
    std::vector<double> e(logp.size());
    for (std::size_t i = 0; i < logp.size(); ++i) e[i] = std::exp(logp[i]);
    for (double s : group_sums(e, V)) ASSERT_NEAR(s, 1.0, 1e-5);
}

TEST("nn/mixture/context_and_latent_dropout") {
    MixtureOfSoftmaxes head(NH, L, V, E, 0.5, 0.5);
    auto G = context();

    auto ev = head.forward(G, Mode::Eval, true);
    ASSERT_TRUE(ev.context.shares_storage(G));

    mos::set_global_seed(6);
    auto tr = head.forward(G, Mode::Train, true);
    // G' = G * (1, B, F) mask * 2
    for (std::size_t b = 0; b < B; ++b)
        for (std::size_t f = 0; f < NH; ++f) {
            const bool kept = tr.context.value()[b*NH + f] != 0.0;
            for (std::size_t t = 0; t < T; ++t) {
                const std::size_t i = (t*B + b)*NH + f;
                ASSERT_NEAR(tr.context.value()[i], kept ? 2.0 * G.value()[i] : 0.0, 1e-12);
            }
        }
    // dropout never breaks normalisation
    for (double s : group_sums(tr.output.value(), V)) ASSERT_NEAR(s, 1.0, 1e-12);
    for (double s : group_sums(tr.prior.value(), E)) ASSERT_NEAR(s, 1.0, 1e-12);
}

TEST("nn/mixture/gradients_reach_all_projections") {
    MixtureOfSoftmaxes head(NH, L, V, E, 0.0, 0.0);
    auto G = context(true);
    auto out = head.forward(G, Mode::Train, false);
    // loss = -sum of log-prob of token 0
    std::vector<double> seed(out.output.numel(), 0.0);
    for (std::size_t n = 0; n < T*B; ++n) seed[n*V] = -1.0;
    out.output.backward(seed);

    auto norm = [](const std::vector<double>& g) { double s = 0; for (double v : g) s += v*v; return s; };
    ASSERT_TRUE(norm(head.prior().weight().grad()) > 0.0);
    ASSERT_TRUE(norm(head.latent().weight().grad()) > 0.0);
    ASSERT_TRUE(norm(head.latent().bias().grad()) > 0.0);
    ASSERT_TRUE(norm(head.decoder().weight().grad()) > 0.0);
    ASSERT_TRUE(norm(G.grad()) > 0.0);
    ASSERT_TRUE(!head.prior().has_bias());
}

TEST("nn/mixture/tie_decoder_and_errors") {
    MixtureOfSoftmaxes head(NH, L, V, E);
    Variable table(std::vector<double>(V*L, 0.01), {V, L});
    head.tie_decoder(table);
    ASSERT_TRUE(head.decoder().weight().shares_storage(table));

    Variable wide(std::vector<double>(V*(L+1), 0.01), {V, L+1});
    ASSERT_THROWS(head.tie_decoder(wide), mos::ConfigurationError);
    ASSERT_THROWS(MixtureOfSoftmaxes(NH, L, V, 0), mos::ConfigurationError);
    ASSERT_THROWS(MixtureOfSoftmaxes(NH, L, V, E, 1.0, 0.0), mos::ConfigurationError);

    Variable bad(std::vector<double>(T*B*(NH+1), 0.0), {T, B, NH+1});
    ASSERT_THROWS(head.forward(bad, Mode::Eval), mos::ShapeError);
}

TEST("nn/mixture/parameter_names") {
    MixtureOfSoftmaxes head(NH, L, V, E);
    std::vector<std::string> names;
    for (auto& kv : head.named_parameters()) names.push_back(kv.first);
    std::vector<std::string> want = {"prior.weight", "latent.weight", "latent.bias", "decoder.weight", "decoder.bias"};
    ASSERT_TRUE(names == want);
    ASSERT_TRUE(head.num_parameters() == NH*E + NH*E*L + E*L + L*V + V);
}
