#include "test_framework.hpp"
#include "mos/core/errors.hpp"
#include "mos/nn/layers/embedding.hpp"
#include "mos/nn/layers/locked_dropout.hpp"
#include "mos/ops/reduce.hpp"
#include "mos/ops/rng_extras.hpp"

#include <cmath>
#include <stdexcept>
#include <vector>

using mos::Variable;
using mos::nn::Embedding;
using mos::nn::LockedDropout;
using mos::nn::Mode;
using mos::nn::Tokens;
using mos::nn::embedded_dropout;

static Variable ones(std::size_t T, std::size_t B, std::size_t F) {
    return Variable(std::vector<double>(T * B * F, 1.0), {T, B, F}, /*requires_grad=*/true);
}

// ---- locked dropout -------------------------------------------------------

TEST("nn/locked_dropout/zero_p_and_eval_return_input") {
    auto x = ones(4, 3, 5);
    LockedDropout none(0.0);
    ASSERT_TRUE(none.forward(x, Mode::Train).shares_storage(x));
    LockedDropout half(0.5);
    ASSERT_TRUE(half.forward(x, Mode::Eval).shares_storage(x));
}

TEST("nn/locked_dropout/mask_shared_across_time") {
    mos::set_global_seed(11);
    const std::size_t T = 6, B = 3, F = 8;
    Variable x(std::vector<double>(T * B * F), {T, B, F});
    auto& xv = x.mutable_value();
    for (std::size_t i = 0; i < xv.size(); ++i) xv[i] = 0.1 + double(i % 7);

    LockedDropout d(0.5);
    auto y = d.forward(x, Mode::Train);
    std::size_t dropped = 0;
    for (std::size_t b = 0; b < B; ++b)
        for (std::size_t f = 0; f < F; ++f) {
            const bool kept0 = y.value()[b * F + f] != 0.0;
            if (!kept0) ++dropped;
            for (std::size_t t = 0; t < T; ++t) {
                const std::size_t i = (t * B + b) * F + f;
                ASSERT_TRUE((y.value()[i] != 0.0) == kept0);
                if (kept0) ASSERT_NEAR(y.value()[i], 2.0 * xv[i], 1e-12);
            }
        }
    // 24 units at p = 0.5
    ASSERT_TRUE(dropped > 0 && dropped < B * F);
}

TEST("nn/locked_dropout/mc_mode_skips_rescale") {
    auto x = ones(3, 4, 5);
    LockedDropout d(0.25);
    mos::set_global_seed(5);
    auto yt = d.forward(x, Mode::Train);
    mos::set_global_seed(5);
    auto ym = d.forward(x, Mode::EvalMonteCarlo);
    for (std::size_t i = 0; i < yt.value().size(); ++i) {
        ASSERT_TRUE(ym.value()[i] == 0.0 || ym.value()[i] == 1.0);
        ASSERT_NEAR(yt.value()[i], ym.value()[i] / 0.75, 1e-12);
    }
}

TEST("nn/locked_dropout/gradient_follows_mask") {
    mos::set_global_seed(3);
    auto x = ones(2, 2, 3);
    auto y = LockedDropout::apply(x, 0.5, Mode::Train);
    mos::reduce_sum(y).backward();
    for (std::size_t i = 0; i < y.value().size(); ++i)
        ASSERT_NEAR(x.grad()[i], y.value()[i], 1e-12);
}

TEST("nn/locked_dropout/errors") {
    ASSERT_THROWS(LockedDropout(1.0), mos::ConfigurationError);
    ASSERT_THROWS(LockedDropout(-0.1), mos::ConfigurationError);
    LockedDropout d(0.5);
    Variable flat(std::vector<double>(6, 1.0), {2, 3});
    ASSERT_THROWS(d.forward(flat, Mode::Train), mos::ShapeError);
    ASSERT_THROWS(d.forward(flat, Mode::Eval), mos::ShapeError);
}

// ---- embedding dropout ----------------------------------------------------

static Tokens sample_tokens() {
    // T = 4, B = 3, heavy repetition of a few ids
    return Tokens({0, 1, 2,
                   2, 1, 0,
                   3, 3, 3,
                   0, 5, 1}, 4, 3);
}

TEST("nn/embedding/lookup_shape_and_values") {
    Embedding emb(6, 4);
    auto tok = sample_tokens();
    auto y = emb.forward(tok);
    ASSERT_TRUE((y.shape() == std::vector<std::size_t>{4, 3, 4}));
    const auto& W = emb.weight().value();
    for (std::size_t p = 0; p < tok.ids.size(); ++p)
        for (std::size_t d = 0; d < 4; ++d)
            ASSERT_NEAR(y.value()[p * 4 + d], W[tok.ids[p] * 4 + d], 0.0);
}

TEST("nn/embedding/dropout_eval_and_zero_p_are_plain_lookup") {
    Embedding emb(6, 4);
    auto tok = sample_tokens();
    auto plain = emb.forward(tok);
    ASSERT_TRUE(embedded_dropout(emb, tok, 0.5, Mode::Eval).value() == plain.value());
    ASSERT_TRUE(embedded_dropout(emb, tok, 0.0, Mode::Train).value() == plain.value());
}

TEST("nn/embedding/dropout_drops_whole_vocabulary_rows") {
    Embedding emb(6, 4);
    const auto before = emb.weight().value();
    auto tok = sample_tokens();
    const double p = 0.5;

    for (unsigned seed = 1; seed <= 8; ++seed) {
        mos::set_global_seed(seed);
        auto y = embedded_dropout(emb, tok, p, Mode::Train);
        // every occurrence of a token is either zero or 2x its row
        std::vector<int> state(6, -1);
        for (std::size_t pos = 0; pos < tok.ids.size(); ++pos) {
            const std::size_t id = tok.ids[pos];
            const bool zero = y.value()[pos * 4] == 0.0;
            if (state[id] == -1) state[id] = zero ? 0 : 1;
            ASSERT_TRUE(state[id] == (zero ? 0 : 1));
            for (std::size_t d = 0; d < 4; ++d) {
                const double want = zero ? 0.0 : before[id * 4 + d] / (1.0 - p);
                ASSERT_NEAR(y.value()[pos * 4 + d], want, 1e-12);
            }
        }
    }
    // the stored table is untouched
    ASSERT_TRUE(emb.weight().value() == before);
}

TEST("nn/embedding/dropout_mc_mode_no_rescale") {
    Embedding emb(6, 4);
    auto tok = sample_tokens();
    mos::set_global_seed(21);
    auto yt = embedded_dropout(emb, tok, 0.3, Mode::Train);
    mos::set_global_seed(21);
    auto ym = embedded_dropout(emb, tok, 0.3, Mode::EvalMonteCarlo);
    for (std::size_t i = 0; i < yt.value().size(); ++i)
        ASSERT_NEAR(yt.value()[i] * 0.7, ym.value()[i], 1e-12);
}

TEST("nn/embedding/dropout_gradient_reaches_table") {
    Embedding emb(6, 4);
    auto tok = sample_tokens();
    mos::set_global_seed(2);
    auto y = embedded_dropout(emb, tok, 0.5, Mode::Train);
    mos::reduce_sum(y).backward();
    const auto& g = emb.weight().grad();
    // token 3 appears three times; its row grad is 0 (dropped) or 3 / (1 - p)
    for (std::size_t d = 0; d < 4; ++d)
        ASSERT_TRUE(g[3 * 4 + d] == 0.0 || std::fabs(g[3 * 4 + d] - 6.0) < 1e-12);
    // token 4 never appears
    for (std::size_t d = 0; d < 4; ++d) ASSERT_NEAR(g[4 * 4 + d], 0.0, 0.0);
}

TEST("nn/embedding/errors") {
    Embedding emb(6, 4);
    Tokens bad_id({0, 6}, 1, 2);
    ASSERT_THROWS(emb.forward(bad_id), std::out_of_range);
    ASSERT_THROWS(embedded_dropout(emb, bad_id, 0.5, Mode::Train), std::out_of_range);
    Tokens bad_shape({0, 1, 2}, 2, 2);
    ASSERT_THROWS(emb.forward(bad_shape), mos::ShapeError);
    ASSERT_THROWS(embedded_dropout(emb, sample_tokens(), 1.0, Mode::Train), mos::ConfigurationError);
}
