// tests/test_ops_tensor.cpp
#include "test_framework.hpp"
#include "mos/core/variables.hpp"
#include "mos/ops/elementwise.hpp"
#include "mos/ops/indexing.hpp"
#include "mos/ops/linalg.hpp"
#include "mos/ops/reduce.hpp"
#include "mos/ops/reshape.hpp"
#include "mos/ops/rng_extras.hpp"
#include "mos/ops/stats.hpp"
#include "mos/ops/tensor_utils.hpp"

#include <cmath>
#include <random>
#include <stdexcept>
#include <thread>
#include <vector>

using mos::Variable;
using mos::Slice;

static std::vector<double> randv(std::size_t n, unsigned seed) {
    std::mt19937 rng(seed);
    std::uniform_real_distribution<double> d(-1.0, 1.0);
    std::vector<double> v(n);
    for (auto& x : v) x = d(rng);
    return v;
}

TEST("ops/matmul/2d_matches_reference_and_grads") {
    // A:[2,3] B:[3,2]
    std::vector<double> a = {1,2,3, 4,5,6};
    std::vector<double> b = {7,8, 9,10, 11,12};
    Variable A(a, {2,3}), B(b, {3,2});
    auto C = mos::matmul(A, B);
    ASSERT_TRUE((C.shape() == std::vector<std::size_t>{2,2}));
    ASSERT_NEAR(C.value()[0], 58, 1e-12);
    ASSERT_NEAR(C.value()[1], 64, 1e-12);
    ASSERT_NEAR(C.value()[2], 139, 1e-12);
    ASSERT_NEAR(C.value()[3], 154, 1e-12);

    C.backward(std::vector<double>(4, 1.0));
    // dA[i,k] = sum_j B[k,j]; dB[k,j] = sum_i A[i,k]
    ASSERT_NEAR(A.grad()[0], 15, 1e-12);
    ASSERT_NEAR(A.grad()[4], 19, 1e-12);
    ASSERT_NEAR(B.grad()[0], 5, 1e-12);
    ASSERT_NEAR(B.grad()[5], 9, 1e-12);
}

TEST("ops/matmul/batched_broadcast_rhs") {
    // X:[T=2,B=2,I=3] @ W:[3,4] == per-slice 2-D products
    const auto xv = randv(12, 1), wv = randv(12, 2);
    Variable X(xv, {2,2,3}), W(wv, {3,4});
    auto Y = mos::matmul(X, W);
    ASSERT_TRUE((Y.shape() == std::vector<std::size_t>{2,2,4}));
    for (std::size_t r = 0; r < 4; ++r)
        for (std::size_t j = 0; j < 4; ++j) {
            double s = 0;
            for (std::size_t k = 0; k < 3; ++k) s += xv[r*3 + k] * wv[k*4 + j];
            ASSERT_NEAR(Y.value()[r*4 + j], s, 1e-12);
        }

    mos::reduce_sum(Y).backward();
    // W is shared by every batch: dW[k,j] = sum over all rows of X[:,k]
    for (std::size_t k = 0; k < 3; ++k) {
        double s = 0;
        for (std::size_t r = 0; r < 4; ++r) s += xv[r*3 + k];
        for (std::size_t j = 0; j < 4; ++j) ASSERT_NEAR(W.grad()[k*4 + j], s, 1e-12);
    }
}

TEST("ops/transpose/last_two_dims") {
    Variable X({1,2,3, 4,5,6}, {2,3});
    auto Y = mos::t(X);
    ASSERT_TRUE((Y.shape() == std::vector<std::size_t>{3,2}));
    std::vector<double> want = {1,4, 2,5, 3,6};
    ASSERT_ALL_NEAR(Y.value(), want, 0.0);
    Y.backward({1,2,3,4,5,6});
    // grad lands back in X layout
    std::vector<double> g = {1,3,5, 2,4,6};
    ASSERT_ALL_NEAR(X.grad(), g, 0.0);
}

TEST("ops/transpose/t_swaps_last_two_of_rank3") {
    Variable X({0,1,2, 3,4,5,  6,7,8, 9,10,11}, {2,2,3});
    auto Y = mos::t(X);
    ASSERT_TRUE((Y.shape() == std::vector<std::size_t>{2,3,2}));
    std::vector<double> want = {0,3, 1,4, 2,5,  6,9, 7,10, 8,11};
    ASSERT_ALL_NEAR(Y.value(), want, 0.0);
    ASSERT_THROWS(mos::t(Variable({1,2,3}, {3})), std::invalid_argument);
}

TEST("ops/stats/softmax_rows_sum_to_one_and_grad") {
    const auto xv = randv(12, 3);
    Variable X(xv, {3,4});
    auto Y = mos::softmax(X, -1);
    for (std::size_t r = 0; r < 3; ++r) {
        double s = 0;
        for (std::size_t j = 0; j < 4; ++j) s += Y.value()[r*4 + j];
        ASSERT_NEAR(s, 1.0, 1e-12);
    }
    // d/dx of y[0,1] = y1 (delta - y_j)
    std::vector<double> seed(12, 0.0); seed[1] = 1.0;
    const auto y = Y.value();
    Y.backward(seed);
    for (std::size_t j = 0; j < 4; ++j) {
        double want = y[1] * ((j == 1 ? 1.0 : 0.0) - y[j]);
        ASSERT_NEAR(X.grad()[j], want, 1e-12);
    }
    for (std::size_t j = 4; j < 12; ++j) ASSERT_NEAR(X.grad()[j], 0.0, 1e-15);
}

TEST("ops/stats/softmax_large_logits_stable") {
    Variable X({1000.0, 1001.0, 1002.0}, {1,3}, false);
    auto Y = mos::softmax(X);
    double s = 0; for (double v : Y.value()) { ASSERT_TRUE(std::isfinite(v)); s += v; }
    ASSERT_NEAR(s, 1.0, 1e-12);
    auto L = mos::logsumexp(X, {1});
    ASSERT_NEAR(L.value()[0], 1002.0 + std::log(1.0 + std::exp(-1.0) + std::exp(-2.0)), 1e-9);
}

TEST("ops/reduce/sum_axes_and_max_ties") {
    Variable X({1,5,5, -1,0,2}, {2,3});
    auto S = mos::reduce_sum(X, {0});
    ASSERT_TRUE((S.shape() == std::vector<std::size_t>{3}));
    ASSERT_ALL_NEAR(S.value(), (std::vector<double>{0,5,7}), 0.0);

    auto M = mos::reduce_max(X, {1}, /*keepdims=*/true);
    ASSERT_TRUE((M.shape() == std::vector<std::size_t>{2,1}));
    M.backward({1.0, 1.0});
    ASSERT_NEAR(X.grad()[1], 0.5, 1e-12);
    ASSERT_NEAR(X.grad()[2], 0.5, 1e-12);
    ASSERT_NEAR(X.grad()[5], 1.0, 1e-12);
    ASSERT_THROWS(mos::reduce_sum(X, {2}), std::invalid_argument);
}

TEST("ops/reshape/view_concat_and_at") {
    Variable X({0,1,2,3,4,5}, {1,2,3});
    auto R = mos::reshape(X, {3,2});
    ASSERT_TRUE((R.shape() == std::vector<std::size_t>{3,2}));
    ASSERT_THROWS(mos::reshape(X, {4,2}), std::runtime_error);

    Variable Y({6,7,8,9,10,11}, {1,2,3});
    auto C = mos::concat({X, Y}, 0);
    ASSERT_TRUE((C.shape() == std::vector<std::size_t>{2,2,3}));
    ASSERT_NEAR(C.value()[6], 6.0, 0.0);

    // C[1, :, 1:3]
    auto S = mos::at(C, {Slice::index(1), Slice::all(), Slice::range(1, 3)});
    ASSERT_TRUE((S.shape() == std::vector<std::size_t>{1,2,2}));
    ASSERT_ALL_NEAR(S.value(), (std::vector<double>{7,8,10,11}), 0.0);

    mos::reduce_sum(S).backward();
    ASSERT_ALL_NEAR(X.grad(), std::vector<double>(6, 0.0), 0.0);
    ASSERT_ALL_NEAR(Y.grad(), (std::vector<double>{0,1,1, 0,1,1}), 0.0);
}

TEST("ops/indexing/embedding_lookup_gathers_and_scatters") {
    // W:[4,2]
    Variable W({0,1, 10,11, 20,21, 30,31}, {4,2});
    std::vector<std::size_t> ids = {2, 0, 2};
    auto E = mos::embedding_lookup(W, ids, {3, 1});
    ASSERT_TRUE((E.shape() == std::vector<std::size_t>{3,1,2}));
    ASSERT_ALL_NEAR(E.value(), (std::vector<double>{20,21, 0,1, 20,21}), 0.0);

    E.backward(std::vector<double>(6, 1.0));
    // row 2 picked twice
    ASSERT_ALL_NEAR(W.grad(), (std::vector<double>{1,1, 0,0, 2,2, 0,0}), 0.0);

    ASSERT_THROWS(mos::embedding_lookup(W, {4}, {1}), std::out_of_range);
    ASSERT_THROWS(mos::embedding_lookup(W, {1, 2}, {3}), std::invalid_argument);
}

TEST("ops/rng/bernoulli_mask_seeded_and_scaled") {
    mos::set_global_seed(1234);
    auto m1 = mos::bernoulli_mask({50, 4}, 0.7, 1.0 / 0.7);
    mos::set_global_seed(1234);
    auto m2 = mos::bernoulli_mask({50, 4}, 0.7, 1.0 / 0.7);
    ASSERT_TRUE(m1.value() == m2.value());
    ASSERT_TRUE(!m1.requires_grad());
    std::size_t kept = 0;
    for (double v : m1.value()) {
        ASSERT_TRUE(v == 0.0 || std::fabs(v - 1.0 / 0.7) < 1e-15);
        if (v != 0.0) ++kept;
    }
    // 200 draws at 0.7
    ASSERT_TRUE(kept > 100 && kept < 190);

    // the stream moves on: a second draw is a different mask
    auto next = mos::bernoulli_mask({50, 4}, 0.7, 1.0 / 0.7);
    ASSERT_TRUE(next.value() != m1.value());
    ASSERT_THROWS(mos::bernoulli_mask({2}, 1.5), std::invalid_argument);
    ASSERT_TRUE(mos::get_global_seed() == 1234);
}

TEST("ops/rng/fresh_threads_draw_distinct_streams") {
    std::vector<double> a, b;
    std::thread ta([&]{ a = mos::bernoulli_mask({64}, 0.5).value(); });
    ta.join();
    std::thread tb([&]{ b = mos::bernoulli_mask({64}, 0.5).value(); });
    tb.join();
    ASSERT_TRUE(a.size() == 64 && b.size() == 64);
    ASSERT_TRUE(a != b);

    // an explicit seed still reproduces across threads
    std::thread tc([&]{ mos::set_global_seed(77); a = mos::bernoulli_mask({64}, 0.5).value(); });
    tc.join();
    std::thread td([&]{ mos::set_global_seed(77); b = mos::bernoulli_mask({64}, 0.5).value(); });
    td.join();
    ASSERT_TRUE(a == b);
}
