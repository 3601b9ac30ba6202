/**
 * @file test_ntt.cpp
 * @brief Unit tests for modular arithmetic and the negacyclic NTT
 *
 * Tests:
 * - Barrett and precomputed-quotient multiplication
 * - Primitive root properties
 * - Forward/inverse NTT identity
 * - Negacyclic polynomial multiplication against schoolbook
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include <gtest/gtest.h>

#include <random>
#include <utility>
#include <vector>

#include "vaultfhe/fhe/modular_ops.hpp"
#include "vaultfhe/fhe/ntt.hpp"
#include "vaultfhe/fhe/params.hpp"

using namespace vaultfhe::fhe;

// ============================================================================
// Test Parameters
// ============================================================================

constexpr uint64_t TEST_PRIME_SMALL = 65537;    // 2^16 + 1, n up to 2^15
constexpr uint64_t TEST_PRIME_MEDIUM = 786433;  // 3 * 2^18 + 1
constexpr uint64_t TEST_PRIME_LARGE = 0x3fffffff000001ULL;

namespace {

uint64_t mul_mod_slow(uint64_t a, uint64_t b, uint64_t q) {
    return static_cast<uint64_t>((static_cast<uint128_t>(a) * b) % q);
}

std::vector<uint64_t> schoolbook_negacyclic(const std::vector<uint64_t>& a,
                                            const std::vector<uint64_t>& b,
                                            const Modulus& mod) {
    size_t n = a.size();
    std::vector<uint64_t> c(n, 0);
    for (size_t i = 0; i < n; ++i) {
        for (size_t j = 0; j < n; ++j) {
            uint64_t prod = multiply_uint_mod(a[i], b[j], mod);
            size_t k = i + j;
            if (k < n) {
                c[k] = add_uint_mod(c[k], prod, mod);
            } else {
                c[k - n] = sub_uint_mod(c[k - n], prod, mod);
            }
        }
    }
    return c;
}

std::vector<uint64_t> random_poly(size_t n, uint64_t q, std::mt19937_64& rng) {
    std::uniform_int_distribution<uint64_t> dist(0, q - 1);
    std::vector<uint64_t> p(n);
    for (auto& c : p) c = dist(rng);
    return p;
}

} // namespace

// ============================================================================
// Modular Arithmetic Tests
// ============================================================================

TEST(ModularOpsTest, AddSubNegate) {
    Modulus q(7);
    EXPECT_EQ(add_uint_mod(3, 4, q), 0u);
    EXPECT_EQ(add_uint_mod(5, 6, q), 4u);
    EXPECT_EQ(sub_uint_mod(3, 5, q), 5u);
    EXPECT_EQ(sub_uint_mod(0, 1, q), 6u);
    EXPECT_EQ(negate_uint_mod(0, q), 0u);
    EXPECT_EQ(negate_uint_mod(2, q), 5u);
    EXPECT_EQ(from_signed(-1, q), 6u);
    EXPECT_EQ(from_signed(9, q), 2u);
}

TEST(ModularOpsTest, BarrettMatchesSlowReduction) {
    Modulus q(TEST_PRIME_LARGE);
    std::mt19937_64 rng(42);
    std::uniform_int_distribution<uint64_t> dist(0, TEST_PRIME_LARGE - 1);
    for (int i = 0; i < 10000; ++i) {
        uint64_t a = dist(rng);
        uint64_t b = dist(rng);
        ASSERT_EQ(multiply_uint_mod(a, b, q), mul_mod_slow(a, b, TEST_PRIME_LARGE));
    }
    EXPECT_EQ(multiply_uint_mod(TEST_PRIME_LARGE - 1, TEST_PRIME_LARGE - 1, q), 1u);
}

TEST(ModularOpsTest, OperandMultiplyMatchesBarrett) {
    Modulus q(TEST_PRIME_LARGE);
    std::mt19937_64 rng(7);
    std::uniform_int_distribution<uint64_t> dist(0, TEST_PRIME_LARGE - 1);
    for (int i = 0; i < 10000; ++i) {
        uint64_t x = dist(rng);
        MultiplyUIntModOperand y;
        y.set(dist(rng), q);
        ASSERT_EQ(multiply_uint_mod(x, y, q), multiply_uint_mod(x, y.operand, q));

        uint64_t lazy = multiply_uint_mod_lazy(x, y, q);
        ASSERT_LT(lazy, 2 * TEST_PRIME_LARGE);
        ASSERT_EQ(lazy % TEST_PRIME_LARGE, multiply_uint_mod(x, y.operand, q));
    }
}

TEST(ModularOpsTest, PowAndInverse) {
    Modulus q(TEST_PRIME_SMALL);
    EXPECT_EQ(pow_mod(3, 0, q), 1u);
    EXPECT_EQ(pow_mod(3, TEST_PRIME_SMALL - 1, q), 1u);  // Fermat

    for (uint64_t a : std::vector<uint64_t>{1, 2, 3, 12345, TEST_PRIME_SMALL - 1}) {
        uint64_t inv = inv_mod(a, q);
        EXPECT_EQ(multiply_uint_mod(a, inv, q), 1u);
    }
    EXPECT_THROW(inv_mod(0, q), std::invalid_argument);
}

TEST(ModularOpsTest, RejectsUnusableModulus) {
    EXPECT_THROW(Modulus(0), std::invalid_argument);
    EXPECT_THROW(Modulus(1ULL << 62), std::invalid_argument);
}

// ============================================================================
// NTT Tables
// ============================================================================

TEST(NTTTablesTest, RootIsPrimitive2nthRoot) {
    Modulus q(TEST_PRIME_MEDIUM);
    NTTTables tables(8, q);
    uint64_t n = tables.coeff_count();
    EXPECT_EQ(n, 256u);

    uint64_t root = tables.root();
    EXPECT_EQ(pow_mod(root, 2 * n, q), 1u);
    EXPECT_EQ(pow_mod(root, n, q), TEST_PRIME_MEDIUM - 1);  // root^n = -1
}

TEST(NTTTablesTest, RejectsModulusWithoutRoot) {
    // 65537 - 1 = 2^16 does not divide by 2n for n = 2^16
    EXPECT_THROW(NTTTables(16, Modulus(TEST_PRIME_SMALL)), std::invalid_argument);
}

TEST(NTTTablesTest, BitReverse) {
    EXPECT_EQ(NTTTables::bit_reverse(1, 3), 4u);
    EXPECT_EQ(NTTTables::bit_reverse(6, 3), 3u);
    EXPECT_EQ(NTTTables::bit_reverse(0, 11), 0u);
}

// ============================================================================
// Transforms
// ============================================================================

class NTTTransformTest : public ::testing::TestWithParam<std::pair<int, uint64_t>> {};

TEST_P(NTTTransformTest, ForwardInverseIdentity) {
    int log_n = GetParam().first;
    uint64_t prime = GetParam().second;
    NTTTables tables(log_n, Modulus(prime));

    std::mt19937_64 rng(log_n);
    std::vector<uint64_t> original = random_poly(tables.coeff_count(), prime, rng);
    std::vector<uint64_t> data = original;

    ntt_negacyclic(data.data(), tables);
    for (uint64_t c : data) ASSERT_LT(c, prime);

    inverse_ntt_negacyclic(data.data(), tables);
    EXPECT_EQ(data, original);
}

TEST_P(NTTTransformTest, NegacyclicMultiplication) {
    int log_n = GetParam().first;
    uint64_t prime = GetParam().second;
    Modulus q(prime);
    NTTTables tables(log_n, q);
    size_t n = tables.coeff_count();

    std::mt19937_64 rng(1000 + log_n);
    std::vector<uint64_t> a = random_poly(n, prime, rng);
    std::vector<uint64_t> b = random_poly(n, prime, rng);
    std::vector<uint64_t> expected = schoolbook_negacyclic(a, b, q);

    ntt_negacyclic(a.data(), tables);
    ntt_negacyclic(b.data(), tables);
    for (size_t i = 0; i < n; ++i) {
        a[i] = multiply_uint_mod(a[i], b[i], q);
    }
    inverse_ntt_negacyclic(a.data(), tables);

    EXPECT_EQ(a, expected);
}

INSTANTIATE_TEST_SUITE_P(
    Primes, NTTTransformTest,
    ::testing::Values(std::make_pair(3, TEST_PRIME_SMALL),
                      std::make_pair(8, TEST_PRIME_MEDIUM),
                      std::make_pair(10, TEST_PRIME_LARGE)));

TEST(NTTNegacyclicTest, XTimesXToTheNMinusOneIsMinusOne) {
    Modulus q(TEST_PRIME_LARGE);
    NTTTables tables(11, q);
    size_t n = tables.coeff_count();

    std::vector<uint64_t> x(n, 0), x_top(n, 0);
    x[1] = 1;
    x_top[n - 1] = 1;

    ntt_negacyclic(x.data(), tables);
    ntt_negacyclic(x_top.data(), tables);
    for (size_t i = 0; i < n; ++i) {
        x[i] = multiply_uint_mod(x[i], x_top[i], q);
    }
    inverse_ntt_negacyclic(x.data(), tables);

    // x * x^(n-1) = x^n = -1 in Z_q[x]/(x^n + 1)
    EXPECT_EQ(x[0], TEST_PRIME_LARGE - 1);
    for (size_t i = 1; i < n; ++i) {
        ASSERT_EQ(x[i], 0u);
    }
}

// ============================================================================
// Scheme Context
// ============================================================================

TEST(SchemeContextTest, DefaultParameters) {
    auto ctx = SchemeContext::default_context();
    ASSERT_NE(ctx, nullptr);
    EXPECT_EQ(ctx->n(), 2048u);
    EXPECT_EQ(ctx->coeff_modulus().value(), TEST_PRIME_LARGE);
    EXPECT_EQ(ctx->plain_modulus(), 256u);
    EXPECT_EQ(ctx->delta(), TEST_PRIME_LARGE / 256);
    EXPECT_EQ(ctx->decomposition_count(), 4u);  // ceil(54 / 16)
    EXPECT_EQ(ctx->base_power(0), 1u);
    EXPECT_EQ(ctx->base_power(1), 65536u);

    // Shared, built once
    EXPECT_EQ(ctx.get(), SchemeContext::default_context().get());
}
