/**
 * @file keygen.cpp
 * @brief Key types and key pair generation
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "vaultfhe/fhe/keys.hpp"
#include "vaultfhe/core/errors.hpp"
#include "vaultfhe/utils/random.h"

#include <utility>

namespace vaultfhe {
namespace fhe {

// ============================================================================
// ClientKey
// ============================================================================

ClientKey::ClientKey(SchemeContextPtr context, uint64_t key_id, Poly secret)
    : context_(std::move(context))
    , key_id_(key_id)
    , secret_(std::move(secret))
{}

ClientKey::~ClientKey() {
    secret_.wipe();
}

ClientKey& ClientKey::operator=(const ClientKey& other) {
    if (this != &other) {
        secret_.wipe();
        context_ = other.context_;
        key_id_ = other.key_id_;
        secret_ = other.secret_;
    }
    return *this;
}

ClientKey::ClientKey(ClientKey&& other) noexcept
    : context_(std::move(other.context_))
    , key_id_(other.key_id_)
    , secret_(std::move(other.secret_))
{
    other.key_id_ = 0;
    other.secret_ = Poly();
}

ClientKey& ClientKey::operator=(ClientKey&& other) noexcept {
    if (this != &other) {
        secret_.wipe();
        context_ = std::move(other.context_);
        key_id_ = other.key_id_;
        secret_ = std::move(other.secret_);
        other.key_id_ = 0;
        other.secret_ = Poly();
    }
    return *this;
}

// ============================================================================
// ServerKey
// ============================================================================

ServerKey::ServerKey(SchemeContextPtr context, uint64_t key_id, uint32_t base_bits,
                     std::vector<RelinKeyComponent> relin_keys)
    : context_(std::move(context))
    , key_id_(key_id)
    , base_bits_(base_bits)
    , relin_keys_(std::move(relin_keys))
{}

// ============================================================================
// Key Generation
// ============================================================================

KeyPair generate_keys() {
    return generate_keys(SchemeContext::default_context());
}

KeyPair generate_keys(const SchemeContextPtr& context) {
    if (!context) {
        throw ConfigurationError("key generation requires a scheme context");
    }

    const SchemeContext* ctx = context.get();
    SecureRandom rng;
    uint64_t key_id = rng();

    // s: uniform ternary, stored in NTT form
    Poly s(ctx);
    sample_ternary(&s, rng);
    s.ntt_transform();

    Poly s_squared = s;
    s_squared *= s;

    std::vector<RelinKeyComponent> relin_keys;
    relin_keys.reserve(ctx->decomposition_count());

    for (size_t i = 0; i < ctx->decomposition_count(); ++i) {
        RelinKeyComponent component;

        component.k1 = Poly(ctx);
        sample_uniform(&component.k1, rng);
        component.k1.ntt_transform();

        Poly e(ctx);
        sample_gaussian(&e, rng);
        e.ntt_transform();

        // k0 = -(a*s + e) + base^i * s^2
        component.k0 = component.k1;
        component.k0 *= s;
        component.k0 += e;
        component.k0.negate();

        Poly scaled = s_squared;
        scaled.multiply_scalar(ctx->base_power(i));
        component.k0 += scaled;

        e.wipe();
        scaled.wipe();
        relin_keys.push_back(std::move(component));
    }
    s_squared.wipe();

    KeyPair pair;
    pair.client_key = ClientKey(context, key_id, std::move(s));
    pair.server_key = ServerKey(context, key_id, ctx->parameters().decomposition_bit_count,
                                std::move(relin_keys));
    return pair;
}

bool is_paired(const ClientKey& client_key, const ServerKey& server_key) noexcept {
    if (client_key.empty() || server_key.empty()) {
        return false;
    }
    const ParameterSet& cp = client_key.context()->parameters();
    return client_key.key_id() == server_key.key_id() &&
           server_key.context()->matches(cp.log_n, cp.coeff_modulus, cp.plain_modulus);
}

} // namespace fhe
} // namespace vaultfhe
