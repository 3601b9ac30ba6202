/**
 * @file random.cpp
 * @brief Buffered CSPRNG engine
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "vaultfhe/utils/random.h"
#include "vaultfhe/core/errors.hpp"

namespace vaultfhe {

SecureRandom::SecureRandom() : position_(kBufferWords) {
    refill();
}

SecureRandom::~SecureRandom() {
    vaultfhe_secure_zero(buffer_.data(), sizeof(buffer_));
}

void SecureRandom::refill() {
    vaultfhe_error_t rc = vaultfhe_random_bytes(reinterpret_cast<uint8_t*>(buffer_.data()),
                                                sizeof(buffer_));
    if (rc != VAULTFHE_SUCCESS) {
        throw ConfigurationError(std::string("platform CSPRNG unavailable: ") +
                                 vaultfhe_error_string(rc));
    }
    position_ = 0;
}

SecureRandom::result_type SecureRandom::operator()() {
    if (position_ == kBufferWords) {
        refill();
    }
    uint64_t value = buffer_[position_];
    buffer_[position_++] = 0;
    return value;
}

uint64_t SecureRandom::uniform(uint64_t bound) {
    if (bound <= 1) return 0;

    // Rejection sampling: discard the top partial range of 2^64
    uint64_t limit = max() - (max() % bound);
    uint64_t value;
    do {
        value = (*this)();
    } while (value >= limit);
    return value % bound;
}

ByteVec randomBytes(size_t len) {
    ByteVec out(len);
    if (len == 0) return out;

    vaultfhe_error_t rc = vaultfhe_random_bytes(out.data(), len);
    if (rc != VAULTFHE_SUCCESS) {
        throw ConfigurationError(std::string("platform CSPRNG unavailable: ") +
                                 vaultfhe_error_string(rc));
    }
    return out;
}

uint64_t randomU64() {
    ByteVec bytes = randomBytes(sizeof(uint64_t));
    uint64_t value = 0;
    for (size_t i = 0; i < bytes.size(); ++i) {
        value |= static_cast<uint64_t>(bytes[i]) << (8 * i);
    }
    return value;
}

} // namespace vaultfhe
