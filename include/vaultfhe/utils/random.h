/**
 * @file random.h
 * @brief Secure random number generation
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#ifndef VAULTFHE_UTILS_RANDOM_H
#define VAULTFHE_UTILS_RANDOM_H

#include "vaultfhe/core/security.h"
#include "vaultfhe/core/types.h"

#include <array>
#include <cstdint>
#include <limits>

namespace vaultfhe {

/**
 * @brief Buffered CSPRNG engine over vaultfhe_random_bytes
 *
 * Satisfies UniformRandomBitGenerator so it can drive the standard
 * distributions used for key and noise sampling. Not thread-safe; create
 * one per call site. The buffer is wiped on destruction.
 *
 * @throws ConfigurationError if the platform CSPRNG fails
 */
class SecureRandom {
public:
    using result_type = uint64_t;

    SecureRandom();
    ~SecureRandom();

    SecureRandom(const SecureRandom&) = delete;
    SecureRandom& operator=(const SecureRandom&) = delete;

    static constexpr result_type min() { return 0; }
    static constexpr result_type max() { return std::numeric_limits<result_type>::max(); }

    result_type operator()();

    /**
     * @brief Uniform value in [0, bound) without modulo bias
     */
    uint64_t uniform(uint64_t bound);

private:
    void refill();

    static constexpr size_t kBufferWords = 512;
    std::array<uint64_t, kBufferWords> buffer_;
    size_t position_;
};

ByteVec randomBytes(size_t len);
uint64_t randomU64();

} // namespace vaultfhe

#endif // VAULTFHE_UTILS_RANDOM_H
