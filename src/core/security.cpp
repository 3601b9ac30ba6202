/**
 * @file security.cpp
 * @brief Security Primitives Implementation
 *
 * - Secure memory wiping and constant-time comparison
 * - Platform-specific CSPRNG
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "vaultfhe/core/security.h"
#include <cstring>
#include <cstdint>

#include <sys/types.h>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#if defined(__linux__)
// sys/random.h requires glibc 2.25+, use the raw syscall instead
#include <sys/syscall.h>
#ifdef SYS_getrandom
#define VAULTFHE_HAS_GETRANDOM_SYSCALL 1
static inline ssize_t vaultfhe_getrandom(void* buf, size_t len, unsigned int flags) {
    return syscall(SYS_getrandom, buf, len, flags);
}
#endif
#endif

// ============================================================================
// Compiler Memory Barrier
// ============================================================================

#if defined(__GNUC__) || defined(__clang__)
#define COMPILER_BARRIER() __asm__ __volatile__("" ::: "memory")
#else
#define COMPILER_BARRIER()
#endif

namespace {

// Volatile function pointer to prevent optimization
using SecureZeroFn = void (*volatile)(void*, size_t);

void secure_zero_impl(void* ptr, size_t len) {
    volatile unsigned char* p = static_cast<volatile unsigned char*>(ptr);
    while (len--) {
        *p++ = 0;
    }
}

SecureZeroFn secure_zero_ptr = secure_zero_impl;

int read_urandom(unsigned char* p, size_t remaining) {
    int fd = open("/dev/urandom", O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return -1;
    }

    while (remaining > 0) {
        ssize_t ret = read(fd, p, remaining);
        if (ret < 0) {
            if (errno == EINTR) continue;
            close(fd);
            return -1;
        }
        if (ret == 0) {
            close(fd);
            return -1;
        }
        p += ret;
        remaining -= static_cast<size_t>(ret);
    }
    close(fd);
    return 0;
}

} // namespace

extern "C" {

void vaultfhe_secure_zero(void* ptr, size_t len) {
    if (!ptr || len == 0) return;
    secure_zero_ptr(ptr, len);
    COMPILER_BARRIER();
}

int vaultfhe_secure_compare(const void* a, const void* b, size_t len) {
    if (!a || !b) return -1;

    const volatile unsigned char* pa = static_cast<const volatile unsigned char*>(a);
    const volatile unsigned char* pb = static_cast<const volatile unsigned char*>(b);

    volatile unsigned char diff = 0;
    for (size_t i = 0; i < len; i++) {
        diff |= static_cast<unsigned char>(pa[i] ^ pb[i]);
    }

    COMPILER_BARRIER();
    return diff;
}

vaultfhe_error_t vaultfhe_random_bytes(uint8_t* buf, size_t len) {
    if (!buf) return VAULTFHE_ERROR_INVALID_PARAM;
    if (len == 0) return VAULTFHE_SUCCESS;

    unsigned char* p = buf;
    size_t remaining = len;

#ifdef VAULTFHE_HAS_GETRANDOM_SYSCALL
    // getrandom syscall (kernel 3.17+)
    while (remaining > 0) {
        ssize_t ret = vaultfhe_getrandom(p, remaining, 0);
        if (ret < 0) {
            if (errno == EINTR) continue;
            break;  // ENOSYS or other failure: use /dev/urandom
        }
        p += ret;
        remaining -= static_cast<size_t>(ret);
    }

    if (remaining == 0) return VAULTFHE_SUCCESS;

    p = buf;
    remaining = len;
#endif

    return read_urandom(p, remaining) == 0 ? VAULTFHE_SUCCESS : VAULTFHE_ERROR_RANDOM_FAILED;
}

} // extern "C"
