/**
 * @file byte_order.h
 * @brief Little-endian byte stream helpers for binary serialization
 *
 * Architecture Decision:
 * - Every multi-byte integer in a vaultfhe blob is little-endian
 * - Readers never trust lengths: each read is bounds-checked
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef VAULTFHE_UTILS_BYTE_ORDER_H
#define VAULTFHE_UTILS_BYTE_ORDER_H

#include "vaultfhe/core/types.h"
#include <cstdint>
#include <cstddef>
#include <string>
#include <utility>

namespace vaultfhe {
namespace byte_order {

inline void store_le32(uint8_t* out, uint32_t value) {
    for (int i = 0; i < 4; ++i) {
        out[i] = static_cast<uint8_t>(value >> (8 * i));
    }
}

inline void store_le64(uint8_t* out, uint64_t value) {
    for (int i = 0; i < 8; ++i) {
        out[i] = static_cast<uint8_t>(value >> (8 * i));
    }
}

inline uint32_t load_le32(const uint8_t* in) {
    uint32_t value = 0;
    for (int i = 0; i < 4; ++i) {
        value |= static_cast<uint32_t>(in[i]) << (8 * i);
    }
    return value;
}

inline uint64_t load_le64(const uint8_t* in) {
    uint64_t value = 0;
    for (int i = 0; i < 8; ++i) {
        value |= static_cast<uint64_t>(in[i]) << (8 * i);
    }
    return value;
}

/**
 * @brief Appends little-endian fields to a byte vector
 */
class ByteWriter {
public:
    explicit ByteWriter(size_t reserve = 0) { out_.reserve(reserve); }

    void put_tag(const char (&tag)[5]) {
        out_.insert(out_.end(), tag, tag + 4);
    }

    void put_u32(uint32_t value) {
        size_t pos = out_.size();
        out_.resize(pos + 4);
        store_le32(out_.data() + pos, value);
    }

    void put_u64(uint64_t value) {
        size_t pos = out_.size();
        out_.resize(pos + 8);
        store_le64(out_.data() + pos, value);
    }

    void put_u64_array(const uint64_t* values, size_t count) {
        size_t pos = out_.size();
        out_.resize(pos + count * 8);
        for (size_t i = 0; i < count; ++i) {
            store_le64(out_.data() + pos + i * 8, values[i]);
        }
    }

    ByteVec take() { return std::move(out_); }

private:
    ByteVec out_;
};

/**
 * @brief Bounds-checked little-endian reader
 *
 * ErrorT must be constructible from (context, message); it is thrown on
 * underflow so each caller reports in its own taxonomy.
 */
template <typename ErrorT>
class ByteReader {
public:
    ByteReader(const ByteVec& data, std::string context)
        : data_(data), pos_(0), context_(std::move(context)) {}

    bool take_tag(const char (&tag)[5]) {
        require(4);
        bool match = data_[pos_] == static_cast<uint8_t>(tag[0]) &&
                     data_[pos_ + 1] == static_cast<uint8_t>(tag[1]) &&
                     data_[pos_ + 2] == static_cast<uint8_t>(tag[2]) &&
                     data_[pos_ + 3] == static_cast<uint8_t>(tag[3]);
        pos_ += 4;
        return match;
    }

    uint32_t get_u32() {
        require(4);
        uint32_t value = load_le32(data_.data() + pos_);
        pos_ += 4;
        return value;
    }

    uint64_t get_u64() {
        require(8);
        uint64_t value = load_le64(data_.data() + pos_);
        pos_ += 8;
        return value;
    }

    void get_u64_array(uint64_t* out, size_t count) {
        if (count > remaining() / 8) {
            fail("truncated data");
        }
        for (size_t i = 0; i < count; ++i) {
            out[i] = load_le64(data_.data() + pos_ + i * 8);
        }
        pos_ += count * 8;
    }

    size_t remaining() const noexcept { return data_.size() - pos_; }

    /**
     * @brief Reject trailing bytes after the last field
     */
    void expect_end() {
        if (pos_ != data_.size()) {
            fail(std::to_string(data_.size() - pos_) + " trailing bytes");
        }
    }

    [[noreturn]] void fail(const std::string& msg) const {
        throw ErrorT(context_, msg);
    }

private:
    void require(size_t n) {
        if (remaining() < n) {
            fail("truncated data");
        }
    }

    const ByteVec& data_;
    size_t pos_;
    std::string context_;
};

} // namespace byte_order
} // namespace vaultfhe

#endif // VAULTFHE_UTILS_BYTE_ORDER_H
