#pragma once
// Copyright (c) 2024-2026 The ELMS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/stream.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace core {

// ===================================================================
// CompactSize encoding
// ===================================================================
//
// Encoding scheme:
//   0   .. 252              -> 1 byte   (value itself)
//   253 .. 0xFFFF           -> 0xFD + 2 bytes LE
//   0x10000 .. 0xFFFF'FFFF  -> 0xFE + 4 bytes LE
//   0x1'0000'0000 ..        -> 0xFF + 8 bytes LE
// ===================================================================

/// Number of bytes ser_write_compact_size() emits for @p n.
[[nodiscard]] constexpr size_t compact_size_len(uint64_t n) noexcept {
    if (n < 253) return 1;
    if (n <= 0xFFFF) return 3;
    if (n <= 0xFFFFFFFFULL) return 5;
    return 9;
}

/// Write a CompactSize-encoded unsigned integer.
template <typename Stream>
void ser_write_compact_size(Stream& s, uint64_t n) {
    uint8_t buf[9];
    size_t len = 0;
    if (n < 253) {
        buf[len++] = static_cast<uint8_t>(n);
    } else {
        int width = 8;
        if (n <= 0xFFFF) {
            buf[len++] = 0xFD;
            width = 2;
        } else if (n <= 0xFFFFFFFFULL) {
            buf[len++] = 0xFE;
            width = 4;
        } else {
            buf[len++] = 0xFF;
        }
        for (int i = 0; i < width; ++i) {
            buf[len++] = static_cast<uint8_t>((n >> (8 * i)) & 0xFF);
        }
    }
    s.write(std::span<const uint8_t>(buf, len));
}

// ===================================================================
// Primitive serializers
// ===================================================================

template <typename Stream>
inline void ser_write_u8(Stream& s, uint8_t v) {
    s.write(std::span<const uint8_t>(&v, 1));
}

template <typename Stream>
inline void ser_write_u32(Stream& s, uint32_t v) {
    uint8_t buf[4];
    for (int i = 0; i < 4; ++i) {
        buf[i] = static_cast<uint8_t>((v >> (8 * i)) & 0xFF);
    }
    s.write(std::span<const uint8_t>(buf, 4));
}

template <typename Stream>
inline void ser_write_u64(Stream& s, uint64_t v) {
    uint8_t buf[8];
    for (int i = 0; i < 8; ++i) {
        buf[i] = static_cast<uint8_t>((v >> (8 * i)) & 0xFF);
    }
    s.write(std::span<const uint8_t>(buf, 8));
}

/// Big-endian 64-bit write. Explicit confidential amounts use this order.
template <typename Stream>
inline void ser_write_u64_be(Stream& s, uint64_t v) {
    uint8_t buf[8];
    for (int i = 0; i < 8; ++i) {
        buf[i] = static_cast<uint8_t>((v >> (8 * (7 - i))) & 0xFF);
    }
    s.write(std::span<const uint8_t>(buf, 8));
}

template <typename Stream>
inline void ser_write_bytes(Stream& s, std::span<const uint8_t> data) {
    if (!data.empty()) s.write(data);
}

/// Write a byte vector: CompactSize length prefix followed by raw bytes.
template <typename Stream>
void ser_write_vector(Stream& s, std::span<const uint8_t> v) {
    ser_write_compact_size(s, v.size());
    ser_write_bytes(s, v);
}

}  // namespace core
