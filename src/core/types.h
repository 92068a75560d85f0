#pragma once
// Copyright (c) 2024-2026 The ELMS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/hex.h"

#include <algorithm>
#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace core {

// ---------------------------------------------------------------------------
// Blob<N> -- fixed-size byte array
// ---------------------------------------------------------------------------
// Base template for uint256 (N=32) and uint160 (N=20).
// Bytes are kept in the order the producing hash function emitted them.
// to_hex() prints them forward; to_display_hex() prints them reversed, the
// conventional rendering for transaction ids.
// ---------------------------------------------------------------------------
template <std::size_t N>
class Blob {
public:
    static constexpr std::size_t SIZE = N;

    constexpr Blob() noexcept : bytes_{} {}

    static Blob from_bytes(std::span<const uint8_t, N> bytes) noexcept {
        Blob result;
        std::copy(bytes.begin(), bytes.end(), result.bytes_.begin());
        return result;
    }

    /// Parse exactly 2*N hex characters in forward order.
    static std::optional<Blob> from_hex(std::string_view hex) {
        if (hex.size() != N * 2) return std::nullopt;
        auto raw = core::from_hex(hex);
        if (!raw) return std::nullopt;
        return from_bytes(std::span<const uint8_t, N>(raw->data(), N));
    }

    /// Parse 2*N hex characters in reversed (display) order.
    static std::optional<Blob> from_display_hex(std::string_view hex) {
        auto result = from_hex(hex);
        if (result) {
            std::reverse(result->bytes_.begin(), result->bytes_.end());
        }
        return result;
    }

    [[nodiscard]] std::string to_hex() const {
        return core::to_hex(std::span<const uint8_t>(bytes_));
    }

    [[nodiscard]] std::string to_display_hex() const {
        std::array<uint8_t, N> rev = bytes_;
        std::reverse(rev.begin(), rev.end());
        return core::to_hex(std::span<const uint8_t>(rev));
    }

    // -- Raw access ---------------------------------------------------------

    [[nodiscard]] const uint8_t* data() const noexcept { return bytes_.data(); }
    [[nodiscard]]       uint8_t* data()       noexcept { return bytes_.data(); }

    [[nodiscard]] const std::array<uint8_t, N>& bytes() const noexcept {
        return bytes_;
    }
    [[nodiscard]] std::span<const uint8_t> span() const noexcept {
        return std::span<const uint8_t>(bytes_);
    }

    [[nodiscard]] constexpr std::size_t size() const noexcept { return N; }

    [[nodiscard]] bool is_zero() const noexcept {
        return std::all_of(bytes_.begin(), bytes_.end(),
                           [](uint8_t b) { return b == 0; });
    }

    // Lexicographic over the stored bytes.
    auto operator<=>(const Blob&) const noexcept = default;
    bool operator==(const Blob&) const noexcept = default;

protected:
    std::array<uint8_t, N> bytes_;
};

// 256-bit value (SHA-256 digests, txids, tagged hashes).
using uint256 = Blob<32>;

// 160-bit value (RIPEMD-160 and HASH160 digests).
using uint160 = Blob<20>;

}  // namespace core

template <std::size_t N>
struct std::hash<core::Blob<N>> {
    std::size_t operator()(const core::Blob<N>& v) const noexcept {
        // FNV-1a over the raw bytes.
        std::size_t h = 14695981039346656037ULL;
        for (auto byte : v.bytes()) {
            h ^= static_cast<std::size_t>(byte);
            h *= 1099511628211ULL;
        }
        return h;
    }
};
