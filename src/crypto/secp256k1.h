#pragma once
// Copyright (c) 2024-2026 The ELMS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <array>
#include <cstdint>
#include <optional>
#include <span>

#include "core/error.h"

namespace crypto {

/// Return true if the byte sequence is a valid SEC1 public key
/// (compressed 33 bytes starting 0x02/0x03, or uncompressed 65 bytes
/// starting 0x04) whose point lies on secp256k1.
bool is_valid_pubkey(std::span<const uint8_t> pubkey);

/// Return true if @p xonly is a 32-byte BIP-340 x-only key, i.e. an
/// x-coordinate below the field prime that lifts to a curve point.
bool is_valid_xonly(std::span<const uint8_t> xonly);

/// Result of tweaking an x-only key: Q = lift_x(P) + t*G.
struct TweakedKey {
    std::array<uint8_t, 32> xonly{};
    bool odd_y = false;
};

/// Add @p tweak * G to lift_x(@p internal).  Fails with CRYPTO_KEY_FAIL
/// when the internal key does not lift, the tweak is not below the
/// curve order, or the sum is the point at infinity.
core::Result<TweakedKey> xonly_tweak_add(
    std::span<const uint8_t, 32> internal,
    std::span<const uint8_t, 32> tweak);

/// Strict DER (BIP-66) encoding check for an ECDSA signature WITHOUT
/// a trailing sighash byte.
bool is_valid_der_signature(std::span<const uint8_t> sig);

}  // namespace crypto
