#pragma once
// Copyright (c) 2024-2026 The ELMS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace core {

// Base58 alphabet (no 0, O, I, l to avoid visual ambiguity).
inline constexpr char BASE58_ALPHABET[] =
    "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

/// Encode raw bytes as a Base58 string.
/// Leading zero bytes map to leading '1' characters.
std::string base58_encode(std::span<const uint8_t> data);

/// Decode a Base58 string back to raw bytes.
std::optional<std::vector<uint8_t>> base58_decode(std::string_view str);

// ---------------------------------------------------------------------------
// Base58Check: payload followed by the first four bytes of
// SHA256(SHA256(payload)).
// ---------------------------------------------------------------------------

std::string base58check_encode(std::span<const uint8_t> data);

/// Returns std::nullopt on invalid encoding or checksum mismatch.
std::optional<std::vector<uint8_t>> base58check_decode(
    std::string_view str);

/// Prepend a single version byte to the payload, then Base58Check-encode.
/// Used for p2pkh and p2sh addresses.
std::string encode_with_version(
    uint8_t version,
    std::span<const uint8_t> payload);

/// Split a Base58Check string into (version_byte, payload).
std::optional<std::pair<uint8_t, std::vector<uint8_t>>>
decode_with_version(std::string_view str);

}  // namespace core
