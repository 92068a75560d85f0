#pragma once
// Copyright (c) 2024-2026 The ELMS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.
//
// Bech32 / Bech32m encoding as defined in BIP173 and BIP350. Elements
// unconfidential segwit addresses reuse both variants unchanged.

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace core {

enum class Bech32Encoding {
    BECH32,     // BIP173 -- witness version 0
    BECH32M,    // BIP350 -- witness version 1+
    INVALID,
};

/// Encode an HRP and 5-bit values. Returns an empty string when the HRP is
/// malformed or a value exceeds 31.
std::string bech32_encode(
    std::string_view hrp,
    std::span<const uint8_t> values,
    Bech32Encoding encoding);

/// Regroup bits (8 -> 5 when encoding, 5 -> 8 when decoding). Returns
/// std::nullopt on out-of-range input or non-zero padding.
std::optional<std::vector<uint8_t>> convert_bits(
    std::span<const uint8_t> data,
    int from_bits,
    int to_bits,
    bool pad);

/// Encode a segwit address. Version 0 uses BECH32, version 1+ BECH32M.
std::string encode_segwit(
    std::string_view hrp,
    uint8_t witness_version,
    std::span<const uint8_t> program);

/// Decode a segwit address carrying the expected HRP.
std::optional<std::pair<uint8_t, std::vector<uint8_t>>>
decode_segwit(std::string_view hrp, std::string_view addr);

}  // namespace core
