#pragma once
// Copyright (c) 2024-2026 The ELMS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.
//
// Blech32 / Blech32m: the Elements variant of bech32 used by confidential
// segwit addresses. Same charset and HRP expansion, but a 60-bit BCH code
// with a 12-character checksum, so the longer blinded programs keep their
// error detection.

#include "core/bech32.h"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace core {

/// Encode an HRP and 5-bit values. BECH32 selects blech32, BECH32M selects
/// blech32m. Returns an empty string on a malformed HRP or value.
std::string blech32_encode(
    std::string_view hrp,
    std::span<const uint8_t> values,
    Bech32Encoding encoding);

/// Encode a confidential segwit address. @p program is the 33-byte blinding
/// key followed by the witness program. Version 0 uses blech32, version 1+
/// blech32m.
std::string encode_blech32_segwit(
    std::string_view hrp,
    uint8_t witness_version,
    std::span<const uint8_t> program);

/// Decode a confidential segwit address carrying the expected HRP. The
/// returned program still starts with the blinding key.
std::optional<std::pair<uint8_t, std::vector<uint8_t>>>
decode_blech32_segwit(std::string_view hrp, std::string_view addr);

}  // namespace core
