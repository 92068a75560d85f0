#pragma once
// Copyright (c) 2024-2026 The ELMS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace core {

// Encode a byte span to a lowercase hexadecimal string.
std::string to_hex(std::span<const uint8_t> data);

// Decode a hexadecimal string to bytes. Returns nullopt if the input is
// invalid (odd length or non-hex characters). Both cases are accepted.
std::optional<std::vector<uint8_t>> from_hex(std::string_view hex);

// True when every character is a lowercase hex digit and the length is even.
// Descriptor strings only accept this canonical form.
bool is_lower_hex(std::string_view str);

// Check whether a string is a valid hexadecimal encoding (even length,
// every character in [0-9a-fA-F]).
bool is_hex(std::string_view str);

}  // namespace core
