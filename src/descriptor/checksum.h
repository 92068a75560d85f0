#pragma once
// Copyright (c) 2024-2026 The ELMS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"

#include <string>
#include <string_view>

namespace descriptor {

/// Length of the checksum that follows '#'.
inline constexpr size_t CHECKSUM_LENGTH = 8;

// ---------------------------------------------------------------------------
// Descriptor checksum (BIP-380)
// ---------------------------------------------------------------------------
// A BCH code over the descriptor characters.  Characters outside the input
// charset cannot be checksummed.
// ---------------------------------------------------------------------------

/// The eight checksum characters for @p desc.  Fails with BAD_CHECKSUM
/// when @p desc contains a character outside the input charset.
core::Result<std::string> desc_checksum(std::string_view desc);

/// "<desc>#<checksum>".
core::Result<std::string> with_checksum(std::string_view desc);

/// Split "<desc>#<checksum>", check the tag and return <desc>.  Exactly one
/// '#' is required.
core::Result<std::string_view> verify_checksum(std::string_view s);

} // namespace descriptor
