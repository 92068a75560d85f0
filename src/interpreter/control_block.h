#pragma once
// Copyright (c) 2024-2026 The ELMS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "core/types.h"
#include "primitives/script/script.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace interpreter {

/// Leaf version of Elements tapscript.
inline constexpr uint8_t TAPROOT_LEAF_TAPSCRIPT = 0xc4;

inline constexpr size_t TAPROOT_CONTROL_BASE_SIZE = 33;
inline constexpr size_t TAPROOT_CONTROL_NODE_SIZE = 32;
inline constexpr size_t TAPROOT_CONTROL_MAX_NODE_COUNT = 128;

/// TapLeaf/elements hash of @p script under @p leaf_version.
[[nodiscard]] core::uint256 tap_leaf_hash(
    uint8_t leaf_version, const primitives::script::Script& script);

/// TapBranch/elements hash of two children, in lexicographic order.
[[nodiscard]] core::uint256 tap_branch_hash(const core::uint256& a,
                                            const core::uint256& b);

// ---------------------------------------------------------------------------
// ControlBlock -- proof that a leaf script is committed to by an output key
// ---------------------------------------------------------------------------
//   byte 0        leaf version | output key parity
//   bytes 1..32   internal x-only key
//   then          0..128 32-byte Merkle path nodes
// ---------------------------------------------------------------------------
struct ControlBlock {
    uint8_t leaf_version = TAPROOT_LEAF_TAPSCRIPT;
    bool output_key_odd = false;
    std::array<uint8_t, 32> internal_key{};
    std::vector<core::uint256> merkle_branch;

    /// Fails with CONTROL_BLOCK_PARSE on a bad length, an odd or annex
    /// leaf version, or an internal key that is not on the curve.
    static core::Result<ControlBlock> from_slice(std::span<const uint8_t> bytes);

    /// Whether @p script, hashed as a leaf and folded up the path, tweaks
    /// the internal key to @p output_key with the recorded parity.
    [[nodiscard]] bool verify_taproot_commitment(
        std::span<const uint8_t, 32> output_key,
        const primitives::script::Script& script) const;
};

} // namespace interpreter
