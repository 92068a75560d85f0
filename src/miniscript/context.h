#pragma once
// Copyright (c) 2024-2026 The ELMS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "miniscript/key.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace miniscript {

struct Node;

// ---------------------------------------------------------------------------
// Script contexts
// ---------------------------------------------------------------------------
// A context is the rule profile a Miniscript is checked against: which key
// encodings and fragments are admissible and which size and op-count limits
// apply.  NO_CHECKS admits everything and is the context the interpreter
// works in after classification.
// ---------------------------------------------------------------------------
enum class Context : uint8_t {
    LEGACY,     // P2SH redeem script
    SEGWITV0,   // P2WSH witness script
    TAP,        // tapscript leaf
    BARE,       // raw scriptPubKey
    NO_CHECKS,
};

[[nodiscard]] std::string_view context_name(Context ctx) noexcept;

// -- Limits -----------------------------------------------------------------

/// Largest P2WSH witness script relayed by standard nodes.
inline constexpr size_t MAX_STANDARD_P2WSH_SCRIPT_SIZE = 3600;

/// Most witness items (excluding the script) a standard P2WSH spend may have.
inline constexpr size_t MAX_STANDARD_P2WSH_STACK_ITEMS = 100;

/// Largest standard scriptSig.
inline constexpr size_t MAX_SCRIPTSIG_SIZE = 1650;

/// Consensus block weight limit, which bounds a tapscript.
inline constexpr size_t MAX_BLOCK_WEIGHT = 4'000'000;

/// Combined stack and altstack element limit.
inline constexpr size_t MAX_STACK_SIZE = 1000;

/// multi_a key limit.
inline constexpr size_t MAX_PUBKEYS_PER_MULTI_A = 999;

/// Largest signature push, length byte included: 73 for DER ECDSA plus
/// sighash byte, 66 for a Schnorr signature with a sighash byte.
[[nodiscard]] size_t max_sig_push_size(Context ctx) noexcept;

/// Whether tapscript rules (x-only keys, multi_a) apply.
[[nodiscard]] constexpr bool is_tapscript(Context ctx) noexcept {
    return ctx == Context::TAP;
}

// -- Per-node checks ---------------------------------------------------------

/// Key encoding admissibility.
core::Result<void> check_pk(Context ctx, const PublicKey& key);

/// Fragment admissibility and key checks for the node's own keys.
core::Result<void> check_terminal(Context ctx, const Node& node);

/// Consensus limits over the whole script (size).
core::Result<void> check_global_consensus_validity(Context ctx,
                                                   const Node& node);

/// Standardness limits over the whole script (size).
core::Result<void> check_global_policy_validity(Context ctx, const Node& node);

/// Consensus limits over the satisfaction (op count, stack size).
core::Result<void> check_local_consensus_validity(Context ctx,
                                                  const Node& node);

/// Standardness limits over the satisfaction (scriptSig size, items).
core::Result<void> check_local_policy_validity(Context ctx, const Node& node);

core::Result<void> check_global_validity(Context ctx, const Node& node);
core::Result<void> check_local_validity(Context ctx, const Node& node);

// -- Top level ----------------------------------------------------------------

/// A top-level Miniscript must be of base type B.
core::Result<void> top_level_type_check(const Node& node);

/// top_level_type_check plus the context's own admissibility rules.  Bare
/// scripts are limited to pk, pkh and multi with at most three keys.
core::Result<void> top_level_checks(Context ctx, const Node& node);

/// Upper bound on the satisfaction size in the field the context spends
/// from: witness bytes for Segwitv0 and Tap, scriptSig bytes for Legacy
/// and Bare.
[[nodiscard]] std::optional<size_t> max_satisfaction_size(Context ctx,
                                                          const Node& node);

/// Final check over a produced witness stack.
core::Result<void> check_witness(
    Context ctx, const std::vector<std::vector<uint8_t>>& witness);

} // namespace miniscript
