#pragma once
// Copyright (c) 2024-2026 The ELMS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "interpreter/stack.h"
#include "miniscript/key.h"
#include "miniscript/miniscript.h"
#include "primitives/script/script.h"

#include <cstdint>
#include <optional>
#include <string_view>
#include <variant>
#include <vector>

namespace interpreter {

/// A key as the interpreter sees it: a full SEC1 key or an x-only key.
using BitcoinKey = miniscript::PublicKey;

/// A key hash tagged with the key form it was checked against.
using TypedHash160 = miniscript::KeyHash;

/// Where a bare key spend came from.
enum class PubkeyType : uint8_t { PK, PKH, WPKH, SH_WPKH, TR };

/// Where a script spend came from.
enum class ScriptType : uint8_t { BARE, SH, WSH, SH_WSH, TR };

[[nodiscard]] std::string_view pubkey_type_name(PubkeyType t) noexcept;
[[nodiscard]] std::string_view script_type_name(ScriptType t) noexcept;

// ---------------------------------------------------------------------------
// Inner -- classification of what a spend has to satisfy
// ---------------------------------------------------------------------------
// Every Miniscript is in the NO_CHECKS context so evaluation does not
// depend on where the script came from.
// ---------------------------------------------------------------------------

/// A single key check: p2pk, p2pkh, p2wpkh, p2sh-p2wpkh or a taproot
/// key spend.
struct InnerPublicKey {
    BitcoinKey key;
    PubkeyType type;

    bool operator==(const InnerPublicKey&) const = default;
};

/// A Miniscript spend.
struct InnerScript {
    miniscript::Miniscript ms;
    ScriptType type;

    bool operator==(const InnerScript&) const = default;
};

/// A P2WSH covenant: key bound by CHECKSIGFROMSTACK plus its Miniscript.
struct InnerCovScript {
    BitcoinKey key;
    miniscript::Miniscript ms;

    bool operator==(const InnerCovScript&) const = default;
};

using Inner = std::variant<InnerPublicKey, InnerScript, InnerCovScript>;

/// Result of from_txdata().  The stack holds what remains for the inner
/// check to consume.  script_code is the script a signature commits to;
/// for taproot script spends it is the leaf script, and taproot key
/// spends have none.
struct TxData {
    Inner inner;
    Stack stack;
    std::optional<primitives::script::Script> script_code;
};

/// Classify a spend of @p spk by @p script_sig and @p witness.
///
/// Output shapes are tried in the order p2pk, p2pkh, p2wpkh, p2wsh,
/// p2tr, p2sh and finally bare script.  A P2WSH witness script is first
/// matched against the covenant layout.  Embedded Miniscripts are parsed
/// without sanity checks, since they come from existing transactions.
core::Result<TxData> from_txdata(const primitives::script::Script& spk,
                                 const primitives::script::Script& script_sig,
                                 const std::vector<std::vector<uint8_t>>& witness);

} // namespace interpreter
