#pragma once
// Copyright (c) 2024-2026 The ELMS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/serialize.h"
#include "core/stream.h"
#include "core/types.h"
#include "primitives/script/script.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace primitives {

// ---------------------------------------------------------------------------
// OutPoint
// ---------------------------------------------------------------------------

/// Identifies an output of a previous transaction.
struct OutPoint {
    core::uint256 txid;
    uint32_t vout = 0;

    bool operator==(const OutPoint&) const = default;

    /// "<txid display hex>:<vout>"
    [[nodiscard]] std::string to_string() const;

    /// 32-byte txid followed by a 32-bit little-endian index.
    template <typename Stream>
    void serialize(Stream& s) const {
        core::ser_write_bytes(s, txid.span());
        core::ser_write_u32(s, vout);
    }
};

// ---------------------------------------------------------------------------
// Confidential fields (explicit or null only)
// ---------------------------------------------------------------------------
// Blinded commitments are not modelled; each field is either null
// (a single 0x00 byte) or explicit (0x01 followed by the value).
// ---------------------------------------------------------------------------

struct ConfidentialValue {
    std::optional<uint64_t> explicit_value;

    static ConfidentialValue from_explicit(uint64_t v) {
        return ConfidentialValue{v};
    }

    [[nodiscard]] bool is_null() const { return !explicit_value; }

    /// Explicit amounts are written big-endian.
    template <typename Stream>
    void serialize(Stream& s) const {
        if (!explicit_value) {
            core::ser_write_u8(s, 0x00);
            return;
        }
        core::ser_write_u8(s, 0x01);
        core::ser_write_u64_be(s, *explicit_value);
    }

    bool operator==(const ConfidentialValue&) const = default;
};

struct ConfidentialAsset {
    std::optional<core::uint256> explicit_asset;

    template <typename Stream>
    void serialize(Stream& s) const {
        if (!explicit_asset) {
            core::ser_write_u8(s, 0x00);
            return;
        }
        core::ser_write_u8(s, 0x01);
        core::ser_write_bytes(s, explicit_asset->span());
    }

    bool operator==(const ConfidentialAsset&) const = default;
};

struct ConfidentialNonce {
    std::optional<core::uint256> explicit_nonce;

    template <typename Stream>
    void serialize(Stream& s) const {
        if (!explicit_nonce) {
            core::ser_write_u8(s, 0x00);
            return;
        }
        core::ser_write_u8(s, 0x01);
        core::ser_write_bytes(s, explicit_nonce->span());
    }

    bool operator==(const ConfidentialNonce&) const = default;
};

// ---------------------------------------------------------------------------
// TxOut / TxIn
// ---------------------------------------------------------------------------

struct TxOut {
    ConfidentialAsset asset;
    ConfidentialValue value;
    ConfidentialNonce nonce;
    script::Script script_pubkey;

    /// asset | value | nonce | compact_size(script) | script
    template <typename Stream>
    void serialize(Stream& s) const {
        asset.serialize(s);
        value.serialize(s);
        nonce.serialize(s);
        script_pubkey.serialize(s);
    }

    bool operator==(const TxOut&) const = default;
};

struct TxIn {
    OutPoint previous_output;
    script::Script script_sig;
    uint32_t sequence = 0xFFFFFFFF;
    std::vector<std::vector<uint8_t>> witness;

    bool operator==(const TxIn&) const = default;
};

// ---------------------------------------------------------------------------
// Transaction
// ---------------------------------------------------------------------------
// Only the fields the covenant sighash items read are modelled. Asset
// issuance is not supported, so every input contributes a single 0x00
// byte to hashIssuances.
// ---------------------------------------------------------------------------

struct Transaction {
    uint32_t version = 2;
    std::vector<TxIn> inputs;
    std::vector<TxOut> outputs;
    uint32_t lock_time = 0;
};

/// SHA256d over every input's outpoint.
[[nodiscard]] core::uint256 hash_prevouts(const Transaction& tx);

/// SHA256d over every input's nSequence (little endian).
[[nodiscard]] core::uint256 hash_sequence(const Transaction& tx);

/// SHA256d over one 0x00 "no issuance" byte per input.
[[nodiscard]] core::uint256 hash_issuances(const Transaction& tx);

/// Concatenated consensus serialization of @p outputs (no count prefix).
[[nodiscard]] std::vector<uint8_t> serialize_outputs(
    std::span<const TxOut> outputs);

/// SHA256d(serialize_outputs(outputs)).
[[nodiscard]] core::uint256 hash_outputs(std::span<const TxOut> outputs);

} // namespace primitives
