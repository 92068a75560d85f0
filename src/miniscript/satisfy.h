#pragma once
// Copyright (c) 2024-2026 The ELMS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "core/types.h"
#include "miniscript/key.h"
#include "primitives/script/script.h"
#include "primitives/transaction.h"

#include <cstdint>
#include <map>
#include <optional>
#include <vector>

namespace miniscript {

struct Node;

/// A witness stack, bottom element first.
using Witness = std::vector<std::vector<uint8_t>>;

/// DER-encoded ECDSA signature plus the sighash byte that follows it on
/// the stack.
struct EcdsaSig {
    std::vector<uint8_t> der;
    uint8_t sighash_type = 0x01;  // SIGHASH_ALL

    /// DER bytes followed by the sighash byte.
    [[nodiscard]] std::vector<uint8_t> to_vec() const;

    /// Split a stack element into signature and sighash byte.  The DER part
    /// must be strictly encoded.
    static core::Result<EcdsaSig> from_slice(std::span<const uint8_t> bytes);

    bool operator==(const EcdsaSig&) const = default;
};

// ---------------------------------------------------------------------------
// Satisfier -- read-only source of satisfaction data
// ---------------------------------------------------------------------------
// Every lookup defaults to "not available".  Implementations override the
// lookups they can serve.  The covenant lookups are only consulted when a
// covenant descriptor is satisfied.
// ---------------------------------------------------------------------------
class Satisfier {
public:
    virtual ~Satisfier() = default;

    // -- Signatures and keys ------------------------------------------------

    virtual std::optional<EcdsaSig> lookup_ecdsa_sig(
        const PublicKey& /*key*/) const {
        return std::nullopt;
    }

    /// 64-byte BIP-340 signature, or 65 bytes with an explicit sighash.
    virtual std::optional<std::vector<uint8_t>> lookup_schnorr_sig(
        const PublicKey& /*key*/) const {
        return std::nullopt;
    }

    /// The key behind a pk_h fragment recovered from a script.
    virtual std::optional<PublicKey> lookup_pkh_pk(
        const KeyHash& /*hash*/) const {
        return std::nullopt;
    }

    // -- Hash preimages (32 bytes each) ---------------------------------------

    virtual std::optional<std::vector<uint8_t>> lookup_sha256(
        const core::uint256& /*hash*/) const {
        return std::nullopt;
    }
    virtual std::optional<std::vector<uint8_t>> lookup_hash256(
        const core::uint256& /*hash*/) const {
        return std::nullopt;
    }
    virtual std::optional<std::vector<uint8_t>> lookup_ripemd160(
        const core::uint160& /*hash*/) const {
        return std::nullopt;
    }
    virtual std::optional<std::vector<uint8_t>> lookup_hash160(
        const core::uint160& /*hash*/) const {
        return std::nullopt;
    }

    // -- Timelocks ------------------------------------------------------------

    virtual bool check_older(uint32_t /*sequence*/) const { return false; }
    virtual bool check_after(uint32_t /*lock_time*/) const { return false; }

    // -- Covenant sighash components ------------------------------------------

    virtual std::optional<uint32_t> lookup_nversion() const {
        return std::nullopt;
    }
    virtual std::optional<core::uint256> lookup_hashprevouts() const {
        return std::nullopt;
    }
    virtual std::optional<core::uint256> lookup_hashsequence() const {
        return std::nullopt;
    }
    virtual std::optional<core::uint256> lookup_hashissuances() const {
        return std::nullopt;
    }
    virtual std::optional<primitives::OutPoint> lookup_outpoint() const {
        return std::nullopt;
    }
    virtual std::optional<primitives::script::Script> lookup_scriptcode()
        const {
        return std::nullopt;
    }
    virtual std::optional<primitives::ConfidentialValue> lookup_value() const {
        return std::nullopt;
    }
    virtual std::optional<uint32_t> lookup_nsequence() const {
        return std::nullopt;
    }
    virtual std::optional<std::vector<primitives::TxOut>> lookup_outputs()
        const {
        return std::nullopt;
    }
    virtual std::optional<uint32_t> lookup_nlocktime() const {
        return std::nullopt;
    }
    virtual std::optional<uint32_t> lookup_sighashu32() const {
        return std::nullopt;
    }
};

// ---------------------------------------------------------------------------
// SimpleSatisfier -- map-backed Satisfier
// ---------------------------------------------------------------------------
class SimpleSatisfier : public Satisfier {
public:
    std::map<PublicKey, EcdsaSig> ecdsa_sigs;
    std::map<PublicKey, std::vector<uint8_t>> schnorr_sigs;
    std::map<core::uint256, std::vector<uint8_t>> sha256_preimages;
    std::map<core::uint256, std::vector<uint8_t>> hash256_preimages;
    std::map<core::uint160, std::vector<uint8_t>> ripemd160_preimages;
    std::map<core::uint160, std::vector<uint8_t>> hash160_preimages;

    /// nSequence of the spending input, for older().
    std::optional<uint32_t> sequence;
    /// nLockTime of the spending transaction, for after().
    std::optional<uint32_t> lock_time;

    /// Register @p preimage under all four of its digests.
    void add_preimage(const std::vector<uint8_t>& preimage);

    std::optional<EcdsaSig> lookup_ecdsa_sig(
        const PublicKey& key) const override;
    std::optional<std::vector<uint8_t>> lookup_schnorr_sig(
        const PublicKey& key) const override;
    std::optional<PublicKey> lookup_pkh_pk(
        const KeyHash& hash) const override;
    std::optional<std::vector<uint8_t>> lookup_sha256(
        const core::uint256& hash) const override;
    std::optional<std::vector<uint8_t>> lookup_hash256(
        const core::uint256& hash) const override;
    std::optional<std::vector<uint8_t>> lookup_ripemd160(
        const core::uint160& hash) const override;
    std::optional<std::vector<uint8_t>> lookup_hash160(
        const core::uint160& hash) const override;
    bool check_older(uint32_t n) const override;
    bool check_after(uint32_t n) const override;
};

// ---------------------------------------------------------------------------
// Satisfaction
// ---------------------------------------------------------------------------

/// Produce the witness for @p node.  With @p non_malleable set only a
/// satisfaction a third party cannot alter is accepted.  Fails with
/// COULD_NOT_SATISFY when the satisfier lacks data, and with the
/// context's limit error when the stack is too large.
core::Result<Witness> satisfy_node(const Node& node, const Satisfier& sat,
                                   bool non_malleable);

/// Push every witness element into a script: minimal small numbers for
/// elements that decode as such, plain pushes otherwise.  Used for
/// scriptSig-based (Legacy and Bare) spends.
[[nodiscard]] primitives::script::Script witness_to_script_sig(
    const Witness& witness);

} // namespace miniscript
