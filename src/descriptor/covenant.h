#pragma once
// Copyright (c) 2024-2026 The ELMS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "descriptor/descriptor.h"
#include "miniscript/decode.h"
#include "primitives/transaction.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace descriptor {

// ---------------------------------------------------------------------------
// Covenant script layout
// ---------------------------------------------------------------------------
//
//   [ms] OP_VERIFY                      (folded into ms when it ends in a
//                                        verifiable opcode)
//   OP_11 OP_PICK OP_OVER OP_1 OP_LEFT OP_CAT
//   <pk> OP_DUP OP_TOALTSTACK
//   OP_CODESEPARATOR
//   OP_CHECKSIGVERIFY                   -- post-codesep script starts here
//   OP_CAT x10 OP_SHA256
//   OP_FROMALTSTACK OP_CHECKSIGFROMSTACK
//
// The witness carries the covenant signature and the eleven sighash
// items below the satisfaction of ms.  The script concatenates the items
// into the BIP143 preimage, checks the signature against the
// transaction with CHECKSIG and against SHA256(preimage) with
// CHECKSIGFROMSTACK, binding the introspected items to the transaction.
// ---------------------------------------------------------------------------

/// Opcodes the covenant adds to ms's satisfaction op count.
inline constexpr uint32_t COV_SCRIPT_OPS = 24;

/// Bytes the covenant adds to ms's script (with a compressed key).
inline constexpr size_t COV_SCRIPT_SIZE = 58;

/// Witness items the covenant adds below ms's satisfaction.
inline constexpr size_t COV_WITNESS_ITEMS = 12;

/// Upper bound on the bytes of those items.
inline constexpr size_t COV_WITNESS_SIZE = 275;

/// The script after OP_CODESEPARATOR: the script code the covenant key
/// signs with.
[[nodiscard]] Script post_codesep_script();

/// Key and inner Miniscript recovered from a covenant script.
struct CovComponents {
    PublicKey pk;
    Miniscript ms;
};

/// Recognize the covenant layout at the end of @p tokens and return its
/// key, leaving the tokens before it in @p tokens.  Fails with
/// BAD_COV_DESCRIPTOR on the first opcode that does not match.
core::Result<PublicKey> check_cov_script(std::vector<miniscript::Token>& tokens);

/// Split a covenant script into key and Miniscript, the latter decoded
/// in @p ctx.  The Miniscript must be a B expression within the Segwitv0
/// limits.
core::Result<CovComponents> parse_cov_components(const Script& script,
                                                 Context ctx);

// ---------------------------------------------------------------------------
// CovenantDescriptor -- "elcovwsh(K,ms)"
// ---------------------------------------------------------------------------
class CovenantDescriptor {
public:
    /// Fails with IMPOSSIBLE_SATISFACTION when ms cannot be satisfied or
    /// its satisfaction would exceed 201 opcodes with the covenant added,
    /// and with SCRIPT_SIZE_TOO_LARGE past the 10000 byte script limit.
    static core::Result<CovenantDescriptor> create(PublicKey pk, Miniscript ms);

    static core::Result<CovenantDescriptor> from_tree(const Tree& tree);
    static core::Result<CovenantDescriptor> from_str(std::string_view s);

    static core::Result<CovenantDescriptor> parse_insane(const Script& script);
    /// parse_insane() plus the Miniscript sanity checks.
    static core::Result<CovenantDescriptor> parse(const Script& script);

    [[nodiscard]] const PublicKey& pk() const noexcept { return pk_; }
    [[nodiscard]] const Miniscript& miniscript() const noexcept { return ms_; }

    [[nodiscard]] Script encode() const;
    [[nodiscard]] std::string to_string() const;

    /// Miniscript sanity plus the 3600 byte P2WSH standardness limit.
    core::Result<void> sanity_check() const;

    [[nodiscard]] Script script_pubkey() const;
    [[nodiscard]] Script unsigned_script_sig() const { return Script(); }
    [[nodiscard]] Script explicit_script() const { return encode(); }

    /// Script code for keys inside ms.
    [[nodiscard]] Script script_code() const { return encode(); }
    /// Script code for the covenant key.
    [[nodiscard]] Script cov_script_code() const {
        return post_codesep_script();
    }

    /// Covenant items followed by ms's satisfaction, without the script.
    core::Result<Witness> satisfy(const Satisfier& sat) const;

    core::Result<Satisfaction> get_satisfaction(const Satisfier& sat) const;
    core::Result<Satisfaction> get_satisfaction_mall(
        const Satisfier& sat) const;

    core::Result<size_t> max_satisfaction_weight() const;

    core::Result<Address> address(
        const AddressParams& params = AddressParams::ELEMENTS) const;
    core::Result<Address> blind_addr(
        const std::optional<PublicKey>& blinder,
        const AddressParams& params = AddressParams::ELEMENTS) const;

    bool for_each_key(const KeyPredicate& pred) const {
        return pred(pk_) && ms_.for_each_key(pred);
    }
    core::Result<CovenantDescriptor> translate_keys(
        const KeyTranslator& t) const;

    bool operator==(const CovenantDescriptor&) const = default;

private:
    CovenantDescriptor(PublicKey pk, Miniscript ms)
        : pk_(std::move(pk)), ms_(std::move(ms)) {}

    core::Result<Witness> cov_items(const Satisfier& sat) const;
    [[nodiscard]] size_t cov_script_size() const;

    PublicKey pk_;
    Miniscript ms_;
};

// ---------------------------------------------------------------------------
// CovSatisfier -- covenant sighash items read from a transaction
// ---------------------------------------------------------------------------
// Serves the eleven covenant lookups for one input of @p tx.  Signature,
// preimage and timelock lookups are forwarded to the wrapped satisfier.
// ---------------------------------------------------------------------------
class CovSatisfier : public Satisfier {
public:
    /// Fails with IMPOSSIBLE_SATISFACTION when @p input_index is not an
    /// input of @p tx.
    static core::Result<CovSatisfier> create(
        const primitives::Transaction& tx, size_t input_index,
        primitives::ConfidentialValue value, Script script_code,
        const Satisfier& inner, uint32_t sighash_type = 0x01);

    // -- Forwarded lookups ----------------------------------------------------

    std::optional<miniscript::EcdsaSig> lookup_ecdsa_sig(
        const PublicKey& key) const override {
        return inner_->lookup_ecdsa_sig(key);
    }
    std::optional<std::vector<uint8_t>> lookup_schnorr_sig(
        const PublicKey& key) const override {
        return inner_->lookup_schnorr_sig(key);
    }
    std::optional<PublicKey> lookup_pkh_pk(
        const miniscript::KeyHash& hash) const override {
        return inner_->lookup_pkh_pk(hash);
    }
    std::optional<std::vector<uint8_t>> lookup_sha256(
        const core::uint256& h) const override {
        return inner_->lookup_sha256(h);
    }
    std::optional<std::vector<uint8_t>> lookup_hash256(
        const core::uint256& h) const override {
        return inner_->lookup_hash256(h);
    }
    std::optional<std::vector<uint8_t>> lookup_ripemd160(
        const core::uint160& h) const override {
        return inner_->lookup_ripemd160(h);
    }
    std::optional<std::vector<uint8_t>> lookup_hash160(
        const core::uint160& h) const override {
        return inner_->lookup_hash160(h);
    }
    bool check_older(uint32_t n) const override {
        return inner_->check_older(n);
    }
    bool check_after(uint32_t n) const override {
        return inner_->check_after(n);
    }

    // -- Covenant lookups -----------------------------------------------------

    std::optional<uint32_t> lookup_nversion() const override;
    std::optional<core::uint256> lookup_hashprevouts() const override;
    std::optional<core::uint256> lookup_hashsequence() const override;
    std::optional<core::uint256> lookup_hashissuances() const override;
    std::optional<primitives::OutPoint> lookup_outpoint() const override;
    std::optional<Script> lookup_scriptcode() const override;
    std::optional<primitives::ConfidentialValue> lookup_value() const override;
    std::optional<uint32_t> lookup_nsequence() const override;
    std::optional<std::vector<primitives::TxOut>> lookup_outputs()
        const override;
    std::optional<uint32_t> lookup_nlocktime() const override;
    std::optional<uint32_t> lookup_sighashu32() const override;

private:
    CovSatisfier(const primitives::Transaction& tx, size_t input_index,
                 primitives::ConfidentialValue value, Script script_code,
                 const Satisfier& inner, uint32_t sighash_type)
        : tx_(&tx), index_(input_index), value_(std::move(value)),
          script_code_(std::move(script_code)), inner_(&inner),
          sighash_type_(sighash_type) {}

    const primitives::Transaction* tx_;
    size_t index_;
    primitives::ConfidentialValue value_;
    Script script_code_;
    const Satisfier* inner_;
    uint32_t sighash_type_;
};

} // namespace descriptor
