#pragma once
// Copyright (c) 2024-2026 The ELMS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "descriptor/descriptor.h"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace descriptor {

// ---------------------------------------------------------------------------
// Bare -- a Miniscript used directly as the scriptPubKey
// ---------------------------------------------------------------------------
// Written "el<ms>".  Only pk, pkh and multi with up to three keys are
// admissible at the top level.  Bare outputs have no address.
// ---------------------------------------------------------------------------
class Bare {
public:
    /// Wrap a BARE-context Miniscript after the top-level checks.
    static core::Result<Bare> create(Miniscript ms);

    static core::Result<Bare> from_tree(const Tree& tree);
    static core::Result<Bare> from_str(std::string_view s);

    [[nodiscard]] const Miniscript& inner() const noexcept { return ms_; }

    [[nodiscard]] std::string to_string() const;
    core::Result<void> sanity_check() const;

    [[nodiscard]] Script script_pubkey() const { return ms_.encode(); }
    [[nodiscard]] Script unsigned_script_sig() const { return Script(); }
    [[nodiscard]] Script explicit_script() const { return ms_.encode(); }
    [[nodiscard]] Script script_code() const { return ms_.encode(); }

    core::Result<Satisfaction> get_satisfaction(const Satisfier& sat) const;
    core::Result<Satisfaction> get_satisfaction_mall(
        const Satisfier& sat) const;

    /// 4 * (length prefix + scriptSig) of the largest satisfaction.
    core::Result<size_t> max_satisfaction_weight() const;

    core::Result<Address> address(
        const AddressParams& params = AddressParams::ELEMENTS) const;
    core::Result<Address> blind_addr(
        const std::optional<PublicKey>& blinder,
        const AddressParams& params = AddressParams::ELEMENTS) const;

    bool for_each_key(const KeyPredicate& pred) const {
        return ms_.for_each_key(pred);
    }
    core::Result<Bare> translate_keys(const KeyTranslator& t) const;

    bool operator==(const Bare&) const = default;

private:
    explicit Bare(Miniscript ms) : ms_(std::move(ms)) {}

    Miniscript ms_;
};

// ---------------------------------------------------------------------------
// Pkh -- pay to public key hash, "elpkh(K)"
// ---------------------------------------------------------------------------
class Pkh {
public:
    /// Fails with BAD_KEY for x-only keys.  Uncompressed keys are allowed.
    static core::Result<Pkh> create(PublicKey pk);

    static core::Result<Pkh> from_tree(const Tree& tree);
    static core::Result<Pkh> from_str(std::string_view s);

    [[nodiscard]] const PublicKey& key() const noexcept { return pk_; }

    [[nodiscard]] std::string to_string() const;
    core::Result<void> sanity_check() const { return core::make_ok(); }

    [[nodiscard]] Script script_pubkey() const;
    [[nodiscard]] Script unsigned_script_sig() const { return Script(); }
    [[nodiscard]] Script explicit_script() const { return script_pubkey(); }
    [[nodiscard]] Script script_code() const { return script_pubkey(); }

    /// scriptSig <sig> <pk>.  Fails with MISSING_SIG without a signature.
    core::Result<Satisfaction> get_satisfaction(const Satisfier& sat) const;
    core::Result<Satisfaction> get_satisfaction_mall(
        const Satisfier& sat) const {
        return get_satisfaction(sat);
    }

    core::Result<size_t> max_satisfaction_weight() const;

    core::Result<Address> address(
        const AddressParams& params = AddressParams::ELEMENTS) const;
    core::Result<Address> blind_addr(
        const std::optional<PublicKey>& blinder,
        const AddressParams& params = AddressParams::ELEMENTS) const;

    bool for_each_key(const KeyPredicate& pred) const { return pred(pk_); }
    core::Result<Pkh> translate_keys(const KeyTranslator& t) const;

    bool operator==(const Pkh&) const = default;

private:
    explicit Pkh(PublicKey pk) : pk_(std::move(pk)) {}

    PublicKey pk_;
};

// -- Shared by the single-key descriptors ----------------------------------

/// The key argument of "<name>(K)".  Fails with UNEXPECTED when @p tree is
/// not a one-argument @p name node; @p what names the descriptor in the
/// error message.
core::Result<PublicKey> single_key_arg(const Tree& tree, std::string_view name,
                                       std::string_view what);

/// Error for a tree that is not the expected descriptor shape.
[[nodiscard]] core::Error unexpected_tree(const Tree& tree,
                                          std::string_view what);

} // namespace descriptor
