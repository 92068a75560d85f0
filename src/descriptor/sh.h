#pragma once
// Copyright (c) 2024-2026 The ELMS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "descriptor/descriptor.h"
#include "descriptor/segwitv0.h"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace descriptor {

// ---------------------------------------------------------------------------
// Sh -- pay to script hash
// ---------------------------------------------------------------------------
// Four inner forms:
//   elsh(wsh(...))          nested P2WSH
//   elsh(wpkh(K))           nested P2WPKH
//   elsh(sortedmulti(...))  Legacy sorted multisig
//   elsh(ms)                Legacy Miniscript
// Inner names are written without "el" and accepted with it.
// ---------------------------------------------------------------------------
class Sh {
public:
    using Inner = std::variant<Wsh, Wpkh, SortedMulti, Miniscript>;

    static core::Result<Sh> create(Miniscript ms);
    static core::Result<Sh> create(Inner inner);

    static core::Result<Sh> from_tree(const Tree& tree);
    static core::Result<Sh> from_str(std::string_view s);

    [[nodiscard]] const Inner& inner() const noexcept { return inner_; }

    [[nodiscard]] std::string to_string() const;
    core::Result<void> sanity_check() const;

    /// The script whose hash the output commits to.
    [[nodiscard]] Script redeem_script() const;

    [[nodiscard]] Script script_pubkey() const;
    /// Push of the redeem script for the nested segwit forms, else empty.
    [[nodiscard]] Script unsigned_script_sig() const;
    [[nodiscard]] Script explicit_script() const;
    [[nodiscard]] Script script_code() const;

    core::Result<Satisfaction> get_satisfaction(const Satisfier& sat) const;
    core::Result<Satisfaction> get_satisfaction_mall(
        const Satisfier& sat) const;

    core::Result<size_t> max_satisfaction_weight() const;

    core::Result<Address> address(
        const AddressParams& params = AddressParams::ELEMENTS) const;
    core::Result<Address> blind_addr(
        const std::optional<PublicKey>& blinder,
        const AddressParams& params = AddressParams::ELEMENTS) const;

    bool for_each_key(const KeyPredicate& pred) const;
    core::Result<Sh> translate_keys(const KeyTranslator& t) const;

    bool operator==(const Sh&) const = default;

private:
    explicit Sh(Inner inner) : inner_(std::move(inner)) {}

    /// The Miniscript of the sortedmulti and Legacy forms.
    const Miniscript& legacy_miniscript() const;

    core::Result<Satisfaction> satisfy(const Satisfier& sat,
                                       bool non_malleable) const;

    Inner inner_;
};

} // namespace descriptor
