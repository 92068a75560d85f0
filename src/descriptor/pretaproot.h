#pragma once
// Copyright (c) 2024-2026 The ELMS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "descriptor/bare.h"
#include "descriptor/descriptor.h"
#include "descriptor/segwitv0.h"
#include "descriptor/sh.h"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace descriptor {

// ---------------------------------------------------------------------------
// PreTaprootDescriptor -- any of the pre-taproot descriptor kinds
// ---------------------------------------------------------------------------
// Parsing matches the top-level name and arity in the fixed order
// pkh(1), wpkh(1), sh(1), wsh(1).  Everything else is read as a Bare
// Miniscript.  Each operation forwards to the held descriptor.
// ---------------------------------------------------------------------------
class PreTaprootDescriptor {
public:
    using Variant = std::variant<Bare, Pkh, Wpkh, Sh, Wsh>;

    explicit PreTaprootDescriptor(Variant v) : desc_(std::move(v)) {}

    static core::Result<PreTaprootDescriptor> from_tree(const Tree& tree);
    static core::Result<PreTaprootDescriptor> from_str(std::string_view s);

    [[nodiscard]] const Variant& get() const noexcept { return desc_; }

    template <typename T>
    [[nodiscard]] bool is() const noexcept {
        return std::holds_alternative<T>(desc_);
    }

    [[nodiscard]] std::string to_string() const;
    core::Result<void> sanity_check() const;

    [[nodiscard]] Script script_pubkey() const;
    [[nodiscard]] Script unsigned_script_sig() const;
    [[nodiscard]] Script explicit_script() const;
    [[nodiscard]] Script script_code() const;

    core::Result<Satisfaction> get_satisfaction(const Satisfier& sat) const;
    core::Result<Satisfaction> get_satisfaction_mall(
        const Satisfier& sat) const;

    core::Result<size_t> max_satisfaction_weight() const;

    core::Result<Address> address(
        const AddressParams& params = AddressParams::ELEMENTS) const;

    /// The confidential address under @p blinder; with no blinder this is
    /// address().  Bare descriptors fail with BARE_DESCRIPTOR_ADDR.
    core::Result<Address> blind_addr(
        const std::optional<PublicKey>& blinder,
        const AddressParams& params = AddressParams::ELEMENTS) const;

    bool for_each_key(const KeyPredicate& pred) const;
    core::Result<PreTaprootDescriptor> translate_keys(
        const KeyTranslator& t) const;

    bool operator==(const PreTaprootDescriptor&) const = default;

private:
    Variant desc_;
};

/// Parse @p s, print it, and parse the printed form again.  Returns false
/// when @p s is not a descriptor, true when the printed form re-parses to
/// an equal descriptor that prints identically, and INTERNAL_ERROR
/// otherwise.
core::Result<bool> roundtrip_descriptor(std::string_view s);

} // namespace descriptor
