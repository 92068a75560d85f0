#pragma once
// Copyright (c) 2024-2026 The ELMS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "descriptor/descriptor.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace descriptor {

// ---------------------------------------------------------------------------
// SortedMulti -- multi() over the keys in lexicographic order
// ---------------------------------------------------------------------------
// The keys are kept in the order they were written so the descriptor
// string round-trips; the script is built over the sorted list.
// ---------------------------------------------------------------------------
class SortedMulti {
public:
    static core::Result<SortedMulti> create(uint32_t k,
                                            std::vector<PublicKey> keys,
                                            Context ctx);
    static core::Result<SortedMulti> from_tree(const Tree& tree, Context ctx);

    [[nodiscard]] uint32_t threshold() const noexcept { return k_; }
    [[nodiscard]] const std::vector<PublicKey>& keys() const noexcept {
        return keys_;
    }
    /// multi(k, sorted keys) in this descriptor's context.
    [[nodiscard]] const Miniscript& miniscript() const noexcept { return ms_; }

    /// "sortedmulti(k,K1,...)", without prefix or checksum.
    [[nodiscard]] std::string to_string() const;

    core::Result<void> sanity_check() const { return ms_.sanity_check(); }

    bool for_each_key(const KeyPredicate& pred) const;
    core::Result<SortedMulti> translate_keys(const KeyTranslator& t) const;

    bool operator==(const SortedMulti&) const = default;

private:
    SortedMulti(uint32_t k, std::vector<PublicKey> keys, Miniscript ms)
        : k_(k), keys_(std::move(keys)), ms_(std::move(ms)) {}

    uint32_t k_;
    std::vector<PublicKey> keys_;
    Miniscript ms_;
};

// ---------------------------------------------------------------------------
// Wpkh -- pay to witness public key hash, "elwpkh(K)"
// ---------------------------------------------------------------------------
class Wpkh {
public:
    /// Fails with COMPRESSED_ONLY for uncompressed keys and BAD_KEY for
    /// x-only keys.
    static core::Result<Wpkh> create(PublicKey pk);

    static core::Result<Wpkh> from_tree(const Tree& tree);
    static core::Result<Wpkh> from_str(std::string_view s);

    [[nodiscard]] const PublicKey& key() const noexcept { return pk_; }

    /// "wpkh(K)", without prefix or checksum.
    [[nodiscard]] std::string body() const;
    [[nodiscard]] std::string to_string() const;
    core::Result<void> sanity_check() const { return core::make_ok(); }

    [[nodiscard]] Script script_pubkey() const;
    [[nodiscard]] Script unsigned_script_sig() const { return Script(); }
    [[nodiscard]] Script explicit_script() const { return script_pubkey(); }
    /// The P2PKH script the BIP143 digest commits to.
    [[nodiscard]] Script script_code() const;

    /// Witness [<sig>, <pk>].  Fails with MISSING_SIG without a signature.
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
    core::Result<Wpkh> translate_keys(const KeyTranslator& t) const;

    bool operator==(const Wpkh&) const = default;

private:
    explicit Wpkh(PublicKey pk) : pk_(std::move(pk)) {}

    PublicKey pk_;
};

// ---------------------------------------------------------------------------
// Wsh -- pay to witness script hash, "elwsh(ms)" or "elwsh(sortedmulti(..))"
// ---------------------------------------------------------------------------
class Wsh {
public:
    using Inner = std::variant<SortedMulti, Miniscript>;

    /// Wrap a SEGWITV0 Miniscript after the top-level checks.
    static core::Result<Wsh> create(Miniscript ms);
    static core::Result<Wsh> create(SortedMulti sorted);

    static core::Result<Wsh> from_tree(const Tree& tree);
    static core::Result<Wsh> from_str(std::string_view s);

    [[nodiscard]] const Inner& inner() const noexcept { return inner_; }
    /// The Miniscript that is encoded as the witness script.
    [[nodiscard]] const Miniscript& miniscript() const;

    /// "wsh(...)", without prefix or checksum.
    [[nodiscard]] std::string body() const;
    [[nodiscard]] std::string to_string() const;
    core::Result<void> sanity_check() const;

    [[nodiscard]] Script script_pubkey() const;
    [[nodiscard]] Script unsigned_script_sig() const { return Script(); }
    [[nodiscard]] Script explicit_script() const {
        return miniscript().encode();
    }
    [[nodiscard]] Script script_code() const { return explicit_script(); }

    /// The satisfaction followed by the witness script.
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
    core::Result<Wsh> translate_keys(const KeyTranslator& t) const;

    bool operator==(const Wsh&) const = default;

private:
    explicit Wsh(Inner inner) : inner_(std::move(inner)) {}

    Inner inner_;
};

/// Whether @p tree is written "sortedmulti(...)", with or without "el".
[[nodiscard]] bool is_sortedmulti_tree(const Tree& tree);

/// Witness of a script-hash spend: @p ms satisfied, then its encoding
/// appended as the last item.
core::Result<Witness> script_hash_witness(const Miniscript& ms,
                                          const Satisfier& sat,
                                          bool non_malleable);

/// Weight of a P2WSH-style witness spending @p ms.
core::Result<size_t> witness_script_weight(const Miniscript& ms);

} // namespace descriptor
