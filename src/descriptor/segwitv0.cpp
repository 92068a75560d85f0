// Copyright (c) 2024-2026 The ELMS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "descriptor/segwitv0.h"
#include "core/logging.h"
#include "crypto/hash.h"
#include "descriptor/bare.h"
#include "miniscript/expression.h"

#include <algorithm>

namespace descriptor {

using core::ErrorCode;
using core::make_error;

// ===================================================================
// SortedMulti
// ===================================================================

core::Result<SortedMulti> SortedMulti::create(uint32_t k,
                                              std::vector<PublicKey> keys,
                                              Context ctx) {
    if (keys.empty() || keys.size() >
        static_cast<size_t>(primitives::script::MAX_PUBKEYS_PER_MULTISIG)) {
        return make_error(ErrorCode::BAD_NUMBER,
                          "sortedmulti takes 1 to 20 keys, got " +
                              std::to_string(keys.size()));
    }
    if (k == 0 || k > keys.size()) {
        return make_error(ErrorCode::BAD_NUMBER,
                          "sortedmulti threshold " + std::to_string(k) +
                              " out of range for " +
                              std::to_string(keys.size()) + " keys");
    }

    std::vector<PublicKey> sorted = keys;
    std::sort(sorted.begin(), sorted.end(),
              [](const PublicKey& a, const PublicKey& b) {
                  return a.bytes() < b.bytes();
              });
    ELMS_TRY_ASSIGN(node, miniscript::make_node(ctx,
                                                miniscript::Fragment::MULTI,
                                                {}, std::move(sorted), {}, k));
    ELMS_TRY_VOID(miniscript::check_global_validity(ctx, *node));
    return SortedMulti(k, std::move(keys), Miniscript(std::move(node)));
}

core::Result<SortedMulti> SortedMulti::from_tree(const Tree& tree,
                                                 Context ctx) {
    if (!is_sortedmulti_tree(tree) || tree.args.empty()) {
        return unexpected_tree(tree, "sortedmulti");
    }
    for (const auto& arg : tree.args) {
        if (!arg.args.empty()) return unexpected_tree(tree, "sortedmulti");
    }
    ELMS_TRY_ASSIGN(k, miniscript::parse_num(tree.args[0].name));

    std::vector<PublicKey> keys;
    keys.reserve(tree.args.size() - 1);
    for (size_t i = 1; i < tree.args.size(); ++i) {
        ELMS_TRY_ASSIGN(pk, PublicKey::from_string(tree.args[i].name));
        keys.push_back(std::move(pk));
    }
    return create(k, std::move(keys), ctx);
}

std::string SortedMulti::to_string() const {
    std::string out = "sortedmulti(" + std::to_string(k_);
    for (const auto& pk : keys_) out += "," + pk.to_string();
    return out + ")";
}

bool SortedMulti::for_each_key(const KeyPredicate& pred) const {
    return std::all_of(keys_.begin(), keys_.end(), pred);
}

core::Result<SortedMulti> SortedMulti::translate_keys(
    const KeyTranslator& t) const {
    std::vector<PublicKey> keys;
    keys.reserve(keys_.size());
    for (const auto& pk : keys_) {
        ELMS_TRY_ASSIGN(translated, t.pk(pk));
        keys.push_back(std::move(translated));
    }
    return create(k_, std::move(keys), ms_.context());
}

bool is_sortedmulti_tree(const Tree& tree) {
    return strip_elements_prefix(tree.name) == "sortedmulti";
}

// ===================================================================
// Shared witness-script helpers
// ===================================================================

core::Result<Witness> script_hash_witness(const Miniscript& ms,
                                          const Satisfier& sat,
                                          bool non_malleable) {
    ELMS_TRY_ASSIGN(witness, non_malleable ? ms.satisfy(sat)
                                           : ms.satisfy_malleable(sat));
    witness.push_back(ms.encode().data());
    return witness;
}

core::Result<size_t> witness_script_weight(const Miniscript& ms) {
    auto elems = ms.max_satisfaction_witness_elements();
    auto size = ms.max_satisfaction_size();
    if (!elems || !size) {
        return make_error(ErrorCode::IMPOSSIBLE_SATISFACTION,
                          "no satisfaction for " + ms.to_string());
    }
    const size_t script_size = ms.script_size();
    return 4 + varint_len(script_size) + script_size + varint_len(*elems) +
           *size;
}

// ===================================================================
// Wpkh
// ===================================================================

core::Result<Wpkh> Wpkh::create(PublicKey pk) {
    ELMS_TRY_VOID(check_full_key(pk, true, "wpkh"));
    return Wpkh(std::move(pk));
}

core::Result<Wpkh> Wpkh::from_tree(const Tree& tree) {
    ELMS_TRY_ASSIGN(pk, single_key_arg(tree, "wpkh", "elwpkh"));
    return create(std::move(pk));
}

core::Result<Wpkh> Wpkh::from_str(std::string_view s) {
    ELMS_TRY_ASSIGN(tree, parse_descriptor_tree(s));
    return from_tree(tree);
}

std::string Wpkh::body() const {
    return "wpkh(" + pk_.to_string() + ")";
}

std::string Wpkh::to_string() const {
    return add_checksum(std::string(ELEMENTS_PREFIX) + body());
}

Script Wpkh::script_pubkey() const {
    return Script::p2wpkh(pk_.hash160().hash);
}

Script Wpkh::script_code() const {
    return Script::p2pkh(pk_.hash160().hash);
}

core::Result<Satisfaction> Wpkh::get_satisfaction(const Satisfier& sat) const {
    auto sig = sat.lookup_ecdsa_sig(pk_);
    if (!sig) {
        LOG_DEBUG(core::LogCategory::SATISFY,
                  "no signature for wpkh key " + pk_.to_string());
        return make_error(ErrorCode::MISSING_SIG,
                          "missing signature for " + pk_.to_string());
    }
    return Satisfaction{{sig->to_vec(), pk_.bytes()}, Script()};
}

core::Result<size_t> Wpkh::max_satisfaction_weight() const {
    return 4 + 1 + MAX_ECDSA_SIG_PUSH + pk_.serialized_len();
}

core::Result<Address> Wpkh::address(const AddressParams& params) const {
    return Address::p2wpkh(pk_.hash160().hash, params);
}

core::Result<Address> Wpkh::blind_addr(
    const std::optional<PublicKey>& blinder,
    const AddressParams& params) const {
    ELMS_TRY_ASSIGN(addr, address(params));
    return blind_address(addr, blinder);
}

core::Result<Wpkh> Wpkh::translate_keys(const KeyTranslator& t) const {
    ELMS_TRY_ASSIGN(pk, t.pk(pk_));
    return create(std::move(pk));
}

// ===================================================================
// Wsh
// ===================================================================

core::Result<Wsh> Wsh::create(Miniscript ms) {
    ELMS_TRY_VOID(miniscript::top_level_checks(Context::SEGWITV0, ms.node()));
    return Wsh(Inner(std::move(ms)));
}

core::Result<Wsh> Wsh::create(SortedMulti sorted) {
    return Wsh(Inner(std::move(sorted)));
}

core::Result<Wsh> Wsh::from_tree(const Tree& tree) {
    if (strip_elements_prefix(tree.name) != "wsh" || tree.args.size() != 1) {
        return unexpected_tree(tree, "elwsh");
    }
    const Tree& arg = tree.args[0];
    if (is_sortedmulti_tree(arg)) {
        ELMS_TRY_ASSIGN(sorted, SortedMulti::from_tree(arg, Context::SEGWITV0));
        return create(std::move(sorted));
    }
    ELMS_TRY_ASSIGN(ms, Miniscript::from_tree(arg, Context::SEGWITV0));
    return create(std::move(ms));
}

core::Result<Wsh> Wsh::from_str(std::string_view s) {
    ELMS_TRY_ASSIGN(tree, parse_descriptor_tree(s));
    return from_tree(tree);
}

const Miniscript& Wsh::miniscript() const {
    if (const auto* sorted = std::get_if<SortedMulti>(&inner_)) {
        return sorted->miniscript();
    }
    return std::get<Miniscript>(inner_);
}

std::string Wsh::body() const {
    if (const auto* sorted = std::get_if<SortedMulti>(&inner_)) {
        return "wsh(" + sorted->to_string() + ")";
    }
    return "wsh(" + std::get<Miniscript>(inner_).to_string() + ")";
}

std::string Wsh::to_string() const {
    return add_checksum(std::string(ELEMENTS_PREFIX) + body());
}

core::Result<void> Wsh::sanity_check() const {
    return miniscript().sanity_check();
}

Script Wsh::script_pubkey() const {
    return Script::p2wsh(crypto::sha256(explicit_script().span()));
}

core::Result<Satisfaction> Wsh::get_satisfaction(const Satisfier& sat) const {
    ELMS_TRY_ASSIGN(witness, script_hash_witness(miniscript(), sat, true));
    return Satisfaction{std::move(witness), Script()};
}

core::Result<Satisfaction> Wsh::get_satisfaction_mall(
    const Satisfier& sat) const {
    ELMS_TRY_ASSIGN(witness, script_hash_witness(miniscript(), sat, false));
    return Satisfaction{std::move(witness), Script()};
}

core::Result<size_t> Wsh::max_satisfaction_weight() const {
    return witness_script_weight(miniscript());
}

core::Result<Address> Wsh::address(const AddressParams& params) const {
    return Address::p2wsh(crypto::sha256(explicit_script().span()), params);
}

core::Result<Address> Wsh::blind_addr(
    const std::optional<PublicKey>& blinder,
    const AddressParams& params) const {
    ELMS_TRY_ASSIGN(addr, address(params));
    return blind_address(addr, blinder);
}

bool Wsh::for_each_key(const KeyPredicate& pred) const {
    if (const auto* sorted = std::get_if<SortedMulti>(&inner_)) {
        return sorted->for_each_key(pred);
    }
    return std::get<Miniscript>(inner_).for_each_key(pred);
}

core::Result<Wsh> Wsh::translate_keys(const KeyTranslator& t) const {
    if (const auto* sorted = std::get_if<SortedMulti>(&inner_)) {
        ELMS_TRY_ASSIGN(translated, sorted->translate_keys(t));
        return create(std::move(translated));
    }
    ELMS_TRY_ASSIGN(ms, std::get<Miniscript>(inner_).translate(t));
    return create(std::move(ms));
}

} // namespace descriptor
