// Copyright (c) 2024-2026 The ELMS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "descriptor/bare.h"
#include "core/logging.h"
#include "crypto/hash.h"

namespace descriptor {

using core::ErrorCode;
using core::make_error;

core::Error unexpected_tree(const Tree& tree, std::string_view what) {
    return make_error(ErrorCode::UNEXPECTED,
                      tree.name + "(" + std::to_string(tree.args.size()) +
                          " args) while parsing " + std::string(what) +
                          " descriptor");
}

core::Result<PublicKey> single_key_arg(const Tree& tree, std::string_view name,
                                       std::string_view what) {
    if (strip_elements_prefix(tree.name) != name || tree.args.size() != 1 ||
        !tree.args[0].args.empty()) {
        return unexpected_tree(tree, what);
    }
    return PublicKey::from_string(tree.args[0].name);
}

// ===================================================================
// Bare
// ===================================================================

core::Result<Bare> Bare::create(Miniscript ms) {
    ELMS_TRY_VOID(miniscript::top_level_checks(Context::BARE, ms.node()));
    return Bare(std::move(ms));
}

core::Result<Bare> Bare::from_tree(const Tree& tree) {
    Tree stripped = tree;
    stripped.name = std::string(strip_elements_prefix(tree.name));
    ELMS_TRY_ASSIGN(ms, Miniscript::from_tree(stripped, Context::BARE));
    return create(std::move(ms));
}

core::Result<Bare> Bare::from_str(std::string_view s) {
    ELMS_TRY_ASSIGN(tree, parse_descriptor_tree(s));
    return from_tree(tree);
}

std::string Bare::to_string() const {
    // A top-level pkh() alias would re-parse as a Pkh descriptor.
    const miniscript::Node& top = ms_.node();
    if (top.fragment == miniscript::Fragment::WRAP_C &&
        top.subs[0]->fragment == miniscript::Fragment::PK_H &&
        !top.subs[0]->is_raw_pkh()) {
        return add_checksum(std::string(ELEMENTS_PREFIX) + "c:" +
                            miniscript::node_to_string(*top.subs[0]));
    }
    return add_checksum(std::string(ELEMENTS_PREFIX) + ms_.to_string());
}

core::Result<void> Bare::sanity_check() const {
    return ms_.sanity_check();
}

core::Result<Satisfaction> Bare::get_satisfaction(const Satisfier& sat) const {
    ELMS_TRY_ASSIGN(witness, ms_.satisfy(sat));
    return Satisfaction{{}, miniscript::witness_to_script_sig(witness)};
}

core::Result<Satisfaction> Bare::get_satisfaction_mall(
    const Satisfier& sat) const {
    ELMS_TRY_ASSIGN(witness, ms_.satisfy_malleable(sat));
    return Satisfaction{{}, miniscript::witness_to_script_sig(witness)};
}

core::Result<size_t> Bare::max_satisfaction_weight() const {
    auto len = ms_.max_satisfaction_size();
    if (!len) {
        return make_error(ErrorCode::IMPOSSIBLE_SATISFACTION,
                          "no satisfaction for " + ms_.to_string());
    }
    return 4 * (varint_len(*len) + *len);
}

core::Result<Address> Bare::address(const AddressParams& /*params*/) const {
    return make_error(ErrorCode::BARE_DESCRIPTOR_ADDR,
                      "bare descriptors have no address");
}

core::Result<Address> Bare::blind_addr(
    const std::optional<PublicKey>& /*blinder*/,
    const AddressParams& /*params*/) const {
    return make_error(ErrorCode::BARE_DESCRIPTOR_ADDR,
                      "bare descriptors have no address");
}

core::Result<Bare> Bare::translate_keys(const KeyTranslator& t) const {
    ELMS_TRY_ASSIGN(ms, ms_.translate(t));
    return create(std::move(ms));
}

// ===================================================================
// Pkh
// ===================================================================

core::Result<Pkh> Pkh::create(PublicKey pk) {
    ELMS_TRY_VOID(check_full_key(pk, false, "pkh"));
    return Pkh(std::move(pk));
}

core::Result<Pkh> Pkh::from_tree(const Tree& tree) {
    ELMS_TRY_ASSIGN(pk, single_key_arg(tree, "pkh", "elpkh"));
    return create(std::move(pk));
}

core::Result<Pkh> Pkh::from_str(std::string_view s) {
    ELMS_TRY_ASSIGN(tree, parse_descriptor_tree(s));
    return from_tree(tree);
}

std::string Pkh::to_string() const {
    return add_checksum(std::string(ELEMENTS_PREFIX) + "pkh(" +
                        pk_.to_string() + ")");
}

Script Pkh::script_pubkey() const {
    return Script::p2pkh(pk_.hash160().hash);
}

core::Result<Satisfaction> Pkh::get_satisfaction(const Satisfier& sat) const {
    auto sig = sat.lookup_ecdsa_sig(pk_);
    if (!sig) {
        LOG_DEBUG(core::LogCategory::SATISFY,
                  "no signature for pkh key " + pk_.to_string());
        return make_error(ErrorCode::MISSING_SIG,
                          "missing signature for " + pk_.to_string());
    }
    Script script_sig;
    script_sig.push_data(sig->to_vec());
    script_sig.push_data(pk_.span());
    return Satisfaction{{}, std::move(script_sig)};
}

core::Result<size_t> Pkh::max_satisfaction_weight() const {
    return 4 * (1 + MAX_ECDSA_SIG_PUSH + pk_.serialized_len());
}

core::Result<Address> Pkh::address(const AddressParams& params) const {
    return Address::p2pkh(pk_.hash160().hash, params);
}

core::Result<Address> Pkh::blind_addr(
    const std::optional<PublicKey>& blinder,
    const AddressParams& params) const {
    ELMS_TRY_ASSIGN(addr, address(params));
    return blind_address(addr, blinder);
}

core::Result<Pkh> Pkh::translate_keys(const KeyTranslator& t) const {
    ELMS_TRY_ASSIGN(pk, t.pk(pk_));
    return create(std::move(pk));
}

} // namespace descriptor
