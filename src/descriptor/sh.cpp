// Copyright (c) 2024-2026 The ELMS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "descriptor/sh.h"
#include "crypto/hash.h"
#include "descriptor/bare.h"

namespace descriptor {

using core::ErrorCode;
using core::make_error;

namespace {

// scriptSig bytes of a Legacy spend: the satisfaction pushes followed by
// the push of the redeem script.
core::Result<size_t> legacy_weight(const Miniscript& ms) {
    auto sat_size = ms.max_satisfaction_size();
    if (!sat_size) {
        return make_error(ErrorCode::IMPOSSIBLE_SATISFACTION,
                          "no satisfaction for " + ms.to_string());
    }
    const size_t script_size = ms.script_size();
    const size_t len = push_opcode_size(script_size) + script_size + *sat_size;
    return 4 * (varint_len(len) + len);
}

Script push_script(const Script& script) {
    Script out;
    out.push_data(script.span());
    return out;
}

} // anonymous namespace

core::Result<Sh> Sh::create(Miniscript ms) {
    ELMS_TRY_VOID(miniscript::top_level_checks(Context::LEGACY, ms.node()));
    return Sh(Inner(std::move(ms)));
}

core::Result<Sh> Sh::create(Inner inner) {
    if (const auto* ms = std::get_if<Miniscript>(&inner)) {
        return create(*ms);
    }
    return Sh(std::move(inner));
}

core::Result<Sh> Sh::from_tree(const Tree& tree) {
    if (strip_elements_prefix(tree.name) != "sh" || tree.args.size() != 1) {
        return unexpected_tree(tree, "elsh");
    }
    const Tree& arg = tree.args[0];
    const std::string_view name = strip_elements_prefix(arg.name);
    if (name == "wsh") {
        ELMS_TRY_ASSIGN(wsh, Wsh::from_tree(arg));
        return Sh(Inner(std::move(wsh)));
    }
    if (name == "wpkh") {
        ELMS_TRY_ASSIGN(wpkh, Wpkh::from_tree(arg));
        return Sh(Inner(std::move(wpkh)));
    }
    if (name == "sortedmulti") {
        ELMS_TRY_ASSIGN(sorted, SortedMulti::from_tree(arg, Context::LEGACY));
        return Sh(Inner(std::move(sorted)));
    }
    ELMS_TRY_ASSIGN(ms, Miniscript::from_tree(arg, Context::LEGACY));
    return create(std::move(ms));
}

core::Result<Sh> Sh::from_str(std::string_view s) {
    ELMS_TRY_ASSIGN(tree, parse_descriptor_tree(s));
    return from_tree(tree);
}

std::string Sh::to_string() const {
    std::string inner;
    if (const auto* wsh = std::get_if<Wsh>(&inner_)) {
        inner = wsh->body();
    } else if (const auto* wpkh = std::get_if<Wpkh>(&inner_)) {
        inner = wpkh->body();
    } else if (const auto* sorted = std::get_if<SortedMulti>(&inner_)) {
        inner = sorted->to_string();
    } else {
        inner = std::get<Miniscript>(inner_).to_string();
    }
    return add_checksum(std::string(ELEMENTS_PREFIX) + "sh(" + inner + ")");
}

core::Result<void> Sh::sanity_check() const {
    if (const auto* wsh = std::get_if<Wsh>(&inner_)) {
        return wsh->sanity_check();
    }
    if (std::holds_alternative<Wpkh>(inner_)) return core::make_ok();
    return legacy_miniscript().sanity_check();
}

const Miniscript& Sh::legacy_miniscript() const {
    if (const auto* sorted = std::get_if<SortedMulti>(&inner_)) {
        return sorted->miniscript();
    }
    return std::get<Miniscript>(inner_);
}

Script Sh::redeem_script() const {
    if (const auto* wsh = std::get_if<Wsh>(&inner_)) {
        return wsh->script_pubkey();
    }
    if (const auto* wpkh = std::get_if<Wpkh>(&inner_)) {
        return wpkh->script_pubkey();
    }
    return legacy_miniscript().encode();
}

Script Sh::script_pubkey() const {
    return Script::p2sh(crypto::hash160(redeem_script().span()));
}

Script Sh::unsigned_script_sig() const {
    if (std::holds_alternative<Wsh>(inner_) ||
        std::holds_alternative<Wpkh>(inner_)) {
        return push_script(redeem_script());
    }
    return Script();
}

Script Sh::explicit_script() const {
    if (const auto* wsh = std::get_if<Wsh>(&inner_)) {
        return wsh->explicit_script();
    }
    return redeem_script();
}

Script Sh::script_code() const {
    if (const auto* wsh = std::get_if<Wsh>(&inner_)) {
        return wsh->script_code();
    }
    if (const auto* wpkh = std::get_if<Wpkh>(&inner_)) {
        return wpkh->script_code();
    }
    return legacy_miniscript().encode();
}

core::Result<Satisfaction> Sh::satisfy(const Satisfier& sat,
                                       bool non_malleable) const {
    if (const auto* wsh = std::get_if<Wsh>(&inner_)) {
        ELMS_TRY_ASSIGN(inner, non_malleable ? wsh->get_satisfaction(sat)
                                             : wsh->get_satisfaction_mall(sat));
        return Satisfaction{std::move(inner.witness), unsigned_script_sig()};
    }
    if (const auto* wpkh = std::get_if<Wpkh>(&inner_)) {
        ELMS_TRY_ASSIGN(inner, wpkh->get_satisfaction(sat));
        return Satisfaction{std::move(inner.witness), unsigned_script_sig()};
    }

    const Miniscript& ms = legacy_miniscript();
    ELMS_TRY_ASSIGN(witness, non_malleable ? ms.satisfy(sat)
                                           : ms.satisfy_malleable(sat));
    Script script_sig = miniscript::witness_to_script_sig(witness);
    script_sig.push_data(ms.encode().span());
    return Satisfaction{{}, std::move(script_sig)};
}

core::Result<Satisfaction> Sh::get_satisfaction(const Satisfier& sat) const {
    return satisfy(sat, true);
}

core::Result<Satisfaction> Sh::get_satisfaction_mall(
    const Satisfier& sat) const {
    return satisfy(sat, false);
}

core::Result<size_t> Sh::max_satisfaction_weight() const {
    if (const auto* wsh = std::get_if<Wsh>(&inner_)) {
        ELMS_TRY_ASSIGN(inner, wsh->max_satisfaction_weight());
        return 4 * 35 + inner;
    }
    if (const auto* wpkh = std::get_if<Wpkh>(&inner_)) {
        ELMS_TRY_ASSIGN(inner, wpkh->max_satisfaction_weight());
        return 4 * 23 + inner;
    }
    return legacy_weight(legacy_miniscript());
}

core::Result<Address> Sh::address(const AddressParams& params) const {
    return Address::p2sh(crypto::hash160(redeem_script().span()), params);
}

core::Result<Address> Sh::blind_addr(
    const std::optional<PublicKey>& blinder,
    const AddressParams& params) const {
    ELMS_TRY_ASSIGN(addr, address(params));
    return blind_address(addr, blinder);
}

bool Sh::for_each_key(const KeyPredicate& pred) const {
    if (const auto* wsh = std::get_if<Wsh>(&inner_)) {
        return wsh->for_each_key(pred);
    }
    if (const auto* wpkh = std::get_if<Wpkh>(&inner_)) {
        return wpkh->for_each_key(pred);
    }
    if (const auto* sorted = std::get_if<SortedMulti>(&inner_)) {
        return sorted->for_each_key(pred);
    }
    return std::get<Miniscript>(inner_).for_each_key(pred);
}

core::Result<Sh> Sh::translate_keys(const KeyTranslator& t) const {
    if (const auto* wsh = std::get_if<Wsh>(&inner_)) {
        ELMS_TRY_ASSIGN(translated, wsh->translate_keys(t));
        return create(Inner(std::move(translated)));
    }
    if (const auto* wpkh = std::get_if<Wpkh>(&inner_)) {
        ELMS_TRY_ASSIGN(translated, wpkh->translate_keys(t));
        return create(Inner(std::move(translated)));
    }
    if (const auto* sorted = std::get_if<SortedMulti>(&inner_)) {
        ELMS_TRY_ASSIGN(translated, sorted->translate_keys(t));
        return create(Inner(std::move(translated)));
    }
    ELMS_TRY_ASSIGN(ms, std::get<Miniscript>(inner_).translate(t));
    return create(std::move(ms));
}

} // namespace descriptor
