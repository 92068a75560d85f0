// Copyright (c) 2024-2026 The ELMS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "interpreter/inner.h"
#include "core/logging.h"
#include "crypto/hash.h"
#include "crypto/secp256k1.h"
#include "descriptor/covenant.h"
#include "interpreter/control_block.h"
#include "miniscript/node.h"

namespace interpreter {

using core::ErrorCode;
using core::make_error;
using miniscript::Context;
using miniscript::Miniscript;
using primitives::script::Script;

std::string_view pubkey_type_name(PubkeyType t) noexcept {
    switch (t) {
    case PubkeyType::PK:      return "pk";
    case PubkeyType::PKH:     return "pkh";
    case PubkeyType::WPKH:    return "wpkh";
    case PubkeyType::SH_WPKH: return "sh-wpkh";
    case PubkeyType::TR:      return "tr";
    }
    return "unknown";
}

std::string_view script_type_name(ScriptType t) noexcept {
    switch (t) {
    case ScriptType::BARE:   return "bare";
    case ScriptType::SH:     return "sh";
    case ScriptType::WSH:    return "wsh";
    case ScriptType::SH_WSH: return "sh-wsh";
    case ScriptType::TR:     return "tr";
    }
    return "unknown";
}

namespace {

using Witness = std::vector<std::vector<uint8_t>>;

core::Error non_empty_witness() {
    return make_error(ErrorCode::NON_EMPTY_WITNESS,
                      "legacy spend had nonempty witness");
}

core::Error non_empty_script_sig() {
    return make_error(ErrorCode::NON_EMPTY_SCRIPT_SIG,
                      "segwit spend had nonempty scriptsig");
}

core::Error stack_end() {
    return make_error(ErrorCode::UNEXPECTED_STACK_END,
                      "unexpected end of stack");
}

core::Error parse_error(const core::Error& e) {
    return make_error(e.code(), "parse error: " + e.message());
}

// Full keys only.  A popped element of any other length is not a key.
core::Result<BitcoinKey> pk_from_slice(std::span<const uint8_t> bytes,
                                       bool require_compressed) {
    if (bytes.size() != 33 && bytes.size() != 65) {
        return make_error(ErrorCode::PUBKEY_PARSE, "could not parse pubkey");
    }
    auto pk = BitcoinKey::from_bytes(bytes);
    if (!pk) {
        return make_error(ErrorCode::PUBKEY_PARSE, "could not parse pubkey");
    }
    if (require_compressed && pk.value().is_uncompressed()) {
        return make_error(ErrorCode::UNCOMPRESSED_PUBKEY,
                          "uncompressed pubkey in non-legacy descriptor");
    }
    return pk;
}

core::Result<BitcoinKey> pk_from_element(const Element& elem,
                                         bool require_compressed) {
    if (!elem.is_push()) {
        return make_error(ErrorCode::PUBKEY_PARSE, "could not parse pubkey");
    }
    return pk_from_slice(elem.data, require_compressed);
}

// Parses under @p ctx so context rules (x-only keys, multi_a) apply.
core::Result<Miniscript> script_from_element(const Element& elem,
                                             Context ctx) {
    switch (elem.kind) {
    case Element::Kind::PUSH: {
        auto ms = Miniscript::parse_insane(Script(elem.data), ctx);
        if (!ms) return parse_error(ms.error());
        return ms;
    }
    case Element::Kind::SATISFIED: {
        ELMS_TRY_ASSIGN(node,
                        miniscript::make_node(ctx, miniscript::Fragment::JUST_1));
        return Miniscript(std::move(node));
    }
    case Element::Kind::DISSATISFIED:
        break;
    }
    ELMS_TRY_ASSIGN(node,
                    miniscript::make_node(ctx, miniscript::Fragment::JUST_0));
    return Miniscript(std::move(node));
}

core::Result<Miniscript> no_checks(const Miniscript& ms) {
    auto converted = ms.to_no_checks();
    if (!converted) return parse_error(converted.error());
    return converted;
}

TxData make_txdata(Inner inner, Stack stack,
                   std::optional<Script> script_code) {
    return TxData{std::move(inner), std::move(stack), std::move(script_code)};
}

// ---------------------------------------------------------------------------
// Per-shape classifiers
// ---------------------------------------------------------------------------

core::Result<TxData> classify_p2pk(const Script& spk, Stack ssig,
                                   const Stack& wit) {
    if (!wit.empty()) return non_empty_witness();
    auto raw = spk.get_p2pk_key();
    if (!raw) {
        return make_error(ErrorCode::PUBKEY_PARSE, "could not parse pubkey");
    }
    ELMS_TRY_ASSIGN(pk, pk_from_slice(*raw, false));
    return make_txdata(InnerPublicKey{std::move(pk), PubkeyType::PK},
                       std::move(ssig), spk);
}

core::Result<TxData> classify_p2pkh(const Script& spk, Stack ssig,
                                    const Stack& wit) {
    if (!wit.empty()) return non_empty_witness();
    auto elem = ssig.pop();
    if (!elem) return stack_end();
    ELMS_TRY_ASSIGN(pk, pk_from_element(*elem, false));
    if (spk != Script::p2pkh(pk.hash160().hash)) {
        return make_error(ErrorCode::INCORRECT_PUBKEY_HASH,
                          "public key did not match scriptpubkey");
    }
    return make_txdata(InnerPublicKey{std::move(pk), PubkeyType::PKH},
                       std::move(ssig), spk);
}

core::Result<TxData> classify_p2wpkh(const Script& spk, const Stack& ssig,
                                     Stack wit) {
    if (!ssig.empty()) return non_empty_script_sig();
    auto elem = wit.pop();
    if (!elem) return stack_end();
    ELMS_TRY_ASSIGN(pk, pk_from_element(*elem, true));
    const auto hash = pk.hash160().hash;
    if (spk != Script::p2wpkh(hash)) {
        return make_error(ErrorCode::INCORRECT_WPUBKEY_HASH,
                          "public key did not match scriptpubkey (segwit v0)");
    }
    // BIP143 signs a P2PKH script code for P2WPKH.
    return make_txdata(InnerPublicKey{std::move(pk), PubkeyType::WPKH},
                       std::move(wit), Script::p2pkh(hash));
}

core::Result<TxData> classify_p2wsh(const Script& spk, const Stack& ssig,
                                    Stack wit) {
    if (!ssig.empty()) return non_empty_script_sig();
    auto elem = wit.pop();
    if (!elem) return stack_end();

    if (elem->is_push()) {
        const Script witness_script(elem->data);
        auto cov = descriptor::parse_cov_components(witness_script,
                                                    Context::NO_CHECKS);
        if (cov) {
            if (spk != Script::p2wsh(crypto::sha256(witness_script.span()))) {
                return make_error(ErrorCode::INCORRECT_WSCRIPT_HASH,
                                  "witness script did not match scriptpubkey");
            }
            auto parts = std::move(cov).value();
            LOG_DEBUG(core::LogCategory::INTERPRETER,
                      "p2wsh witness script is a covenant on " +
                          parts.pk.to_string());
            return make_txdata(
                InnerCovScript{std::move(parts.pk), std::move(parts.ms)},
                std::move(wit), descriptor::post_codesep_script());
        }
    }

    ELMS_TRY_ASSIGN(ms, script_from_element(*elem, Context::SEGWITV0));
    Script script = ms.encode();
    if (spk != Script::p2wsh(crypto::sha256(script.span()))) {
        return make_error(ErrorCode::INCORRECT_WSCRIPT_HASH,
                          "witness script did not match scriptpubkey");
    }
    ELMS_TRY_ASSIGN(converted, no_checks(ms));
    return make_txdata(InnerScript{std::move(converted), ScriptType::WSH},
                       std::move(wit), std::move(script));
}

core::Result<TxData> classify_p2tr(const Script& spk, const Stack& ssig,
                                   Stack wit) {
    if (!ssig.empty()) return non_empty_script_sig();

    auto key_bytes = spk.get_p2tr_key();
    if (!key_bytes) {
        return make_error(ErrorCode::XONLY_PUBKEY_PARSE,
                          "could not parse x-only pubkey");
    }
    auto output_key = BitcoinKey::from_bytes(key_bytes->span());
    if (!output_key) {
        return make_error(ErrorCode::XONLY_PUBKEY_PARSE,
                          "could not parse x-only pubkey");
    }

    const Element* top = wit.top();
    const bool has_annex = top != nullptr && top->is_push() &&
                           !top->data.empty() &&
                           top->data[0] ==
                               primitives::script::TAPROOT_ANNEX_PREFIX &&
                           wit.size() >= 2;
    if (has_annex) {
        return make_error(ErrorCode::TAP_ANNEX_UNSUPPORTED,
                          "Encountered annex element");
    }

    if (wit.empty()) return stack_end();
    if (wit.size() == 1) {
        return make_txdata(
            InnerPublicKey{std::move(output_key).value(), PubkeyType::TR},
            std::move(wit), std::nullopt);
    }

    auto ctrl_elem = wit.pop();
    auto script_elem = wit.pop();
    if (!ctrl_elem || !script_elem) return stack_end();
    ELMS_TRY_ASSIGN(ctrl_bytes, ctrl_elem->as_push());
    auto ctrl = ControlBlock::from_slice(ctrl_bytes);
    if (!ctrl) return ctrl.error();

    ELMS_TRY_ASSIGN(ms, script_from_element(*script_elem, Context::TAP));
    Script tap_script = ms.encode();
    const auto& q = output_key.value().bytes();
    if (!ctrl.value().verify_taproot_commitment(
            std::span<const uint8_t, 32>(q.data(), 32), tap_script)) {
        return make_error(ErrorCode::CONTROL_BLOCK_VERIFICATION,
                          "Control block verification failed");
    }
    ELMS_TRY_ASSIGN(converted, no_checks(ms));
    return make_txdata(InnerScript{std::move(converted), ScriptType::TR},
                       std::move(wit), std::move(tap_script));
}

core::Result<TxData> classify_sh_wpkh(std::span<const uint8_t> redeem,
                                      const Stack& ssig, Stack wit) {
    auto elem = wit.pop();
    if (!elem) return stack_end();
    if (!ssig.empty()) return non_empty_script_sig();
    ELMS_TRY_ASSIGN(pk, pk_from_element(*elem, true));
    const auto hash = pk.hash160().hash;
    if (Script(redeem) != Script::p2wpkh(hash)) {
        return make_error(ErrorCode::INCORRECT_WSCRIPT_HASH,
                          "witness script did not match scriptpubkey");
    }
    return make_txdata(InnerPublicKey{std::move(pk), PubkeyType::SH_WPKH},
                       std::move(wit), Script::p2pkh(hash));
}

core::Result<TxData> classify_sh_wsh(std::span<const uint8_t> redeem,
                                     const Stack& ssig, Stack wit) {
    auto elem = wit.pop();
    if (!elem) return stack_end();
    if (!ssig.empty()) return non_empty_script_sig();
    ELMS_TRY_ASSIGN(ms, script_from_element(*elem, Context::SEGWITV0));
    Script script = ms.encode();
    if (Script(redeem) != Script::p2wsh(crypto::sha256(script.span()))) {
        return make_error(ErrorCode::INCORRECT_WSCRIPT_HASH,
                          "witness script did not match scriptpubkey");
    }
    ELMS_TRY_ASSIGN(converted, no_checks(ms));
    return make_txdata(InnerScript{std::move(converted), ScriptType::SH_WSH},
                       std::move(wit), std::move(script));
}

core::Result<TxData> classify_p2sh(const Script& spk, Stack ssig, Stack wit) {
    auto elem = ssig.pop();
    if (!elem) return stack_end();

    if (elem->is_push()) {
        const auto& redeem = elem->data;
        if (spk != Script::p2sh(crypto::hash160(redeem))) {
            return make_error(ErrorCode::INCORRECT_SCRIPT_HASH,
                              "redeem script did not match scriptpubkey");
        }
        if (redeem.size() == 22 && redeem[0] == 0x00 && redeem[1] == 20) {
            return classify_sh_wpkh(redeem, ssig, std::move(wit));
        }
        if (redeem.size() == 34 && redeem[0] == 0x00 && redeem[1] == 32) {
            return classify_sh_wsh(redeem, ssig, std::move(wit));
        }
    }

    ELMS_TRY_ASSIGN(ms, script_from_element(*elem, Context::LEGACY));
    Script script = ms.encode();
    if (!wit.empty()) return non_empty_witness();
    if (spk != Script::p2sh(crypto::hash160(script.span()))) {
        return make_error(ErrorCode::INCORRECT_SCRIPT_HASH,
                          "redeem script did not match scriptpubkey");
    }
    ELMS_TRY_ASSIGN(converted, no_checks(ms));
    return make_txdata(InnerScript{std::move(converted), ScriptType::SH},
                       std::move(ssig), std::move(script));
}

core::Result<TxData> classify_bare(const Script& spk, Stack ssig,
                                   const Stack& wit) {
    if (!wit.empty()) return non_empty_witness();
    auto ms = Miniscript::parse_insane(spk, Context::BARE);
    if (!ms) return parse_error(ms.error());
    ELMS_TRY_ASSIGN(converted, no_checks(ms.value()));
    return make_txdata(InnerScript{std::move(converted), ScriptType::BARE},
                       std::move(ssig), spk);
}

std::string describe(const Inner& inner) {
    if (const auto* pk = std::get_if<InnerPublicKey>(&inner)) {
        return std::string(pubkey_type_name(pk->type)) + " key " +
               pk->key.to_string();
    }
    if (const auto* script = std::get_if<InnerScript>(&inner)) {
        return std::string(script_type_name(script->type)) + " script " +
               script->ms.to_string();
    }
    const auto& cov = std::get<InnerCovScript>(inner);
    return "covenant on " + cov.key.to_string() + " with " +
           cov.ms.to_string();
}

} // anonymous namespace

core::Result<TxData> from_txdata(const Script& spk, const Script& script_sig,
                                 const Witness& witness) {
    ELMS_TRY_ASSIGN(ssig, Stack::from_script_sig(script_sig));
    Stack wit = Stack::from_witness(witness);

    core::Result<TxData> result = [&]() -> core::Result<TxData> {
        if (spk.is_p2pk()) return classify_p2pk(spk, std::move(ssig), wit);
        if (spk.is_p2pkh()) return classify_p2pkh(spk, std::move(ssig), wit);
        if (spk.is_p2wpkh()) return classify_p2wpkh(spk, ssig, std::move(wit));
        if (spk.is_p2wsh()) return classify_p2wsh(spk, ssig, std::move(wit));
        if (spk.is_p2tr()) return classify_p2tr(spk, ssig, std::move(wit));
        if (spk.is_p2sh()) {
            return classify_p2sh(spk, std::move(ssig), std::move(wit));
        }
        return classify_bare(spk, std::move(ssig), wit);
    }();

    if (result) {
        LOG_DEBUG(core::LogCategory::INTERPRETER,
                  "classified spend as " + describe(result.value().inner));
    } else {
        LOG_TRACE(core::LogCategory::INTERPRETER,
                  "classification failed: " + result.error().message());
    }
    return result;
}

} // namespace interpreter
