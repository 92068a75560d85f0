// Copyright (c) 2024-2026 The ELMS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "descriptor/covenant.h"
#include "core/logging.h"
#include "core/serialize.h"
#include "core/stream.h"
#include "crypto/hash.h"
#include "descriptor/bare.h"
#include "primitives/script/opcodes.h"

#include <array>

namespace descriptor {

using core::ErrorCode;
using core::make_error;
using primitives::script::MAX_OPS_PER_SCRIPT;
using primitives::script::MAX_SCRIPT_SIZE;
using primitives::script::Opcode;

namespace {

/// Standardness ceiling on a P2WSH witness script.
constexpr size_t MAX_STANDARD_P2WSH_SCRIPT_SIZE = 3600;

// ---------------------------------------------------------------------------
// Covenant recognizer
// ---------------------------------------------------------------------------
// One state per token, walked from the end of the script towards the
// start.  Any mismatch rejects the script.
// ---------------------------------------------------------------------------

enum class Expect : uint8_t { OPCODE, PUBKEY, NUMBER };

struct CovState {
    Expect kind;
    Opcode opcode;
    int64_t number;
};

constexpr CovState op(Opcode o) { return {Expect::OPCODE, o, 0}; }
constexpr CovState num(int64_t n) { return {Expect::NUMBER, Opcode::OP_0, n}; }
constexpr CovState pubkey() { return {Expect::PUBKEY, Opcode::OP_0, 0}; }

constexpr std::array<CovState, 26> COV_STATES = {
    op(Opcode::OP_CHECKSIGFROMSTACK),
    op(Opcode::OP_FROMALTSTACK),
    op(Opcode::OP_SHA256),
    op(Opcode::OP_CAT), op(Opcode::OP_CAT), op(Opcode::OP_CAT),
    op(Opcode::OP_CAT), op(Opcode::OP_CAT), op(Opcode::OP_CAT),
    op(Opcode::OP_CAT), op(Opcode::OP_CAT), op(Opcode::OP_CAT),
    op(Opcode::OP_CAT),
    op(Opcode::OP_VERIFY),
    op(Opcode::OP_CHECKSIG),
    op(Opcode::OP_CODESEPARATOR),
    op(Opcode::OP_TOALTSTACK),
    op(Opcode::OP_DUP),
    pubkey(),
    op(Opcode::OP_CAT),
    op(Opcode::OP_LEFT),
    num(1),
    op(Opcode::OP_OVER),
    op(Opcode::OP_PICK),
    num(11),
    op(Opcode::OP_VERIFY),
};

bool is_cov_pubkey(const miniscript::Token& tok) {
    if (!primitives::script::is_push_opcode(tok.opcode)) return false;
    return tok.data.size() == 33 || tok.data.size() == 65;
}

template <typename T>
std::vector<uint8_t> serialize_item(const T& obj) {
    core::DataStream s;
    obj.serialize(s);
    return s.release();
}

std::vector<uint8_t> u32_le(uint32_t v) {
    core::DataStream s;
    core::ser_write_u32(s, v);
    return s.release();
}

std::vector<uint8_t> hash_bytes(const core::uint256& h) {
    auto span = h.span();
    return std::vector<uint8_t>(span.begin(), span.end());
}

core::Error missing_item(uint32_t index, std::string_view what) {
    auto err = make_error(ErrorCode::MISSING_SIGHASH_ITEM,
                          "missing covenant sighash item " +
                              std::to_string(index) + " (" +
                              std::string(what) + ")");
    err.with_index(index);
    return err;
}

size_t free_verify_adjust(const Miniscript& ms) {
    return ms.has_free_verify() ? 1 : 0;
}

} // anonymous namespace

// ===================================================================
// Script pieces
// ===================================================================

Script post_codesep_script() {
    Script s;
    s.push_opcode(Opcode::OP_CHECKSIGVERIFY);
    for (int i = 0; i < 10; ++i) s.push_opcode(Opcode::OP_CAT);
    s.push_opcode(Opcode::OP_SHA256);
    s.push_opcode(Opcode::OP_FROMALTSTACK);
    s.push_opcode(Opcode::OP_CHECKSIGFROMSTACK);
    return s;
}

core::Result<PublicKey> check_cov_script(
    std::vector<miniscript::Token>& tokens) {
    auto reject = [](std::string_view why) {
        return make_error(ErrorCode::BAD_COV_DESCRIPTOR,
                          "not a covenant script: " + std::string(why));
    };
    if (tokens.size() < COV_STATES.size()) return reject("too short");

    std::optional<PublicKey> pk;
    size_t pos = tokens.size();
    for (const auto& state : COV_STATES) {
        const auto& tok = tokens[--pos];
        switch (state.kind) {
        case Expect::OPCODE:
            if (tok.opcode != state.opcode) {
                return reject("expected " +
                              std::string(primitives::script::opcode_name(
                                  state.opcode)));
            }
            break;
        case Expect::NUMBER: {
            auto n = miniscript::parse_script_num(tok);
            if (!n || *n != state.number) {
                return reject("expected " + std::to_string(state.number));
            }
            break;
        }
        case Expect::PUBKEY: {
            if (!is_cov_pubkey(tok)) return reject("expected a public key");
            auto key = PublicKey::from_bytes(tok.data);
            if (!key) return reject("invalid public key");
            pk = std::move(key).value();
            break;
        }
        }
    }
    tokens.resize(pos);
    return *pk;
}

core::Result<CovComponents> parse_cov_components(const Script& script,
                                                 Context ctx) {
    ELMS_TRY_ASSIGN(tokens, miniscript::lex(script));
    ELMS_TRY_ASSIGN(pk, check_cov_script(tokens));
    ELMS_TRY_ASSIGN(node, miniscript::decode_tokens(tokens, ctx));
    ELMS_TRY_VOID(miniscript::check_global_validity(Context::SEGWITV0, *node));
    ELMS_TRY_VOID(miniscript::top_level_type_check(*node));
    LOG_TRACE(core::LogCategory::DESCRIPTOR,
              "recognized covenant for key " + pk.to_string());
    return CovComponents{std::move(pk), Miniscript(std::move(node))};
}

// ===================================================================
// CovenantDescriptor
// ===================================================================

core::Result<CovenantDescriptor> CovenantDescriptor::create(PublicKey pk,
                                                            Miniscript ms) {
    ELMS_TRY_VOID(check_full_key(pk, false, "elcovwsh"));

    auto ops = ms.ops_count_sat();
    if (!ops) {
        return make_error(ErrorCode::IMPOSSIBLE_SATISFACTION,
                          "covenant miniscript has no satisfaction");
    }
    const size_t total_ops = *ops + COV_SCRIPT_OPS - free_verify_adjust(ms);
    if (total_ops > static_cast<size_t>(MAX_OPS_PER_SCRIPT)) {
        return make_error(ErrorCode::IMPOSSIBLE_SATISFACTION,
                          "covenant needs " + std::to_string(total_ops) +
                              " opcodes, limit is " +
                              std::to_string(MAX_OPS_PER_SCRIPT));
    }

    CovenantDescriptor cov(std::move(pk), std::move(ms));
    if (cov.cov_script_size() > MAX_SCRIPT_SIZE) {
        return make_error(ErrorCode::SCRIPT_SIZE_TOO_LARGE,
                          "covenant script of " +
                              std::to_string(cov.cov_script_size()) +
                              " bytes");
    }
    return cov;
}

core::Result<CovenantDescriptor> CovenantDescriptor::from_tree(
    const Tree& tree) {
    if (strip_elements_prefix(tree.name) != "covwsh" ||
        tree.args.size() != 2 || !tree.args[0].args.empty()) {
        return unexpected_tree(tree, "elcovwsh");
    }
    ELMS_TRY_ASSIGN(pk, PublicKey::from_string(tree.args[0].name));
    ELMS_TRY_ASSIGN(ms, Miniscript::from_tree(tree.args[1], Context::SEGWITV0));
    ELMS_TRY_VOID(miniscript::top_level_checks(Context::SEGWITV0, ms.node()));
    return create(std::move(pk), std::move(ms));
}

core::Result<CovenantDescriptor> CovenantDescriptor::from_str(
    std::string_view s) {
    ELMS_TRY_ASSIGN(tree, parse_descriptor_tree(s));
    return from_tree(tree);
}

core::Result<CovenantDescriptor> CovenantDescriptor::parse_insane(
    const Script& script) {
    ELMS_TRY_ASSIGN(parts, parse_cov_components(script, Context::SEGWITV0));
    return create(std::move(parts.pk), std::move(parts.ms));
}

core::Result<CovenantDescriptor> CovenantDescriptor::parse(
    const Script& script) {
    ELMS_TRY_ASSIGN(cov, parse_insane(script));
    ELMS_TRY_VOID(cov.ms_.sanity_check());
    return cov;
}

size_t CovenantDescriptor::cov_script_size() const {
    // A 65 byte key makes the push 32 bytes longer.
    const size_t key_extra = pk_.is_uncompressed() ? 32 : 0;
    return ms_.script_size() + COV_SCRIPT_SIZE + key_extra -
           free_verify_adjust(ms_);
}

Script CovenantDescriptor::encode() const {
    Script s = ms_.encode();
    std::optional<Opcode> folded;
    if (ms_.has_free_verify() && !s.empty()) {
        folded = primitives::script::verify_variant(
            static_cast<Opcode>(s.data().back()));
    }
    if (folded) {
        s.set_last_opcode(*folded);
    } else {
        s.push_opcode(Opcode::OP_VERIFY);
    }

    s.push_opcode(Opcode::OP_11);
    s.push_opcode(Opcode::OP_PICK);
    s.push_opcode(Opcode::OP_OVER);
    s.push_opcode(Opcode::OP_1);
    s.push_opcode(Opcode::OP_LEFT);
    s.push_opcode(Opcode::OP_CAT);
    s.push_data(pk_.span());
    s.push_opcode(Opcode::OP_DUP);
    s.push_opcode(Opcode::OP_TOALTSTACK);
    s.push_opcode(Opcode::OP_CODESEPARATOR);
    s.append(post_codesep_script());
    return s;
}

std::string CovenantDescriptor::to_string() const {
    return add_checksum(std::string(ELEMENTS_PREFIX) + "covwsh(" +
                        pk_.to_string() + "," + ms_.to_string() + ")");
}

core::Result<void> CovenantDescriptor::sanity_check() const {
    ELMS_TRY_VOID(ms_.sanity_check());
    if (cov_script_size() > MAX_STANDARD_P2WSH_SCRIPT_SIZE) {
        return make_error(ErrorCode::SCRIPT_SIZE_TOO_LARGE,
                          "covenant script of " +
                              std::to_string(cov_script_size()) +
                              " bytes exceeds the P2WSH standard size");
    }
    return core::make_ok();
}

Script CovenantDescriptor::script_pubkey() const {
    return Script::p2wsh(crypto::sha256(encode().span()));
}

core::Result<Witness> CovenantDescriptor::cov_items(
    const Satisfier& sat) const {
    auto n_version = sat.lookup_nversion();
    if (!n_version) return missing_item(1, "nVersion");
    auto hash_prevouts = sat.lookup_hashprevouts();
    if (!hash_prevouts) return missing_item(1, "hashPrevouts");
    auto hash_sequence = sat.lookup_hashsequence();
    if (!hash_sequence) return missing_item(3, "hashSequence");
    auto hash_issuances = sat.lookup_hashissuances();
    if (!hash_issuances) return missing_item(3, "hashIssuances");
    auto outpoint = sat.lookup_outpoint();
    if (!outpoint) return missing_item(4, "outpoint");
    auto script_code = sat.lookup_scriptcode();
    if (!script_code) return missing_item(5, "scriptCode");
    auto value = sat.lookup_value();
    if (!value) return missing_item(6, "value");
    auto n_sequence = sat.lookup_nsequence();
    if (!n_sequence) return missing_item(7, "nSequence");
    auto outputs = sat.lookup_outputs();
    if (!outputs) return missing_item(8, "outputs");
    auto n_locktime = sat.lookup_nlocktime();
    if (!n_locktime) return missing_item(9, "nLocktime");
    auto sighash_ty = sat.lookup_sighashu32();
    if (!sighash_ty) return missing_item(10, "sighash type");

    auto sig = sat.lookup_ecdsa_sig(pk_);
    if (!sig) {
        LOG_DEBUG(core::LogCategory::SATISFY,
                  "no covenant signature for " + pk_.to_string());
        return make_error(ErrorCode::MISSING_COV_SIGNATURE,
                          "missing covenant signature for " +
                              pk_.to_string());
    }
    if (*sighash_ty != sig->sighash_type) {
        return make_error(ErrorCode::COV_SIGHASH_TYPE_MISMATCH,
                          "covenant signature has sighash type " +
                              std::to_string(sig->sighash_type) +
                              ", expected " + std::to_string(*sighash_ty));
    }

    return Witness{
        sig->der,
        u32_le(*n_version),
        hash_bytes(*hash_prevouts),
        hash_bytes(*hash_sequence),
        hash_bytes(*hash_issuances),
        serialize_item(*outpoint),
        serialize_item(*script_code),
        serialize_item(*value),
        u32_le(*n_sequence),
        hash_bytes(primitives::hash_outputs(*outputs)),
        u32_le(*n_locktime),
        u32_le(*sighash_ty),
    };
}

core::Result<Witness> CovenantDescriptor::satisfy(const Satisfier& sat) const {
    ELMS_TRY_ASSIGN(witness, cov_items(sat));
    ELMS_TRY_ASSIGN(ms_witness, ms_.satisfy(sat));
    witness.insert(witness.end(), ms_witness.begin(), ms_witness.end());
    return witness;
}

core::Result<Satisfaction> CovenantDescriptor::get_satisfaction(
    const Satisfier& sat) const {
    ELMS_TRY_ASSIGN(witness, satisfy(sat));
    witness.push_back(encode().data());
    return Satisfaction{std::move(witness), Script()};
}

core::Result<Satisfaction> CovenantDescriptor::get_satisfaction_mall(
    const Satisfier& sat) const {
    ELMS_TRY_ASSIGN(witness, cov_items(sat));
    ELMS_TRY_ASSIGN(ms_witness, ms_.satisfy_malleable(sat));
    witness.insert(witness.end(), ms_witness.begin(), ms_witness.end());
    witness.push_back(encode().data());
    return Satisfaction{std::move(witness), Script()};
}

core::Result<size_t> CovenantDescriptor::max_satisfaction_weight() const {
    auto elems = ms_.max_satisfaction_witness_elements();
    auto size = ms_.max_satisfaction_size();
    if (!elems || !size) {
        return make_error(ErrorCode::IMPOSSIBLE_SATISFACTION,
                          "no satisfaction for " + ms_.to_string());
    }
    const size_t script_size = cov_script_size();
    return 4 + varint_len(script_size) + script_size +
           varint_len(*elems + COV_WITNESS_ITEMS) + *size + COV_WITNESS_SIZE;
}

core::Result<Address> CovenantDescriptor::address(
    const AddressParams& params) const {
    return Address::p2wsh(crypto::sha256(encode().span()), params);
}

core::Result<Address> CovenantDescriptor::blind_addr(
    const std::optional<PublicKey>& blinder,
    const AddressParams& params) const {
    ELMS_TRY_ASSIGN(addr, address(params));
    return blind_address(addr, blinder);
}

core::Result<CovenantDescriptor> CovenantDescriptor::translate_keys(
    const KeyTranslator& t) const {
    ELMS_TRY_ASSIGN(pk, t.pk(pk_));
    ELMS_TRY_ASSIGN(ms, ms_.translate(t));
    return create(std::move(pk), std::move(ms));
}

// ===================================================================
// CovSatisfier
// ===================================================================

core::Result<CovSatisfier> CovSatisfier::create(
    const primitives::Transaction& tx, size_t input_index,
    primitives::ConfidentialValue value, Script script_code,
    const Satisfier& inner, uint32_t sighash_type) {
    if (input_index >= tx.inputs.size()) {
        return make_error(ErrorCode::IMPOSSIBLE_SATISFACTION,
                          "input " + std::to_string(input_index) +
                              " out of range for a transaction with " +
                              std::to_string(tx.inputs.size()) + " inputs");
    }
    return CovSatisfier(tx, input_index, std::move(value),
                        std::move(script_code), inner, sighash_type);
}

std::optional<uint32_t> CovSatisfier::lookup_nversion() const {
    return tx_->version;
}

std::optional<core::uint256> CovSatisfier::lookup_hashprevouts() const {
    return primitives::hash_prevouts(*tx_);
}

std::optional<core::uint256> CovSatisfier::lookup_hashsequence() const {
    return primitives::hash_sequence(*tx_);
}

std::optional<core::uint256> CovSatisfier::lookup_hashissuances() const {
    return primitives::hash_issuances(*tx_);
}

std::optional<primitives::OutPoint> CovSatisfier::lookup_outpoint() const {
    return tx_->inputs[index_].previous_output;
}

std::optional<Script> CovSatisfier::lookup_scriptcode() const {
    return script_code_;
}

std::optional<primitives::ConfidentialValue> CovSatisfier::lookup_value()
    const {
    return value_;
}

std::optional<uint32_t> CovSatisfier::lookup_nsequence() const {
    return tx_->inputs[index_].sequence;
}

std::optional<std::vector<primitives::TxOut>> CovSatisfier::lookup_outputs()
    const {
    return tx_->outputs;
}

std::optional<uint32_t> CovSatisfier::lookup_nlocktime() const {
    return tx_->lock_time;
}

std::optional<uint32_t> CovSatisfier::lookup_sighashu32() const {
    return sighash_type_;
}

} // namespace descriptor
