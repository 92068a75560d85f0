// Copyright (c) 2024-2026 The ELMS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "test_framework.h"

#include "core/hex.h"
#include "crypto/hash.h"
#include "descriptor/covenant.h"
#include "interpreter/control_block.h"
#include "interpreter/inner.h"
#include "interpreter/stack.h"

#include <cstdint>
#include <span>
#include <string>
#include <utility>
#include <vector>

using interpreter::Element;
using interpreter::InnerCovScript;
using interpreter::InnerPublicKey;
using interpreter::InnerScript;
using interpreter::PubkeyType;
using interpreter::ScriptType;
using interpreter::Stack;
using interpreter::from_txdata;
using miniscript::Context;
using miniscript::Miniscript;
using miniscript::PublicKey;
using primitives::script::Script;

namespace {

using Witness = std::vector<std::vector<uint8_t>>;

const Witness ONE_EMPTY_ITEM{std::vector<uint8_t>{}};

const std::string K1 =
    "025edd5cc23c51e87a497ca815d5dce0f8ab52554f849ed8995de64c5f34ce7143";
const std::string K1U =
    "045edd5cc23c51e87a497ca815d5dce0f8ab52554f849ed8995de64c5f34ce7143"
    "efae9c8dbc14130661e8cec030c89ad0c13c66c0d17a2905cdc706ab7399a868";
const std::string K2 =
    "02c6047f9441ed7d6d3045406e95c07cd85c778e4b8cef3ca7abac09b95c709ee5";
const std::string X1 = K1.substr(2);
const std::string X2 = K2.substr(2);

const std::string PREIMAGE_HASH160 =
    "5d8816fd7eb797ca8a80322760719bf46f1dc967";

const std::string DUMMY_SIG =
    "302e02153b78ce563f89a0ed9414f5aa28ad0d96d6795f9c63"
    "02153b78ce563f89a0ed9414f5aa28ad0d96d6795f9c6501";

// Taproot output committing to the single leaf pk(X2) under internal X1.
const std::string TR_ONE_LEAF_KEY =
    "f676ac4d13162140b605c7bb563b7bdfe1d960071432cddc1f3ca61053f202a6";
const std::string TAP_LEAF_PK_X2 =
    "2a0a73facb720b9fdea8938ab1315cd66caf024eaa3c18ed79e7491bc3959767";
// Taproot output committing to pk(X2) and pk(X1) under internal X1.
const std::string TR_TWO_LEAF_KEY =
    "65f1bd1ac87a363e1a64326bdb9d8806d8350ed76190a2e7a4ec60de17a1cb5a";
const std::string TAP_LEAF_PK_X1 =
    "2afe7db9d4ddeb08fc2738616737a0b875440702986b4da089ee97bf07697fcf";
const std::string TAP_ROOT_TWO_LEAF =
    "6e842c31d1fc20ec21a8bcd738251f81e526fd91e3270869bfff081244200b07";

std::vector<uint8_t> unhex(std::string_view hex) {
    return core::from_hex(hex).value_or(std::vector<uint8_t>{});
}

PublicKey key(const std::string& hex) {
    return PublicKey::from_string(hex).value();
}

Script push_script(const std::vector<std::vector<uint8_t>>& items) {
    Script s;
    for (const auto& item : items) s.push_data(item);
    return s;
}

Stack stack_of(const std::vector<std::vector<uint8_t>>& items) {
    std::vector<Element> elems;
    for (const auto& item : items) elems.push_back(Element::from_bytes(item));
    return Stack(std::move(elems));
}

/// Output scripts and spends for one key, in every single-key form.
struct KeyTestData {
    std::vector<uint8_t> key;
    Script pk_spk;
    Script pk_sig;
    Script pkh_spk;
    Script pkh_sig;
    Script pkh_sig_justkey;
    Script wpkh_spk;
    Witness wpkh_stack;
    Witness wpkh_stack_justkey;
    Script sh_wpkh_spk;
    Script sh_wpkh_sig;

    explicit KeyTestData(const std::string& key_hex) : key(unhex(key_hex)) {
        const auto sig = unhex(DUMMY_SIG);
        const auto hash = crypto::hash160(key);

        pk_spk = Script::p2pk(key);
        pk_sig = push_script({sig});
        pkh_spk = Script::p2pkh(hash);
        pkh_sig = push_script({sig, key});
        pkh_sig_justkey = push_script({key});
        wpkh_spk = Script::p2wpkh(hash);
        wpkh_stack = {sig, key};
        wpkh_stack_justkey = {key};

        const Script redeem = Script::p2wpkh(hash);
        sh_wpkh_spk = Script::p2sh(redeem.script_hash());
        sh_wpkh_sig = push_script({redeem.data()});
    }
};

/// hash160(<preimage hash>) parsed as Segwitv0 and moved to NO_CHECKS,
/// with its encoding.
std::pair<Miniscript, Script> hash_lock_script() {
    auto ms = Miniscript::from_str_insane("hash160(" + PREIMAGE_HASH160 + ")",
                                          Context::SEGWITV0)
                  .value();
    Script script = ms.encode();
    return {ms.to_no_checks().value(), std::move(script)};
}

Miniscript no_checks(const std::string& s, Context ctx) {
    return Miniscript::from_str_insane(s, ctx).value().to_no_checks().value();
}

}  // namespace

// ===================================================================
// Key spends
// ===================================================================

TEST_CASE(Interpreter, PubkeyPk) {
    KeyTestData comp(K1);
    KeyTestData uncomp(K1U);
    const Script blank;

    auto r = from_txdata(comp.pk_spk, blank, {});
    CHECK_OK(r);
    CHECK(r.value().inner ==
          interpreter::Inner(InnerPublicKey{key(K1), PubkeyType::PK}));
    CHECK(r.value().stack.empty());
    CHECK(r.value().script_code == comp.pk_spk);

    r = from_txdata(uncomp.pk_spk, blank, {});
    CHECK_OK(r);
    CHECK(r.value().inner ==
          interpreter::Inner(InnerPublicKey{key(K1U), PubkeyType::PK}));

    r = from_txdata(comp.pk_spk, comp.pk_sig, {});
    CHECK_OK(r);
    CHECK(r.value().stack == stack_of({unhex(DUMMY_SIG)}));
    CHECK(r.value().script_code == comp.pk_spk);
}

TEST_CASE(Interpreter, PubkeyPkBadScripts) {
    KeyTestData comp(K1);

    auto bad_key = comp.pk_spk.data();
    bad_key[1] = 5;
    auto r = from_txdata(Script(bad_key), Script(), {});
    CHECK_ERR_CODE(r, core::ErrorCode::PUBKEY_PARSE);
    CHECK_EQ(r.error().message(), "could not parse pubkey");

    auto bad_script = comp.pk_spk.data();
    bad_script[0] = 100;
    r = from_txdata(Script(bad_script), Script(), {});
    CHECK_ERR(r);
    CHECK(r.error().message().starts_with("parse error:"));

    r = from_txdata(comp.pk_spk, comp.pk_sig, ONE_EMPTY_ITEM);
    CHECK_ERR_CODE(r, core::ErrorCode::NON_EMPTY_WITNESS);
    CHECK_EQ(r.error().message(), "legacy spend had nonempty witness");
}

TEST_CASE(Interpreter, PubkeyPkh) {
    KeyTestData comp(K1);
    KeyTestData uncomp(K1U);
    const Script blank;

    CHECK_ERR_CODE(from_txdata(comp.pkh_spk, blank, {}),
                   core::ErrorCode::UNEXPECTED_STACK_END);
    CHECK_ERR_CODE(from_txdata(comp.pkh_spk, uncomp.pkh_sig_justkey, {}),
                   core::ErrorCode::INCORRECT_PUBKEY_HASH);

    auto r = from_txdata(comp.pkh_spk, comp.pkh_sig_justkey, {});
    CHECK_OK(r);
    CHECK(r.value().inner ==
          interpreter::Inner(InnerPublicKey{key(K1), PubkeyType::PKH}));
    CHECK(r.value().stack.empty());
    CHECK(r.value().script_code == comp.pkh_spk);

    r = from_txdata(uncomp.pkh_spk, uncomp.pkh_sig_justkey, {});
    CHECK_OK(r);
    CHECK(r.value().inner ==
          interpreter::Inner(InnerPublicKey{key(K1U), PubkeyType::PKH}));

    r = from_txdata(comp.pkh_spk, comp.pkh_sig, {});
    CHECK_OK(r);
    CHECK(r.value().stack == stack_of({unhex(DUMMY_SIG)}));

    CHECK_ERR_CODE(from_txdata(comp.pkh_spk, comp.pkh_sig, ONE_EMPTY_ITEM),
                   core::ErrorCode::NON_EMPTY_WITNESS);
}

TEST_CASE(Interpreter, PubkeyWpkh) {
    KeyTestData comp(K1);
    KeyTestData uncomp(K1U);
    const Script blank;

    CHECK_ERR_CODE(from_txdata(comp.wpkh_spk, blank, {}),
                   core::ErrorCode::UNEXPECTED_STACK_END);

    auto r = from_txdata(comp.wpkh_spk, blank, uncomp.wpkh_stack_justkey);
    CHECK_ERR_CODE(r, core::ErrorCode::UNCOMPRESSED_PUBKEY);
    CHECK_EQ(r.error().message(),
             "uncompressed pubkey in non-legacy descriptor");

    r = from_txdata(uncomp.wpkh_spk, blank, comp.wpkh_stack_justkey);
    CHECK_ERR_CODE(r, core::ErrorCode::INCORRECT_WPUBKEY_HASH);
    CHECK_EQ(r.error().message(),
             "public key did not match scriptpubkey (segwit v0)");

    r = from_txdata(comp.wpkh_spk, blank, comp.wpkh_stack_justkey);
    CHECK_OK(r);
    CHECK(r.value().inner ==
          interpreter::Inner(InnerPublicKey{key(K1), PubkeyType::WPKH}));
    CHECK(r.value().stack.empty());
    // The script code of a P2WPKH spend is the P2PKH script.
    CHECK(r.value().script_code == comp.pkh_spk);

    r = from_txdata(comp.wpkh_spk, blank, comp.wpkh_stack);
    CHECK_OK(r);
    CHECK(r.value().stack == stack_of({unhex(DUMMY_SIG)}));

    CHECK_ERR_CODE(from_txdata(comp.wpkh_spk, comp.pk_sig,
                               comp.wpkh_stack_justkey),
                   core::ErrorCode::NON_EMPTY_SCRIPT_SIG);
}

TEST_CASE(Interpreter, PubkeyShWpkh) {
    KeyTestData comp(K1);
    KeyTestData uncomp(K1U);
    const Script blank;

    CHECK_ERR_CODE(from_txdata(comp.sh_wpkh_spk, blank, {}),
                   core::ErrorCode::UNEXPECTED_STACK_END);
    CHECK_ERR_CODE(from_txdata(comp.sh_wpkh_spk, comp.sh_wpkh_sig, {}),
                   core::ErrorCode::UNEXPECTED_STACK_END);
    CHECK_ERR_CODE(from_txdata(comp.sh_wpkh_spk, blank, comp.wpkh_stack),
                   core::ErrorCode::UNEXPECTED_STACK_END);

    CHECK_ERR_CODE(from_txdata(uncomp.sh_wpkh_spk, uncomp.sh_wpkh_sig,
                               uncomp.wpkh_stack_justkey),
                   core::ErrorCode::UNCOMPRESSED_PUBKEY);

    auto r = from_txdata(uncomp.sh_wpkh_spk, comp.sh_wpkh_sig,
                         comp.wpkh_stack_justkey);
    CHECK_ERR_CODE(r, core::ErrorCode::INCORRECT_SCRIPT_HASH);
    CHECK_EQ(r.error().message(), "redeem script did not match scriptpubkey");

    r = from_txdata(uncomp.sh_wpkh_spk, uncomp.sh_wpkh_sig,
                    comp.wpkh_stack_justkey);
    CHECK_ERR_CODE(r, core::ErrorCode::INCORRECT_WSCRIPT_HASH);
    CHECK_EQ(r.error().message(), "witness script did not match scriptpubkey");

    r = from_txdata(comp.sh_wpkh_spk, comp.sh_wpkh_sig,
                    comp.wpkh_stack_justkey);
    CHECK_OK(r);
    CHECK(r.value().inner ==
          interpreter::Inner(InnerPublicKey{key(K1), PubkeyType::SH_WPKH}));
    CHECK(r.value().stack.empty());
    CHECK(r.value().script_code == comp.pkh_spk);

    r = from_txdata(comp.sh_wpkh_spk, comp.sh_wpkh_sig, comp.wpkh_stack);
    CHECK_OK(r);
    CHECK(r.value().stack == stack_of({unhex(DUMMY_SIG)}));
}

// ===================================================================
// Script spends
// ===================================================================

TEST_CASE(Interpreter, ScriptBare) {
    auto [ms, spk] = hash_lock_script();
    const Script blank;

    auto r = from_txdata(spk, blank, {});
    CHECK_OK(r);
    CHECK(r.value().inner ==
          interpreter::Inner(InnerScript{ms, ScriptType::BARE}));
    CHECK(r.value().stack.empty());
    CHECK(r.value().script_code == spk);

    r = from_txdata(blank, blank, {});
    CHECK_ERR(r);
    CHECK(r.error().message().starts_with("parse error:"));

    CHECK_ERR_CODE(from_txdata(spk, blank, ONE_EMPTY_ITEM),
                   core::ErrorCode::NON_EMPTY_WITNESS);
}

TEST_CASE(Interpreter, ScriptSh) {
    auto [ms, redeem] = hash_lock_script();
    const Script spk = Script::p2sh(redeem.script_hash());
    const Script script_sig = push_script({redeem.data()});
    const Script blank;

    CHECK_ERR_CODE(from_txdata(spk, blank, {}),
                   core::ErrorCode::UNEXPECTED_STACK_END);

    auto r = from_txdata(spk, spk, {});
    CHECK_ERR_CODE(r, core::ErrorCode::EXPECTED_PUSH);
    CHECK_EQ(r.error().message(), "expected push in script");

    r = from_txdata(spk, script_sig, {});
    CHECK_OK(r);
    CHECK(r.value().inner == interpreter::Inner(InnerScript{ms, ScriptType::SH}));
    CHECK(r.value().stack.empty());
    CHECK(r.value().script_code == redeem);

    CHECK_ERR_CODE(from_txdata(spk, script_sig, ONE_EMPTY_ITEM),
                   core::ErrorCode::NON_EMPTY_WITNESS);
}

TEST_CASE(Interpreter, ScriptWsh) {
    auto [ms, witness_script] = hash_lock_script();
    const Script spk = Script::p2wsh(witness_script.witness_script_hash());
    const Witness wit{witness_script.data()};
    const Script blank;

    CHECK_ERR_CODE(from_txdata(spk, blank, {}),
                   core::ErrorCode::UNEXPECTED_STACK_END);

    auto r = from_txdata(spk, blank, {spk.data()});
    CHECK_ERR(r);
    CHECK(r.error().message().starts_with("parse error:"));

    r = from_txdata(spk, blank, wit);
    CHECK_OK(r);
    CHECK(r.value().inner ==
          interpreter::Inner(InnerScript{ms, ScriptType::WSH}));
    CHECK(r.value().stack.empty());
    CHECK(r.value().script_code == witness_script);

    CHECK_ERR_CODE(from_txdata(spk, push_script({witness_script.data()}), wit),
                   core::ErrorCode::NON_EMPTY_SCRIPT_SIG);
}

TEST_CASE(Interpreter, ScriptWshWrongHash) {
    auto [ms, witness_script] = hash_lock_script();
    const Script other = Script::p2wsh(crypto::sha256(unhex("51")));
    CHECK_ERR_CODE(from_txdata(other, Script(), {witness_script.data()}),
                   core::ErrorCode::INCORRECT_WSCRIPT_HASH);
}

TEST_CASE(Interpreter, ScriptWshRejectsUncompressedKey) {
    Script ws = Script::p2pk(unhex(K1U));
    const Script spk = Script::p2wsh(ws.witness_script_hash());
    auto r = from_txdata(spk, Script(), {ws.data()});
    CHECK_ERR_CODE(r, core::ErrorCode::COMPRESSED_ONLY);
    CHECK(r.error().message().starts_with("parse error:"));
}

TEST_CASE(Interpreter, ScriptShWsh) {
    auto [ms, witness_script] = hash_lock_script();
    const Script redeem = Script::p2wsh(witness_script.witness_script_hash());
    const Script script_sig = push_script({redeem.data()});
    const Script spk = Script::p2sh(redeem.script_hash());
    const Witness wit{witness_script.data()};
    const Script blank;

    CHECK_ERR_CODE(from_txdata(spk, blank, {}),
                   core::ErrorCode::UNEXPECTED_STACK_END);
    CHECK_ERR_CODE(from_txdata(spk, script_sig, {}),
                   core::ErrorCode::UNEXPECTED_STACK_END);
    CHECK_ERR_CODE(from_txdata(spk, blank, wit),
                   core::ErrorCode::UNEXPECTED_STACK_END);

    auto r = from_txdata(spk, script_sig, {spk.data()});
    CHECK_ERR(r);
    CHECK(r.error().message().starts_with("parse error:"));

    r = from_txdata(spk, redeem, wit);
    CHECK_ERR_CODE(r, core::ErrorCode::INCORRECT_SCRIPT_HASH);
    CHECK_EQ(r.error().message(), "redeem script did not match scriptpubkey");

    r = from_txdata(spk, script_sig, wit);
    CHECK_OK(r);
    CHECK(r.value().inner ==
          interpreter::Inner(InnerScript{ms, ScriptType::SH_WSH}));
    CHECK(r.value().stack.empty());
    CHECK(r.value().script_code == witness_script);
}

TEST_CASE(Interpreter, ScriptSigCanonicalBooleans) {
    auto stack = Stack::from_script_sig(Script(unhex("0051")));
    CHECK_OK(stack);
    CHECK(stack.value() ==
          Stack({Element::dissatisfied(), Element::satisfied()}));

    // A one-byte push of 0x01 is not minimal.
    CHECK_ERR_CODE(Stack::from_script_sig(Script(unhex("0101"))),
                   core::ErrorCode::BAD_SCRIPT);
    CHECK_ERR_CODE(Stack::from_script_sig(Script(unhex("0301"))),
                   core::ErrorCode::BAD_SCRIPT);
}

TEST_CASE(Interpreter, StackPopsFromTop) {
    Stack stack = stack_of({unhex("aa"), {}, {0x01}});
    CHECK_EQ(stack.size(), 3u);
    CHECK(stack.pop() == Element::satisfied());
    CHECK(stack.pop() == Element::dissatisfied());
    auto last = stack.pop();
    CHECK(last.has_value());
    CHECK_EQ(last->to_string(), "aa");
    CHECK(!stack.pop().has_value());
    CHECK_ERR_CODE(Element::satisfied().as_push(),
                   core::ErrorCode::EXPECTED_PUSH);
}

// ===================================================================
// Covenant spends
// ===================================================================

TEST_CASE(Interpreter, CovenantWitnessScript) {
    auto cov = descriptor::CovenantDescriptor::from_str(
                   "elcovwsh(" + K1 + ",pk(" + K2 + "))#yn2xz0hh")
                   .value();
    Witness wit(12, std::vector<uint8_t>{0xaa});
    wit.push_back(unhex(DUMMY_SIG));
    wit.push_back(cov.encode().data());

    auto r = from_txdata(cov.script_pubkey(), Script(), wit);
    CHECK_OK(r);
    if (!r.ok()) return;
    const auto* inner = std::get_if<InnerCovScript>(&r.value().inner);
    CHECK(inner != nullptr);
    if (inner == nullptr) return;
    CHECK(inner->key == key(K1));
    CHECK(inner->ms == no_checks("pk(" + K2 + ")", Context::SEGWITV0));
    CHECK_EQ(r.value().stack.size(), 13u);
    CHECK(r.value().script_code == descriptor::post_codesep_script());
}

TEST_CASE(Interpreter, CovenantWrongScriptHash) {
    auto cov = descriptor::CovenantDescriptor::from_str(
                   "elcovwsh(" + K1 + ",pk(" + K2 + "))#yn2xz0hh")
                   .value();
    const Script other = Script::p2wsh(crypto::sha256(unhex("51")));
    CHECK_ERR_CODE(from_txdata(other, Script(), {cov.encode().data()}),
                   core::ErrorCode::INCORRECT_WSCRIPT_HASH);
}

// ===================================================================
// Taproot spends
// ===================================================================

TEST_CASE(Interpreter, TaprootKeySpend) {
    const Script spk = Script::p2tr(
        core::uint256::from_hex(TR_ONE_LEAF_KEY).value());
    const std::vector<uint8_t> sig(64, 0x11);

    auto r = from_txdata(spk, Script(), {sig});
    CHECK_OK(r);
    CHECK(r.value().inner ==
          interpreter::Inner(
              InnerPublicKey{key(TR_ONE_LEAF_KEY), PubkeyType::TR}));
    CHECK(r.value().stack == stack_of({sig}));
    CHECK(!r.value().script_code.has_value());

    CHECK_ERR_CODE(from_txdata(spk, Script(), {}),
                   core::ErrorCode::UNEXPECTED_STACK_END);
    CHECK_ERR_CODE(from_txdata(spk, push_script({sig}), {sig}),
                   core::ErrorCode::NON_EMPTY_SCRIPT_SIG);
}

TEST_CASE(Interpreter, TaprootAnnexRejected) {
    const Script spk = Script::p2tr(
        core::uint256::from_hex(TR_ONE_LEAF_KEY).value());
    auto r = from_txdata(spk, Script(),
                         {std::vector<uint8_t>(64, 0x11), unhex("50aa")});
    CHECK_ERR_CODE(r, core::ErrorCode::TAP_ANNEX_UNSUPPORTED);
    CHECK_EQ(r.error().message(), "Encountered annex element");
}

TEST_CASE(Interpreter, TaprootScriptSpend) {
    const Script spk = Script::p2tr(
        core::uint256::from_hex(TR_ONE_LEAF_KEY).value());
    const Script leaf(unhex("20" + X2 + "ac"));
    const std::vector<uint8_t> sig(64, 0x22);

    auto r = from_txdata(spk, Script(),
                         {sig, leaf.data(), unhex("c4" + X1)});
    CHECK_OK(r);
    CHECK(r.value().inner ==
          interpreter::Inner(
              InnerScript{no_checks("pk(" + X2 + ")", Context::TAP),
                          ScriptType::TR}));
    CHECK(r.value().stack == stack_of({sig}));
    CHECK(r.value().script_code == leaf);
}

TEST_CASE(Interpreter, TaprootScriptSpendWithPath) {
    const Script spk = Script::p2tr(
        core::uint256::from_hex(TR_TWO_LEAF_KEY).value());
    const Script leaf(unhex("20" + X2 + "ac"));

    // The output key is odd, so the control byte carries the parity bit.
    auto r = from_txdata(spk, Script(),
                         {std::vector<uint8_t>(64, 0x22), leaf.data(),
                          unhex("c5" + X1 + TAP_LEAF_PK_X1)});
    CHECK_OK(r);
    CHECK(r.value().script_code == leaf);

    r = from_txdata(spk, Script(),
                    {std::vector<uint8_t>(64, 0x22), leaf.data(),
                     unhex("c4" + X1 + TAP_LEAF_PK_X1)});
    CHECK_ERR_CODE(r, core::ErrorCode::CONTROL_BLOCK_VERIFICATION);
    CHECK_EQ(r.error().message(), "Control block verification failed");
}

TEST_CASE(Interpreter, TaprootControlBlockFailures) {
    const Script spk = Script::p2tr(
        core::uint256::from_hex(TR_ONE_LEAF_KEY).value());
    const Script leaf(unhex("20" + X2 + "ac"));
    const Script other_leaf(unhex("20" + X1 + "ac"));
    const std::vector<uint8_t> sig(64, 0x22);

    CHECK_ERR_CODE(from_txdata(spk, Script(),
                               {sig, other_leaf.data(), unhex("c4" + X1)}),
                   core::ErrorCode::CONTROL_BLOCK_VERIFICATION);
    CHECK_ERR_CODE(from_txdata(spk, Script(),
                               {sig, leaf.data(), unhex("c4" + X1 + "00")}),
                   core::ErrorCode::CONTROL_BLOCK_PARSE);
    // Tapscript keys are x-only.
    CHECK_ERR_CODE(from_txdata(spk, Script(),
                               {sig, unhex("21" + K2 + "ac"),
                                unhex("c4" + X1)}),
                   core::ErrorCode::XONLY_REQUIRED);
}

TEST_CASE(Interpreter, TaprootDeeplyNestedLeaf) {
    const Script spk = Script::p2tr(
        core::uint256::from_hex(TR_ONE_LEAF_KEY).value());
    const std::vector<uint8_t> sig(64, 0x22);
    // 1 followed by n OP_0NOTEQUAL, which decodes as n:n:...:1.
    auto nested = [](size_t depth) {
        std::vector<uint8_t> bytes(depth + 1, 0x92);
        bytes[0] = 0x51;
        return bytes;
    };

    // Decodes at the limit and then fails only on the commitment.
    CHECK_ERR_CODE(from_txdata(spk, Script(),
                               {sig, nested(402), unhex("c4" + X1)}),
                   core::ErrorCode::CONTROL_BLOCK_VERIFICATION);

    for (size_t depth : {size_t{403}, size_t{200000}}) {
        auto r = from_txdata(spk, Script(),
                             {sig, nested(depth), unhex("c4" + X1)});
        CHECK_ERR_CODE(r, core::ErrorCode::PARSE_ERROR);
        CHECK(r.error().message().rfind("parse error: ", 0) == 0);
    }
}

// ===================================================================
// Control blocks
// ===================================================================

TEST_CASE(ControlBlock, LeafAndBranchHashes) {
    const Script leaf(unhex("20" + X2 + "ac"));
    CHECK_EQ(interpreter::tap_leaf_hash(interpreter::TAPROOT_LEAF_TAPSCRIPT,
                                        leaf).to_hex(),
             TAP_LEAF_PK_X2);

    auto a = core::uint256::from_hex(TAP_LEAF_PK_X2).value();
    auto b = core::uint256::from_hex(TAP_LEAF_PK_X1).value();
    CHECK_EQ(interpreter::tap_branch_hash(a, b).to_hex(), TAP_ROOT_TWO_LEAF);
    CHECK_EQ(interpreter::tap_branch_hash(b, a).to_hex(), TAP_ROOT_TWO_LEAF);
}

TEST_CASE(ControlBlock, Parse) {
    auto cb = interpreter::ControlBlock::from_slice(
        unhex("c5" + X1 + TAP_LEAF_PK_X1));
    CHECK_OK(cb);
    CHECK_EQ(cb.value().leaf_version, interpreter::TAPROOT_LEAF_TAPSCRIPT);
    CHECK(cb.value().output_key_odd);
    CHECK_EQ(core::to_hex(cb.value().internal_key), X1);
    CHECK_EQ(cb.value().merkle_branch.size(), 1u);

    CHECK_ERR_CODE(interpreter::ControlBlock::from_slice(unhex("c4" + X1 + "00")),
                   core::ErrorCode::CONTROL_BLOCK_PARSE);
    CHECK_ERR_CODE(interpreter::ControlBlock::from_slice(unhex("50" + X1)),
                   core::ErrorCode::CONTROL_BLOCK_PARSE);
    CHECK_ERR_CODE(interpreter::ControlBlock::from_slice(
                       unhex("c4" + std::string(64, 'f'))),
                   core::ErrorCode::CONTROL_BLOCK_PARSE);
}

TEST_CASE(ControlBlock, VerifyCommitment) {
    auto cb = interpreter::ControlBlock::from_slice(unhex("c4" + X1)).value();
    auto q = core::uint256::from_hex(TR_ONE_LEAF_KEY).value();
    const std::span<const uint8_t, 32> output_key(q.span().data(), 32);
    const Script leaf(unhex("20" + X2 + "ac"));
    CHECK(cb.verify_taproot_commitment(output_key, leaf));
    CHECK(!cb.verify_taproot_commitment(output_key,
                                        Script(unhex("20" + X1 + "ac"))));
}
