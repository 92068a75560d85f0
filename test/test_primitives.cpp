// Copyright (c) 2024-2026 The ELMS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "test_framework.h"

#include "core/hex.h"
#include "core/stream.h"
#include "crypto/hash.h"
#include "primitives/address.h"
#include "primitives/script/script.h"
#include "primitives/transaction.h"

#include <cstdint>
#include <string>
#include <vector>

using primitives::Address;
using primitives::AddressParams;
using primitives::AddressType;
using primitives::script::Script;

namespace {

std::vector<uint8_t> unhex(std::string_view hex) {
    return core::from_hex(hex).value_or(std::vector<uint8_t>{});
}

const char* K1 =
    "025edd5cc23c51e87a497ca815d5dce0f8ab52554f849ed8995de64c5f34ce7143";

// 2G, used as the receiver's blinding key.
const char* BLINDER =
    "02c6047f9441ed7d6d3045406e95c07cd85c778e4b8cef3ca7abac09b95c709ee5";

core::uint160 k1_hash() {
    return crypto::hash160(unhex(K1));
}

}  // namespace

// ===================================================================
// AddressParams
// ===================================================================

TEST_CASE(Address, ParamsByName) {
    auto liquid = AddressParams::from_name("liquid");
    CHECK(liquid.has_value());
    CHECK(*liquid == AddressParams::LIQUID);
    CHECK_EQ(liquid->p2pkh_prefix, 57);
    CHECK(AddressParams::from_name("elements") == AddressParams::ELEMENTS);
    CHECK(!AddressParams::from_name("bitcoin").has_value());
}

// ===================================================================
// Encoding
// ===================================================================

TEST_CASE(Address, P2pkhPerNetwork) {
    auto ert = Address::p2pkh(k1_hash(), AddressParams::ELEMENTS);
    CHECK_EQ(ert.to_string(), "2dwRa5JErQHA7bTCpmHD4VmpjCzfdU8XZr9");
    CHECK(ert.type() == AddressType::P2PKH);

    auto liquid = Address::p2pkh(k1_hash(), AddressParams::LIQUID);
    CHECK_EQ(liquid.to_string(), "QKGCoyBa2AgA2JPQQbvLBTNhBCoiyKrUdS");
}

TEST_CASE(Address, P2wpkhPerNetwork) {
    CHECK_EQ(Address::p2wpkh(k1_hash(), AddressParams::ELEMENTS).to_string(),
             "ert1q799zsnxhz000g2xt0q4kqznhcd0avrc5mxl8v2");
    CHECK_EQ(Address::p2wpkh(k1_hash(), AddressParams::LIQUID).to_string(),
             "ex1q799zsnxhz000g2xt0q4kqznhcd0avrc5p54lns");
}

TEST_CASE(Address, P2wshOfPkScript) {
    auto ws = Script::p2pk(unhex(K1));
    auto addr = Address::p2wsh(ws.witness_script_hash(),
                               AddressParams::ELEMENTS);
    CHECK_EQ(addr.to_string(),
             "ert1qfytz98frsd3eq57ltkad5xl4l79c2cv93pq4jj20j8l5y4qsnnqsactz4m");
    CHECK(addr.script_pubkey() == Script::p2wsh(ws.witness_script_hash()));
}

TEST_CASE(Address, P2shOfWpkh) {
    auto redeem = Script::p2wpkh(k1_hash());
    auto addr = Address::p2sh(redeem.script_hash(), AddressParams::ELEMENTS);
    CHECK_EQ(addr.to_string(), "XMS88s2e89iyU4ooV4BRZxPdcowvQ6m8Zs");
}

// ===================================================================
// Script / string round trip
// ===================================================================

TEST_CASE(Address, FromScriptMatchesFactory) {
    auto spk = Script::p2wpkh(k1_hash());
    auto addr = Address::from_script(spk, AddressParams::ELEMENTS);
    CHECK_OK(addr);
    CHECK(addr.value() == Address::p2wpkh(k1_hash(), AddressParams::ELEMENTS));
    CHECK(addr.value().script_pubkey() == spk);
}

TEST_CASE(Address, FromScriptRejectsBare) {
    auto spk = Script::p2pk(unhex(K1));
    CHECK_ERR_CODE(Address::from_script(spk, AddressParams::ELEMENTS),
                   core::ErrorCode::ADDRESS_ERROR);
}

TEST_CASE(Address, FromStringParsesBothEncodings) {
    auto legacy = Address::from_string("2dwRa5JErQHA7bTCpmHD4VmpjCzfdU8XZr9",
                                       AddressParams::ELEMENTS);
    CHECK_OK(legacy);
    CHECK(legacy.value().script_pubkey() == Script::p2pkh(k1_hash()));

    auto segwit = Address::from_string(
        "ert1q799zsnxhz000g2xt0q4kqznhcd0avrc5mxl8v2",
        AddressParams::ELEMENTS);
    CHECK_OK(segwit);
    CHECK(segwit.value().type() == AddressType::P2WPKH);
}

TEST_CASE(Address, FromStringRejectsOtherNetwork) {
    CHECK_ERR_CODE(Address::from_string("QKGCoyBa2AgA2JPQQbvLBTNhBCoiyKrUdS",
                                        AddressParams::ELEMENTS),
                   core::ErrorCode::ADDRESS_ERROR);
    CHECK_ERR_CODE(Address::from_string(
                       "ex1q799zsnxhz000g2xt0q4kqznhcd0avrc5p54lns",
                       AddressParams::ELEMENTS),
                   core::ErrorCode::ADDRESS_ERROR);
}

// ===================================================================
// Confidential addresses
// ===================================================================

TEST_CASE(Address, ConfidentialBase58) {
    auto plain = Address::p2pkh(k1_hash(), AddressParams::ELEMENTS);
    auto conf = plain.blinded(unhex(BLINDER));
    CHECK_OK(conf);
    CHECK(conf.value().is_blinded());
    CHECK(conf.value().blinding_key() == unhex(BLINDER));
    CHECK_EQ(conf.value().to_string(),
             "CTEq3h5CAxyi8y64r9eteudBTjXQkL8Pcwv7USf9wLsA4qDpysRsse94X3kUrcZg"
             "mKo9NQGRin2UxLgh");
    CHECK(conf.value().script_pubkey() == plain.script_pubkey());
    CHECK(conf.value().unblinded() == plain);

    auto liquid = Address::p2pkh(k1_hash(), AddressParams::LIQUID)
                      .blinded(unhex(BLINDER));
    CHECK_EQ(liquid.value().to_string(),
             "VTpyPgY9wPy59ATXgMzUMgsJDyniiQk96sxxVKSy9Hs8bEcF6p9qYJzB1jK8tNhg"
             "donwJKfkCjxgjptZ");

    auto p2sh = Address::p2sh(Script::p2wpkh(k1_hash()).script_hash(),
                              AddressParams::ELEMENTS)
                    .blinded(unhex(BLINDER));
    CHECK_EQ(p2sh.value().to_string(),
             "AzppLHEfy6mMjNvnbUkyDQ1YbRZCfXq4hh4F4o8FWkPF9z5C42attxN3ZMPUnYRE"
             "t25hGW593r8LgvfK");
}

TEST_CASE(Address, ConfidentialSegwit) {
    auto wpkh = Address::p2wpkh(k1_hash(), AddressParams::ELEMENTS)
                    .blinded(unhex(BLINDER));
    CHECK_OK(wpkh);
    CHECK_EQ(wpkh.value().to_string(),
             "el1qqtrqglu5g8kh6mfsg4qxa9wq0nv9cauwfwxw70984wkqnw2uwz0wtu229pxd"
             "wy777s5vk7ptvq980s6l6c83gnsemdc07khjc");
    CHECK(wpkh.value().type() == AddressType::P2WPKH);

    // Taproot outputs take blech32m.
    auto tr = Address::p2tr(
                  core::uint256::from_hex(
                      "f676ac4d13162140b605c7bb563b7bdfe1d960071432cddc1f3ca6"
                      "1053f202a6").value(),
                  AddressParams::LIQUID_TESTNET)
                  .blinded(unhex(BLINDER));
    CHECK_EQ(tr.value().to_string(),
             "tlq1pqtrqglu5g8kh6mfsg4qxa9wq0nv9cauwfwxw70984wkqnw2uwz0wtank43x"
             "3x93pgzmqt3am2cahhhlpm9sqw9pjehwp709xzpflyq4x4mz5shucy2gq");
}

TEST_CASE(Address, BlindingKeyMustBeCompressed) {
    auto plain = Address::p2wpkh(k1_hash(), AddressParams::ELEMENTS);
    CHECK_ERR_CODE(plain.blinded(unhex(std::string(BLINDER).substr(2))),
                   core::ErrorCode::ADDRESS_ERROR);
    // x = 0 is not on the curve.
    CHECK_ERR_CODE(plain.blinded(unhex("02" + std::string(64, '0'))),
                   core::ErrorCode::ADDRESS_ERROR);
}

TEST_CASE(Address, FromStringParsesConfidential) {
    auto legacy = Address::from_string(
        "CTEq3h5CAxyi8y64r9eteudBTjXQkL8Pcwv7USf9wLsA4qDpysRsse94X3kUrcZg"
        "mKo9NQGRin2UxLgh",
        AddressParams::ELEMENTS);
    CHECK_OK(legacy);
    CHECK(legacy.value().type() == AddressType::P2PKH);
    CHECK(legacy.value().blinding_key() == unhex(BLINDER));
    CHECK(legacy.value().script_pubkey() == Script::p2pkh(k1_hash()));

    auto segwit = Address::from_string(
        "el1qqtrqglu5g8kh6mfsg4qxa9wq0nv9cauwfwxw70984wkqnw2uwz0wtu229pxd"
        "wy777s5vk7ptvq980s6l6c83gnsemdc07khjc",
        AddressParams::ELEMENTS);
    CHECK_OK(segwit);
    CHECK(segwit.value().type() == AddressType::P2WPKH);
    CHECK(segwit.value().unblinded() ==
          Address::p2wpkh(k1_hash(), AddressParams::ELEMENTS));

    // Confidential forms are network specific too.
    CHECK_ERR_CODE(Address::from_string(
                       "el1qqtrqglu5g8kh6mfsg4qxa9wq0nv9cauwfwxw70984wkqnw2u"
                       "wz0wtu229pxdwy777s5vk7ptvq980s6l6c83gnsemdc07khjc",
                       AddressParams::LIQUID),
                   core::ErrorCode::ADDRESS_ERROR);
}

TEST_CASE(Address, FromStringRejectsBadBlindingKey) {
    CHECK_ERR_CODE(Address::from_string(
                       "el1qqgqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqq"
                       "qqqqpu229pxdwy777s5vk7ptvq980s6l6c83gjr97avf7xgpg",
                       AddressParams::ELEMENTS),
                   core::ErrorCode::ADDRESS_ERROR);
    CHECK_ERR_CODE(Address::from_string(
                       "CTEjgfLDKRpWXEH8o1FWFiWo6eAusftkmyUTrdNikrLivnKF2uAb"
                       "mQrsryBayAVKis4DchWQXGDj6Jpy",
                       AddressParams::ELEMENTS),
                   core::ErrorCode::ADDRESS_ERROR);
}

// ===================================================================
// Transaction sighash components
// ===================================================================

TEST_CASE(Transaction, OutPointSerialization) {
    primitives::OutPoint op;
    op.vout = 1;
    core::DataStream ds;
    op.serialize(ds);
    CHECK_EQ(ds.size(), 36u);
    CHECK_EQ(core::to_hex(ds.view()).substr(64), "01000000");
}

TEST_CASE(Transaction, SingleInputHashes) {
    primitives::Transaction tx;
    primitives::TxIn in;
    in.previous_output.vout = 1;
    tx.inputs.push_back(in);

    CHECK_EQ(primitives::hash_prevouts(tx).to_hex(),
             "b55aa859d4062539d31f8ead6affc492b690829845ab4af9027e8f5eb83e9814");
    CHECK_EQ(primitives::hash_sequence(tx).to_hex(),
             "3bb13029ce7b1f559ef5e747fcac439f1455a2ec7c5f09b72290795e70665044");
    CHECK_EQ(primitives::hash_issuances(tx).to_hex(),
             "1406e05881e299367766d313e26c05564ec91bf721d31726bd6e46e60689539a");
}

TEST_CASE(Transaction, ExplicitOutputSerialization) {
    primitives::TxOut out;
    out.value = primitives::ConfidentialValue::from_explicit(1000);
    out.script_pubkey = Script::p2wpkh(k1_hash());

    std::vector<primitives::TxOut> outs{out};
    CHECK_EQ(core::to_hex(primitives::serialize_outputs(outs)),
             "000100000000000003e800160014f14a284cd713def428cb782b600a77c35fd60f14");
    CHECK_EQ(primitives::hash_outputs(outs).to_hex(),
             "cb19473c5c6ab73c73a2d53dfe68af6b5a9f84680073018bb44888e0d5488994");
}

TEST_CASE(Transaction, NullValueIsSingleByte) {
    primitives::ConfidentialValue v;
    CHECK(v.is_null());
    core::DataStream ds;
    v.serialize(ds);
    CHECK_EQ(core::to_hex(ds.view()), "00");
}
