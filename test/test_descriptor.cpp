// Copyright (c) 2024-2026 The ELMS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "test_framework.h"

#include "core/hex.h"
#include "crypto/hash.h"
#include "descriptor/bare.h"
#include "descriptor/pretaproot.h"
#include "descriptor/segwitv0.h"
#include "descriptor/sh.h"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

using descriptor::Bare;
using descriptor::Pkh;
using descriptor::PreTaprootDescriptor;
using descriptor::Sh;
using descriptor::SortedMulti;
using descriptor::Wpkh;
using descriptor::Wsh;
using miniscript::Context;
using miniscript::Miniscript;
using miniscript::PublicKey;
using primitives::AddressParams;

namespace {

const std::string K1 =
    "025edd5cc23c51e87a497ca815d5dce0f8ab52554f849ed8995de64c5f34ce7143";
const std::string K1U =
    "045edd5cc23c51e87a497ca815d5dce0f8ab52554f849ed8995de64c5f34ce7143"
    "efae9c8dbc14130661e8cec030c89ad0c13c66c0d17a2905cdc706ab7399a868";
const std::string K2 =
    "02c6047f9441ed7d6d3045406e95c07cd85c778e4b8cef3ca7abac09b95c709ee5";
const std::string K3 =
    "02f9308a019258c31049344f85f89d5229b531c845836f99b08601f113bce036f9";
const std::string X1 = K1.substr(2);
const std::string K1_HASH = "f14a284cd713def428cb782b600a77c35fd60f14";

const std::string DUMMY_DER =
    "302e02153b78ce563f89a0ed9414f5aa28ad0d96d6795f9c63"
    "02153b78ce563f89a0ed9414f5aa28ad0d96d6795f9c65";
// DER plus SIGHASH_ALL, as pushed on the stack.
const std::string DUMMY_SIG = DUMMY_DER + "01";

std::vector<uint8_t> unhex(std::string_view hex) {
    return core::from_hex(hex).value_or(std::vector<uint8_t>{});
}

PublicKey key(const std::string& hex) {
    return PublicKey::from_string(hex).value();
}

PreTaprootDescriptor parse(const std::string& s) {
    return PreTaprootDescriptor::from_str(s).value();
}

miniscript::SimpleSatisfier k1_satisfier() {
    miniscript::SimpleSatisfier sat;
    sat.ecdsa_sigs[key(K1)] = miniscript::EcdsaSig{unhex(DUMMY_DER), 0x01};
    return sat;
}

class SwapKeyTranslator : public miniscript::KeyTranslator {
public:
    SwapKeyTranslator(PublicKey from, PublicKey to)
        : from_(std::move(from)), to_(std::move(to)) {}

    core::Result<PublicKey> pk(const PublicKey& k) const override {
        return k == from_ ? to_ : k;
    }

private:
    PublicKey from_;
    PublicKey to_;
};

}  // namespace

// ===================================================================
// Parsing and printing
// ===================================================================

TEST_CASE(Descriptor, DispatchByOuterName) {
    CHECK(parse("elpkh(" + K1 + ")#e0a9knv7").is<Pkh>());
    CHECK(parse("elwpkh(" + K1 + ")#c88czymq").is<Wpkh>());
    CHECK(parse("elwsh(pk(" + K1 + "))#dpltk5ws").is<Wsh>());
    CHECK(parse("elsh(wpkh(" + K1 + "))#e2k6ns2m").is<Sh>());
}

TEST_CASE(Descriptor, UnknownNameFallsBackToBare) {
    auto desc = parse("elpk(" + K1 + ")#mypm0233");
    CHECK(desc.is<Bare>());
    CHECK_EQ(desc.to_string(), "elpk(" + K1 + ")#mypm0233");
}

TEST_CASE(Descriptor, PrintsWithPrefixAndChecksum) {
    const std::string cases[] = {
        "elpkh(" + K1 + ")#e0a9knv7",
        "elwpkh(" + K1 + ")#c88czymq",
        "elwsh(pk(" + K1 + "))#dpltk5ws",
        "elsh(wpkh(" + K1 + "))#e2k6ns2m",
        "elsh(pk(" + K1 + "))#f7a8zqs0",
        "elsh(wsh(pk(" + K1 + ")))#y076rc77",
        "elmulti(1," + K1 + "," + K2 + ")#h3qdl39e",
    };
    for (const auto& s : cases) {
        auto desc = PreTaprootDescriptor::from_str(s);
        CHECK_OK(desc);
        if (!desc.ok()) continue;
        CHECK_EQ(desc.value().to_string(), s);
    }
}

TEST_CASE(Descriptor, PrefixOptionalOnInput) {
    auto desc = PreTaprootDescriptor::from_str("wpkh(" + K1 + ")#62xet98y");
    CHECK_OK(desc);
    CHECK(desc.value().is<Wpkh>());
    CHECK_EQ(desc.value().to_string(), "elwpkh(" + K1 + ")#c88czymq");
    CHECK(desc.value() == parse("elwpkh(" + K1 + ")#c88czymq"));
}

TEST_CASE(Descriptor, ChecksumRequired) {
    CHECK_ERR_CODE(PreTaprootDescriptor::from_str("elpkh(" + K1 + ")"),
                   core::ErrorCode::BAD_CHECKSUM);
    CHECK_ERR_CODE(PreTaprootDescriptor::from_str("elpkh(" + K1 + ")#c88czymq"),
                   core::ErrorCode::BAD_CHECKSUM);
}

TEST_CASE(Descriptor, RoundtripHelper) {
    auto ok = descriptor::roundtrip_descriptor(
        "elwsh(or_d(pk(" + K1 + "),pk(" + K2 + ")))#3y549r2w");
    CHECK_OK(ok);
    CHECK(ok.value());

    auto rejected = descriptor::roundtrip_descriptor("elwsh(pk(" + K1 + "))");
    CHECK_OK(rejected);
    CHECK(!rejected.value());
}

TEST_CASE(Descriptor, ParseDoesNotRunSanityChecks) {
    auto desc = PreTaprootDescriptor::from_str("elwsh(older(144))#q270z67l");
    CHECK_OK(desc);
    CHECK_ERR_CODE(desc.value().sanity_check(),
                   core::ErrorCode::SIG_FREE_PATH);
    CHECK_OK(parse("elwsh(pk(" + K1 + "))#dpltk5ws").sanity_check());
}

// ===================================================================
// Scripts and addresses
// ===================================================================

TEST_CASE(Descriptor, WshScripts) {
    auto desc = parse("elwsh(pk(" + K1 + "))#dpltk5ws");
    CHECK_EQ(desc.script_pubkey().to_hex(),
             "00204916229d2383639053df5dbada1bf5ff8b856185884159494f91ff4254109cc1");
    CHECK_EQ(desc.explicit_script().to_hex(), "21" + K1 + "ac");
    CHECK(desc.script_code() == desc.explicit_script());
    CHECK(desc.unsigned_script_sig().empty());
}

TEST_CASE(Descriptor, WpkhScriptCodeIsP2pkh) {
    auto desc = parse("elwpkh(" + K1 + ")#c88czymq");
    CHECK_EQ(desc.script_pubkey().to_hex(), "0014" + K1_HASH);
    CHECK_EQ(desc.script_code().to_hex(), "76a914" + K1_HASH + "88ac");
}

TEST_CASE(Descriptor, ShWpkhScripts) {
    auto desc = parse("elsh(wpkh(" + K1 + "))#e2k6ns2m");
    CHECK_EQ(desc.script_pubkey().to_hex(),
             "a9146e9dbc265613929609c7fc885de8993998903f2b87");
    CHECK_EQ(desc.unsigned_script_sig().to_hex(), "160014" + K1_HASH);
    CHECK_EQ(desc.explicit_script().to_hex(), "0014" + K1_HASH);
}

TEST_CASE(Descriptor, ShWshExplicitScriptIsWitnessScript) {
    auto desc = parse("elsh(wsh(pk(" + K1 + ")))#y076rc77");
    CHECK_EQ(desc.explicit_script().to_hex(), "21" + K1 + "ac");
    CHECK_EQ(desc.unsigned_script_sig().to_hex(),
             "220020"
             "4916229d2383639053df5dbada1bf5ff8b856185884159494f91ff4254109cc1");
    CHECK_EQ(desc.script_pubkey().to_hex(),
             "a9147711dcdbc5db7fff31f02539a90e7091a98600d987");
}

TEST_CASE(Descriptor, Addresses) {
    auto addr_of = [](const std::string& s) {
        return parse(s).address(AddressParams::ELEMENTS).value().to_string();
    };
    CHECK_EQ(addr_of("elpkh(" + K1 + ")#e0a9knv7"),
             "2dwRa5JErQHA7bTCpmHD4VmpjCzfdU8XZr9");
    CHECK_EQ(addr_of("elwpkh(" + K1 + ")#c88czymq"),
             "ert1q799zsnxhz000g2xt0q4kqznhcd0avrc5mxl8v2");
    CHECK_EQ(addr_of("elwsh(pk(" + K1 + "))#dpltk5ws"),
             "ert1qfytz98frsd3eq57ltkad5xl4l79c2cv93pq4jj20j8l5y4qsnnqsactz4m");
    CHECK_EQ(addr_of("elsh(wpkh(" + K1 + "))#e2k6ns2m"),
             "XMS88s2e89iyU4ooV4BRZxPdcowvQ6m8Zs");
    CHECK_EQ(addr_of("elsh(pk(" + K1 + "))#f7a8zqs0"),
             "XYvtbZ6HoaFWHj8RkRUe6npEm7LdM7zXm4");
    CHECK_EQ(addr_of("elsh(wsh(pk(" + K1 + ")))#y076rc77"),
             "XNCpf6ZyZWDEYkK3UKCZ18mC9xHkRDEbhR");
}

TEST_CASE(Descriptor, AddressFollowsNetwork) {
    auto desc = parse("elwpkh(" + K1 + ")#c88czymq");
    CHECK_EQ(desc.address(AddressParams::LIQUID).value().to_string(),
             "ex1q799zsnxhz000g2xt0q4kqznhcd0avrc5p54lns");
}

TEST_CASE(Descriptor, BareHasNoAddress) {
    CHECK_ERR_CODE(parse("elpk(" + K1 + ")#mypm0233")
                       .address(AddressParams::ELEMENTS),
                   core::ErrorCode::BARE_DESCRIPTOR_ADDR);
}

TEST_CASE(Descriptor, ConfidentialAddresses) {
    const std::optional<PublicKey> blinder = key(K2);
    auto blind_of = [&blinder](const std::string& s) {
        return parse(s).blind_addr(blinder, AddressParams::ELEMENTS)
            .value().to_string();
    };
    CHECK_EQ(blind_of("elpkh(" + K1 + ")#e0a9knv7"),
             "CTEq3h5CAxyi8y64r9eteudBTjXQkL8Pcwv7USf9wLsA4qDpysRsse94X3kUrcZg"
             "mKo9NQGRin2UxLgh");
    CHECK_EQ(blind_of("elwpkh(" + K1 + ")#c88czymq"),
             "el1qqtrqglu5g8kh6mfsg4qxa9wq0nv9cauwfwxw70984wkqnw2uwz0wtu229pxd"
             "wy777s5vk7ptvq980s6l6c83gnsemdc07khjc");
    CHECK_EQ(blind_of("elwsh(pk(" + K1 + "))#dpltk5ws"),
             "el1qqtrqglu5g8kh6mfsg4qxa9wq0nv9cauwfwxw70984wkqnw2uwz0w2jgky2wj"
             "8qmrjpfa7hd6mgdltluts4sctzzpt9y5ly0lgf2pp8xpzr2r4etqznru");
    CHECK_EQ(blind_of("elsh(wpkh(" + K1 + "))#e2k6ns2m"),
             "AzppLHEfy6mMjNvnbUkyDQ1YbRZCfXq4hh4F4o8FWkPF9z5C42attxN3ZMPUnYRE"
             "t25hGW593r8LgvfK");
    CHECK_EQ(blind_of("elsh(pk(" + K1 + "))#f7a8zqs0"),
             "AzppLHEfy6mMjNvnbUkyDQ1YbRZCfXq4hh4F4o8FWkPF9z5PYo3axc3U5tD97Agc"
             "BEcXh7DSSZ7SCHgm");
    CHECK_EQ(blind_of("elsh(wsh(pk(" + K1 + ")))#y076rc77"),
             "AzppLHEfy6mMjNvnbUkyDQ1YbRZCfXq4hh4F4o8FWkPF9z5Cpj78SHoQ3cUAHnQV"
             "u9Wse4cHPgC3H91i");
}

TEST_CASE(Descriptor, BlindAddrPerVariant) {
    const std::optional<PublicKey> blinder = key(K2);
    auto pkh = Pkh::from_str("elpkh(" + K1 + ")#e0a9knv7");
    CHECK_OK(pkh);
    auto addr = pkh.value().blind_addr(blinder, AddressParams::LIQUID);
    CHECK_OK(addr);
    CHECK_EQ(addr.value().to_string(),
             "VTpyPgY9wPy59ATXgMzUMgsJDyniiQk96sxxVKSy9Hs8bEcF6p9qYJzB1jK8tNhg"
             "donwJKfkCjxgjptZ");

    auto wpkh = Wpkh::from_str("elwpkh(" + K1 + ")#c88czymq");
    CHECK_OK(wpkh);
    CHECK_EQ(wpkh.value().blind_addr(blinder, AddressParams::LIQUID)
                 .value().to_string(),
             "lq1qqtrqglu5g8kh6mfsg4qxa9wq0nv9cauwfwxw70984wkqnw2uwz0wtu229pxd"
             "wy777s5vk7ptvq980s6l6c83gccegwk3w39wz");

    auto wsh = Wsh::from_str("elwsh(pk(" + K1 + "))#dpltk5ws");
    CHECK_OK(wsh);
    CHECK(wsh.value().blind_addr(blinder).value().blinding_key() ==
          unhex(K2));

    auto sh = Sh::from_str("elsh(wpkh(" + K1 + "))#e2k6ns2m");
    CHECK_OK(sh);
    CHECK(sh.value().blind_addr(blinder).value().unblinded() ==
          sh.value().address().value());

    auto bare = Bare::from_str("elpk(" + K1 + ")#mypm0233");
    CHECK_OK(bare);
    CHECK_ERR_CODE(bare.value().blind_addr(blinder),
                   core::ErrorCode::BARE_DESCRIPTOR_ADDR);
}

TEST_CASE(Descriptor, BlindAddrWithoutBlinder) {
    auto desc = parse("elwpkh(" + K1 + ")#c88czymq");
    auto addr = desc.blind_addr(std::nullopt, AddressParams::ELEMENTS);
    CHECK_OK(addr);
    CHECK(!addr.value().is_blinded());
    CHECK(addr.value() == desc.address(AddressParams::ELEMENTS).value());
    CHECK_ERR_CODE(parse("elpk(" + K1 + ")#mypm0233")
                       .blind_addr(std::nullopt, AddressParams::ELEMENTS),
                   core::ErrorCode::BARE_DESCRIPTOR_ADDR);
}

TEST_CASE(Descriptor, BlindingKeyForms) {
    auto desc = parse("elwpkh(" + K1 + ")#c88czymq");
    // An uncompressed blinder is written compressed.
    auto addr = desc.blind_addr(key(K1U), AddressParams::ELEMENTS);
    CHECK_OK(addr);
    CHECK(addr.value().blinding_key() == unhex(K1));
    CHECK_EQ(addr.value().to_string(),
             "el1qqf0d6hxz83g7s7jf0j5pt4wuuru2k5j4f7zfakyethnyche5eec58u229pxd"
             "wy777s5vk7ptvq980s6l6c83g4s5f68mxppr8");
    CHECK(addr.value() ==
          desc.blind_addr(key(K1), AddressParams::ELEMENTS).value());

    CHECK_ERR_CODE(desc.blind_addr(key(X1), AddressParams::ELEMENTS),
                   core::ErrorCode::BAD_KEY);
}

// ===================================================================
// Weights
// ===================================================================

TEST_CASE(Descriptor, MaxSatisfactionWeight) {
    auto weight = [](const std::string& s) {
        return parse(s).max_satisfaction_weight().value();
    };
    CHECK_EQ(weight("elwsh(pk(" + K1 + "))#dpltk5ws"), 114u);
    CHECK_EQ(weight("elpkh(" + K1 + ")#e0a9knv7"), 432u);
    CHECK_EQ(weight("elwpkh(" + K1 + ")#c88czymq"), 112u);
    CHECK_EQ(weight("elsh(wpkh(" + K1 + "))#e2k6ns2m"), 204u);
    CHECK_EQ(weight("elpk(" + K1 + ")#mypm0233"), 296u);
    CHECK_EQ(weight("elsh(pk(" + K1 + "))#f7a8zqs0"), 440u);
    CHECK_EQ(weight("elsh(wsh(pk(" + K1 + ")))#y076rc77"), 254u);
}

// ===================================================================
// Satisfaction
// ===================================================================

TEST_CASE(Descriptor, PkhSatisfaction) {
    auto desc = parse("elpkh(" + K1 + ")#e0a9knv7");
    miniscript::SimpleSatisfier empty;
    CHECK_ERR_CODE(desc.get_satisfaction(empty), core::ErrorCode::MISSING_SIG);

    auto sat = desc.get_satisfaction(k1_satisfier());
    CHECK_OK(sat);
    CHECK(sat.value().witness.empty());
    CHECK_EQ(sat.value().script_sig.to_hex(), "31" + DUMMY_SIG + "21" + K1);
}

TEST_CASE(Descriptor, WpkhSatisfaction) {
    auto sat = parse("elwpkh(" + K1 + ")#c88czymq")
                   .get_satisfaction(k1_satisfier());
    CHECK_OK(sat);
    CHECK_EQ(sat.value().witness.size(), 2u);
    CHECK_EQ(core::to_hex(sat.value().witness[0]), DUMMY_SIG);
    CHECK_EQ(core::to_hex(sat.value().witness[1]), K1);
    CHECK(sat.value().script_sig.empty());
}

TEST_CASE(Descriptor, WshSatisfactionEndsWithScript) {
    auto sat = parse("elwsh(pk(" + K1 + "))#dpltk5ws")
                   .get_satisfaction(k1_satisfier());
    CHECK_OK(sat);
    CHECK_EQ(sat.value().witness.size(), 2u);
    CHECK_EQ(core::to_hex(sat.value().witness[0]), DUMMY_SIG);
    CHECK_EQ(core::to_hex(sat.value().witness[1]), "21" + K1 + "ac");
}

TEST_CASE(Descriptor, ShWpkhSatisfaction) {
    auto sat = parse("elsh(wpkh(" + K1 + "))#e2k6ns2m")
                   .get_satisfaction(k1_satisfier());
    CHECK_OK(sat);
    CHECK_EQ(sat.value().witness.size(), 2u);
    CHECK_EQ(sat.value().script_sig.to_hex(), "160014" + K1_HASH);
}

TEST_CASE(Descriptor, ShLegacySatisfaction) {
    auto sat = parse("elsh(pk(" + K1 + "))#f7a8zqs0")
                   .get_satisfaction(k1_satisfier());
    CHECK_OK(sat);
    CHECK(sat.value().witness.empty());
    CHECK_EQ(sat.value().script_sig.to_hex(),
             "31" + DUMMY_SIG + "2321" + K1 + "ac");
}

TEST_CASE(Descriptor, BareSatisfaction) {
    auto sat = parse("elpk(" + K1 + ")#mypm0233")
                   .get_satisfaction(k1_satisfier());
    CHECK_OK(sat);
    CHECK_EQ(sat.value().script_sig.to_hex(), "31" + DUMMY_SIG);
}

TEST_CASE(Descriptor, MalleableSatisfactionAgrees) {
    auto desc = parse("elwsh(pk(" + K1 + "))#dpltk5ws");
    auto sat = desc.get_satisfaction(k1_satisfier());
    auto mall = desc.get_satisfaction_mall(k1_satisfier());
    CHECK_OK(sat);
    CHECK_OK(mall);
    CHECK(sat.value().witness == mall.value().witness);
}

// ===================================================================
// Key restrictions and sortedmulti
// ===================================================================

TEST_CASE(Descriptor, SingleKeyRestrictions) {
    CHECK_ERR_CODE(Wpkh::create(key(K1U)), core::ErrorCode::COMPRESSED_ONLY);
    CHECK_OK(Pkh::create(key(K1U)));
    CHECK_ERR_CODE(Pkh::create(key(X1)), core::ErrorCode::BAD_KEY);
}

TEST_CASE(Descriptor, BareRestrictions) {
    auto ok = Miniscript::from_str_insane("multi(1," + K1 + "," + K2 + ")",
                                          Context::BARE);
    CHECK_OK(ok);
    CHECK_OK(Bare::create(ok.value()));

    auto nonstandard = Miniscript::from_str_insane(
        "and_v(v:pk(" + K1 + "),pk(" + K2 + "))", Context::BARE);
    CHECK_OK(nonstandard);
    CHECK_ERR_CODE(Bare::create(nonstandard.value()),
                   core::ErrorCode::NON_STANDARD_BARE_SCRIPT);
}

TEST_CASE(SortedMulti, ScriptUsesSortedKeys) {
    auto desc = parse("elwsh(sortedmulti(1," + K2 + "," + K1 + "))#snwutzhh");
    CHECK(desc.is<Wsh>());
    CHECK_EQ(desc.explicit_script().to_hex(),
             "5121" + K1 + "21" + K2 + "52ae");
    CHECK_EQ(desc.address(AddressParams::ELEMENTS).value().to_string(),
             "ert1qmkenax8tqzl5jxgwaxg7ncg3kkd4ke4h8vhs7anjyjlv0atd8t7saadtwe");
    // Printing keeps the order the keys were written in.
    CHECK_EQ(desc.to_string(),
             "elwsh(sortedmulti(1," + K2 + "," + K1 + "))#snwutzhh");
    CHECK(desc.script_pubkey() ==
          parse("elwsh(sortedmulti(1," + K1 + "," + K2 + "))#n4380k2m")
              .script_pubkey());
}

TEST_CASE(SortedMulti, ThresholdBounds) {
    std::vector<PublicKey> keys{key(K1), key(K2)};
    CHECK_ERR_CODE(SortedMulti::create(0, keys, Context::SEGWITV0),
                   core::ErrorCode::BAD_NUMBER);
    CHECK_ERR_CODE(SortedMulti::create(3, keys, Context::SEGWITV0),
                   core::ErrorCode::BAD_NUMBER);
    CHECK_ERR_CODE(SortedMulti::create(1, {}, Context::SEGWITV0),
                   core::ErrorCode::BAD_NUMBER);

    auto sorted = SortedMulti::create(2, keys, Context::SEGWITV0);
    CHECK_OK(sorted);
    CHECK_EQ(sorted.value().threshold(), 2u);
}

TEST_CASE(SortedMulti, InsideSh) {
    auto desc = parse("elsh(sortedmulti(2," + K3 + "," + K1 + "," + K2 +
                      "))#ptptm885");
    CHECK(desc.is<Sh>());
    CHECK_EQ(desc.explicit_script().to_hex(),
             "5221" + K1 + "21" + K2 + "21" + K3 + "53ae");
}

// ===================================================================
// Key iteration and translation
// ===================================================================

TEST_CASE(Descriptor, ForEachKey) {
    auto desc = parse("elwsh(or_d(pk(" + K1 + "),pk(" + K2 + ")))#3y549r2w");
    size_t count = 0;
    CHECK(desc.for_each_key([&count](const PublicKey&) {
        ++count;
        return true;
    }));
    CHECK_EQ(count, 2u);
    CHECK(!desc.for_each_key(
        [](const PublicKey& k) { return k.is_uncompressed(); }));
}

TEST_CASE(Descriptor, TranslateKeys) {
    SwapKeyTranslator swap(key(K1), key(K2));
    const std::vector<std::pair<std::string, std::string>> cases = {
        {"elwpkh(" + K1 + ")#c88czymq", "elwpkh(" + K2 + ")#sj77cp6s"},
        {"elpkh(" + K1 + ")#e0a9knv7", "elpkh(" + K2 + ")#atd9ekxz"},
        {"elsh(wpkh(" + K1 + "))#e2k6ns2m", "elsh(wpkh(" + K2 + "))#20nt5gpp"},
        {"elwsh(pk(" + K1 + "))#dpltk5ws", "elwsh(pk(" + K2 + "))#2l24jxta"},
        {"elpk(" + K1 + ")#mypm0233", "elpk(" + K2 + ")#0xzwvxns"},
    };
    for (const auto& [from, to] : cases) {
        auto translated = parse(from).translate_keys(swap);
        CHECK_OK(translated);
        if (!translated.ok()) continue;
        CHECK_EQ(translated.value().to_string(), to);
    }
}

TEST_CASE(Descriptor, TranslateToUncompressedFailsForWpkh) {
    SwapKeyTranslator swap(key(K1), key(K1U));
    CHECK_ERR_CODE(parse("elwpkh(" + K1 + ")#c88czymq").translate_keys(swap),
                   core::ErrorCode::COMPRESSED_ONLY);
}

TEST_CASE(Descriptor, TranslateRechecksContextKeys) {
    SwapKeyTranslator to_uncompressed(key(K1), key(K1U));
    CHECK_ERR_CODE(parse("elwsh(pk(" + K1 + "))#dpltk5ws")
                       .translate_keys(to_uncompressed),
                   core::ErrorCode::COMPRESSED_ONLY);
    CHECK_ERR_CODE(parse("elsh(wsh(pk(" + K1 + ")))#y076rc77")
                       .translate_keys(to_uncompressed),
                   core::ErrorCode::COMPRESSED_ONLY);

    // Legacy and bare scripts take uncompressed keys but never x-only ones.
    auto legacy = parse("elsh(pk(" + K1 + "))#f7a8zqs0")
                      .translate_keys(to_uncompressed);
    CHECK_OK(legacy);

    SwapKeyTranslator to_xonly(key(K1), key(X1));
    CHECK_ERR_CODE(parse("elpk(" + K1 + ")#mypm0233").translate_keys(to_xonly),
                   core::ErrorCode::BAD_KEY);
}

// ===================================================================
// Round trip of bare pk_h
// ===================================================================

TEST_CASE(Descriptor, BarePkhPrintsWithoutAlias) {
    const std::string s = "elc:pk_h(" + K2 + ")#e0usej63";
    auto bare = Bare::from_str(s);
    CHECK_OK(bare);
    if (!bare.ok()) return;
    CHECK_EQ(bare.value().to_string(), s);

    auto desc = parse(s);
    CHECK(desc.is<Bare>());
    CHECK_EQ(desc.to_string(), s);
    CHECK(PreTaprootDescriptor::from_str(desc.to_string()).value() == desc);

    auto rt = descriptor::roundtrip_descriptor(s);
    CHECK_OK(rt);
    CHECK(rt.ok() && rt.value());
}

TEST_CASE(Descriptor, NestedPkhKeepsAlias) {
    // Under sh() the alias cannot be mistaken for a Pkh descriptor.
    const std::string s = "elsh(pkh(" + K1 + "))#3yve2x9q";
    auto desc = parse(s);
    CHECK(desc.is<Sh>());
    CHECK_EQ(desc.to_string(), s);
    auto rt = descriptor::roundtrip_descriptor(s);
    CHECK_OK(rt);
    CHECK(rt.ok() && rt.value());
}
