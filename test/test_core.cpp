// Copyright (c) 2024-2026 The ELMS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// Unit tests for the core module.

#include "test_framework.h"

#include "core/base58.h"
#include "core/bech32.h"
#include "core/blech32.h"
#include "core/config.h"
#include "core/error.h"
#include "core/hex.h"
#include "core/logging.h"
#include "core/serialize.h"
#include "core/stream.h"
#include "core/types.h"

#include <array>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

// ============================================================================
// Types -- uint256 / uint160
// ============================================================================

TEST_CASE(Types, uint256_default_is_zero) {
    core::uint256 z;
    CHECK(z.is_zero());
    CHECK_EQ(z.to_hex(),
             "0000000000000000000000000000000000000000000000000000000000000000");
}

TEST_CASE(Types, uint256_hex_forward_and_display) {
    std::string hex =
        "0100000000000000000000000000000000000000000000000000000000000002";
    auto val = core::uint256::from_hex(hex);
    CHECK(val.has_value());
    CHECK_EQ(val->to_hex(), hex);
    CHECK_EQ(val->to_display_hex(),
             "0200000000000000000000000000000000000000000000000000000000000001");
    CHECK_EQ(val->bytes()[0], 0x01);
    CHECK_EQ(val->bytes()[31], 0x02);

    auto disp = core::uint256::from_display_hex(hex);
    CHECK(disp.has_value());
    CHECK_EQ(disp->bytes()[0], 0x02);
}

TEST_CASE(Types, uint256_from_hex_rejects_bad_input) {
    CHECK(!core::uint256::from_hex("00").has_value());
    CHECK(!core::uint256::from_hex(
        "zz00000000000000000000000000000000000000000000000000000000000000")
        .has_value());
}

TEST_CASE(Types, uint160_comparison) {
    auto a = core::uint160::from_hex("0000000000000000000000000000000000000001");
    auto b = core::uint160::from_hex("0000000000000000000000000000000000000002");
    CHECK(a.has_value() && b.has_value());
    CHECK(*a != *b);
    CHECK(*a < *b);
    CHECK(*a == *core::uint160::from_hex(
        "0000000000000000000000000000000000000001"));
}

// ============================================================================
// Hex
// ============================================================================

TEST_CASE(Hex, to_hex_basic) {
    std::vector<uint8_t> data = {0xde, 0xad, 0xbe, 0xef};
    CHECK_EQ(core::to_hex(data), "deadbeef");
    CHECK_EQ(core::to_hex(std::vector<uint8_t>{}), "");
}

TEST_CASE(Hex, from_hex_valid) {
    auto result = core::from_hex("DEADbeef");
    CHECK(result.has_value());
    CHECK_EQ(result->size(), 4u);
    CHECK_EQ((*result)[0], 0xde);
    CHECK_EQ((*result)[3], 0xef);
}

TEST_CASE(Hex, from_hex_invalid) {
    CHECK(!core::from_hex("abc").has_value());
    CHECK(!core::from_hex("zzzz").has_value());
}

TEST_CASE(Hex, is_hex_checks) {
    CHECK(core::is_hex("0123456789abcdefABCDEF"));
    CHECK(core::is_hex(""));
    CHECK(!core::is_hex("0g"));
    CHECK(!core::is_hex("abc"));
    CHECK(core::is_lower_hex("00ff"));
    CHECK(!core::is_lower_hex("00FF"));
}

// ============================================================================
// Error / Result
// ============================================================================

TEST_CASE(ErrorResult, error_creation) {
    core::Error err(core::ErrorCode::PARSE_ERROR, "bad input");
    CHECK_EQ(err.code(), core::ErrorCode::PARSE_ERROR);
    CHECK_EQ(err.message(), "bad input");
    CHECK(!err.is_ok());
    CHECK(static_cast<bool>(err));
    CHECK(!err.index().has_value());
}

TEST_CASE(ErrorResult, error_none_is_ok) {
    core::Error ok_err;
    CHECK(ok_err.is_ok());
    CHECK_EQ(ok_err.code(), core::ErrorCode::NONE);
    CHECK_EQ(ok_err.format(), "no error");
}

TEST_CASE(ErrorResult, error_with_index_formats) {
    core::Error err(core::ErrorCode::MISSING_SIGHASH_ITEM, "missing item");
    err.with_index(4);
    CHECK(err.index().has_value());
    CHECK_EQ(*err.index(), 4u);
    CHECK(err.format().starts_with(
        "MISSING_SIGHASH_ITEM(402): missing item #4"));
}

TEST_CASE(ErrorResult, result_with_value) {
    core::Result<int> r = 42;
    CHECK(r.ok());
    CHECK_EQ(r.value(), 42);
    CHECK_EQ(r.value_or(0), 42);
}

TEST_CASE(ErrorResult, result_with_error) {
    core::Result<int> r = core::Error(core::ErrorCode::BAD_CHECKSUM, "fail");
    CHECK(!r.ok());
    CHECK_EQ(r.error().code(), core::ErrorCode::BAD_CHECKSUM);
    CHECK_EQ(r.value_or(-1), -1);
}

TEST_CASE(ErrorResult, result_map_and_then) {
    core::Result<int> r = 5;
    auto mapped = r.map([](int v) { return v * 2; });
    CHECK(mapped.ok());
    CHECK_EQ(mapped.value(), 10);

    auto chained = r.and_then([](int v) -> core::Result<std::string> {
        return std::to_string(v * 3);
    });
    CHECK(chained.ok());
    CHECK_EQ(chained.value(), "15");

    core::Result<int> err = core::Error(core::ErrorCode::TYPE_CHECK, "t");
    auto chained_err = err.and_then([](int v) -> core::Result<std::string> {
        return std::to_string(v);
    });
    CHECK(!chained_err.ok());
    CHECK_EQ(chained_err.error().code(), core::ErrorCode::TYPE_CHECK);
}

namespace {

core::Result<int> parse_small(int v) {
    if (v > 10) {
        return core::Error(core::ErrorCode::BAD_NUMBER, "too large");
    }
    return v;
}

core::Result<int> doubled(int v) {
    ELMS_TRY_ASSIGN(small, parse_small(v));
    return small * 2;
}

}  // namespace

TEST_CASE(ErrorResult, try_assign_propagates) {
    CHECK_EQ(doubled(4).value(), 8);
    CHECK_ERR_CODE(doubled(11), core::ErrorCode::BAD_NUMBER);
}

// ============================================================================
// Base58
// ============================================================================

TEST_CASE(Base58, encode_decode_roundtrip) {
    std::vector<uint8_t> data = {0x00, 0x01, 0x02, 0x03, 0xff};
    std::string encoded = core::base58_encode(data);
    CHECK(!encoded.empty());
    CHECK_EQ(encoded[0], '1');

    auto decoded = core::base58_decode(encoded);
    CHECK(decoded.has_value());
    CHECK(*decoded == data);
}

TEST_CASE(Base58, decode_invalid_character) {
    CHECK(!core::base58_decode("0OIl").has_value());
}

TEST_CASE(Base58, base58check_corrupted) {
    std::vector<uint8_t> payload = {0xAB, 0xCD};
    std::string encoded = core::base58check_encode(payload);
    std::string corrupted = encoded;
    corrupted.back() = (corrupted.back() == '1') ? '2' : '1';
    CHECK(!core::base58check_decode(corrupted).has_value());
}

TEST_CASE(Base58, encode_with_version_known_address) {
    auto payload = core::from_hex("751e76e8199196d454941c45d1b3a323f1433bd6");
    CHECK_EQ(core::encode_with_version(0x00, *payload),
             "1BgGZ9tcN4rm9KBzDn7KprQz87SZ26SAMH");

    auto decoded = core::decode_with_version(
        "1BgGZ9tcN4rm9KBzDn7KprQz87SZ26SAMH");
    CHECK(decoded.has_value());
    CHECK_EQ(decoded->first, 0x00);
    CHECK(decoded->second == *payload);
}

TEST_CASE(Base58, elements_version_byte) {
    auto payload = core::from_hex("f14a284cd713def428cb782b600a77c35fd60f14");
    CHECK_EQ(core::encode_with_version(235, *payload),
             "2dwRa5JErQHA7bTCpmHD4VmpjCzfdU8XZr9");
}

// ============================================================================
// Bech32
// ============================================================================

TEST_CASE(Bech32, segwit_v0_known_vector) {
    auto prog = core::from_hex("751e76e8199196d454941c45d1b3a323f1433bd6");
    CHECK_EQ(core::encode_segwit("bc", 0, *prog),
             "bc1qw508d6qejxtdg4y5r3zarvary0c5xw7kv8f3t4");

    auto decoded = core::decode_segwit(
        "bc", "bc1qw508d6qejxtdg4y5r3zarvary0c5xw7kv8f3t4");
    CHECK(decoded.has_value());
    CHECK_EQ(decoded->first, 0);
    CHECK(decoded->second == *prog);
}

TEST_CASE(Bech32, segwit_v1_uses_bech32m) {
    auto prog = core::from_hex(
        "79be667ef9dcbbac55a06295ce870b07029bfcdb2dce28d959f2815b16f81798");
    CHECK_EQ(core::encode_segwit("bc", 1, *prog),
             "bc1p0xlxvlhemja6c4dqv22uapctqupfhlxm9h8z3k2e72q4k9hcz7vqzk5jj0");
}

TEST_CASE(Bech32, decode_rejects_wrong_hrp) {
    CHECK(!core::decode_segwit(
        "ert", "bc1qw508d6qejxtdg4y5r3zarvary0c5xw7kv8f3t4").has_value());
}

TEST_CASE(Bech32, elements_hrp) {
    auto prog = core::from_hex("f14a284cd713def428cb782b600a77c35fd60f14");
    CHECK_EQ(core::encode_segwit("ert", 0, *prog),
             "ert1q799zsnxhz000g2xt0q4kqznhcd0avrc5mxl8v2");
}

// ============================================================================
// Blech32
// ============================================================================

namespace {

// Blinding key 2G followed by HASH160 of the usual test key.
const char* BLINDED_WPKH_PROGRAM =
    "02c6047f9441ed7d6d3045406e95c07cd85c778e4b8cef3ca7abac09b95c709ee5"
    "f14a284cd713def428cb782b600a77c35fd60f14";
const char* BLINDED_WPKH_ADDR =
    "el1qqtrqglu5g8kh6mfsg4qxa9wq0nv9cauwfwxw70984wkqnw2uwz0wtu229pxdwy777s5"
    "vk7ptvq980s6l6c83gnsemdc07khjc";

} // namespace

TEST_CASE(Blech32, confidential_v0_vector) {
    auto prog = core::from_hex(BLINDED_WPKH_PROGRAM);
    CHECK_EQ(core::encode_blech32_segwit("el", 0, *prog), BLINDED_WPKH_ADDR);

    auto decoded = core::decode_blech32_segwit("el", BLINDED_WPKH_ADDR);
    CHECK(decoded.has_value());
    CHECK_EQ(decoded->first, 0);
    CHECK(decoded->second == *prog);
}

TEST_CASE(Blech32, checksum_is_twelve_chars) {
    auto prog = core::from_hex(BLINDED_WPKH_PROGRAM);
    const std::string lq = core::encode_blech32_segwit("lq", 0, *prog);
    CHECK_EQ(lq.substr(lq.size() - 12), "ccegwk3w39wz");
    CHECK_EQ(lq.substr(0, lq.size() - 12),
             std::string("lq") +
                 std::string(BLINDED_WPKH_ADDR).substr(2, lq.size() - 14));
}

TEST_CASE(Blech32, decode_rejects_corruption) {
    std::string bad = BLINDED_WPKH_ADDR;
    bad[10] = bad[10] == 'q' ? 'p' : 'q';
    CHECK(!core::decode_blech32_segwit("el", bad).has_value());
    CHECK(!core::decode_blech32_segwit("lq", BLINDED_WPKH_ADDR).has_value());
    // A bech32 checksum is not a blech32 one.
    CHECK(!core::decode_blech32_segwit(
        "ert", "ert1q799zsnxhz000g2xt0q4kqznhcd0avrc5mxl8v2").has_value());
}

TEST_CASE(Blech32, v0_requires_blech32_not_blech32m) {
    CHECK(!core::decode_blech32_segwit(
        "el",
        "el1qqtrqglu5g8kh6mfsg4qxa9wq0nv9cauwfwxw70984wkqnw2uwz0wtu229pxdwy777s5"
        "vk7ptvq980s6l6c83gm94vgskth20c").has_value());
}

TEST_CASE(Blech32, v0_rejects_odd_program_length) {
    CHECK(!core::decode_blech32_segwit(
        "el",
        "el1qqtrqglu5g8kh6mfsg4qxa9wq0nv9cauwfwxw70984wkqnw2uwz0w2qqqqqqqqqqqqq"
        "qqqqqqqqqqqqqqqqqqqqqqqqqqq2z6ppdzclx6a").has_value());
}

// ============================================================================
// Serialization / Stream
// ============================================================================

TEST_CASE(Serialization, compact_size) {
    CHECK_EQ(core::compact_size_len(0), 1u);
    CHECK_EQ(core::compact_size_len(252), 1u);
    CHECK_EQ(core::compact_size_len(253), 3u);
    CHECK_EQ(core::compact_size_len(0x10000), 5u);
    CHECK_EQ(core::compact_size_len(0x100000000ULL), 9u);

    core::DataStream ds;
    core::ser_write_compact_size(ds, 253);
    CHECK_EQ(core::to_hex(ds.view()), "fdfd00");
}

TEST_CASE(Serialization, little_endian_integers) {
    core::DataStream ds;
    core::ser_write_u32(ds, 0x01020304);
    core::ser_write_u64(ds, 1);
    CHECK_EQ(core::to_hex(ds.view()), "040302010100000000000000");
}

TEST_CASE(Serialization, big_endian_u64) {
    core::DataStream ds;
    core::ser_write_u64_be(ds, 0x0102);
    CHECK_EQ(core::to_hex(ds.view()), "0000000000000102");
}

TEST_CASE(Serialization, vector_is_length_prefixed) {
    core::DataStream ds;
    std::vector<uint8_t> v = {0xaa, 0xbb};
    core::ser_write_vector(ds, v);
    CHECK_EQ(core::to_hex(ds.view()), "02aabb");

    auto out = ds.release();
    CHECK_EQ(out.size(), 3u);
    CHECK(ds.empty());
}

// ============================================================================
// Config
// ============================================================================

TEST_CASE(Config, parse_args_and_positionals) {
    const char* argv[] = {"elms-cli", "-network=Liquid", "--debug",
                          "parse", "", "elpk(K)"};
    core::Config cfg;
    cfg.parse_args(6, argv);

    CHECK_EQ(cfg.network(), "liquid");
    CHECK(cfg.get_bool(core::CONF_DEBUG));
    CHECK_EQ(cfg.positional().size(), 3u);
    CHECK_EQ(cfg.positional()[0], "parse");
    CHECK_EQ(cfg.positional()[1], "");
    CHECK(!cfg.has(core::CONF_QUIET));
    CHECK_EQ(cfg.get_or(core::CONF_LOGLEVEL, "warn"), "warn");
}

TEST_CASE(Config, network_defaults_to_elements) {
    core::Config cfg;
    CHECK_EQ(cfg.network(), "elements");
}

TEST_CASE(Config, file_values_yield_to_cli) {
    auto path = std::filesystem::temp_directory_path() / "elms_test.conf";
    {
        std::ofstream ofs(path);
        ofs << "# comment\n"
            << "network=liquidtestnet\n"
            << "loglevel = debug\n"
            << "\n"
            << "quiet\n";
    }

    const char* argv[] = {"elms-cli", "-loglevel=trace"};
    core::Config cfg;
    cfg.parse_args(2, argv);
    CHECK_OK(cfg.parse_file(path));

    CHECK_EQ(cfg.network(), "liquidtestnet");
    CHECK_EQ(cfg.get_or(core::CONF_LOGLEVEL, ""), "trace");
    CHECK_EQ(cfg.get_list(core::CONF_LOGLEVEL).size(), 2u);
    CHECK(cfg.get_bool(core::CONF_QUIET));

    std::filesystem::remove(path);
}

TEST_CASE(Config, missing_file_is_config_error) {
    core::Config cfg;
    CHECK_ERR_CODE(cfg.parse_file("/nonexistent/elms.conf"),
                   core::ErrorCode::CONFIG_ERROR);
}

// ============================================================================
// Logging
// ============================================================================

TEST_CASE(Logging, parse_log_level_names) {
    CHECK(core::parse_log_level("trace") == core::LogLevel::TRACE);
    CHECK(core::parse_log_level("WARNING") == core::LogLevel::WARN);
    CHECK(core::parse_log_level("off") == core::LogLevel::OFF);
    CHECK(!core::parse_log_level("verbose").has_value());
}

TEST_CASE(Logging, parse_log_category_names) {
    CHECK(core::parse_log_category("all") == core::LogCategory::ALL);
    CHECK(!core::parse_log_category("mempool").has_value());
}

TEST_CASE(Logging, category_filter) {
    auto& logger = core::Logger::instance();
    const auto saved_level = logger.level();
    const auto saved_cats = logger.enabled_categories();

    logger.set_level(core::LogLevel::DEBUG);
    logger.disable_category(core::LogCategory::ALL);
    logger.enable_category(*core::parse_log_category("interpreter"));
    CHECK(logger.will_log(core::LogLevel::DEBUG,
                          core::LogCategory::INTERPRETER));
    CHECK(!logger.will_log(core::LogLevel::DEBUG,
                           core::LogCategory::DESCRIPTOR));
    CHECK(!logger.will_log(core::LogLevel::TRACE,
                           core::LogCategory::INTERPRETER));
    CHECK(logger.will_log(core::LogLevel::DEBUG, core::LogCategory::NONE));

    logger.set_level(saved_level);
    logger.disable_category(core::LogCategory::ALL);
    logger.enable_category(saved_cats);
}
