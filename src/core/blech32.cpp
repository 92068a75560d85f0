// Copyright (c) 2024-2026 The ELMS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/blech32.h"

#include <array>
#include <cctype>

namespace core {

// ---------------------------------------------------------------------------
// Constants
// ---------------------------------------------------------------------------
namespace {

constexpr char CHARSET[] = "qpzry9x8gf2tvdw0s3jn54khce6mua7l";

constexpr std::array<int8_t, 128> make_charset_rev() {
    std::array<int8_t, 128> table{};
    for (auto& v : table) v = -1;
    for (int i = 0; i < 32; ++i) {
        table[static_cast<uint8_t>(CHARSET[i])] = static_cast<int8_t>(i);
    }
    return table;
}

constexpr auto CHARSET_REV = make_charset_rev();

constexpr uint64_t BLECH32_CONST  = 1;
constexpr uint64_t BLECH32M_CONST = 0x455972a3350f7a1;

constexpr size_t CHECKSUM_LEN = 12;
constexpr size_t MAX_ADDRESS_LEN = 1000;
constexpr size_t BLINDING_KEY_LEN = 33;

uint64_t polymod(const std::vector<uint8_t>& values) {
    static constexpr uint64_t GEN[5] = {
        0x7d52fba40bd886, 0x5e8dbf1a03950c, 0x1c3a3c74072a18,
        0x385d72fa0e5139, 0x7093e5a608865b};
    uint64_t chk = 1;
    for (uint8_t v : values) {
        const uint64_t top = chk >> 55;
        chk = ((chk & 0x7fffffffffffff) << 5) ^ v;
        for (int i = 0; i < 5; ++i) {
            if ((top >> i) & 1) chk ^= GEN[i];
        }
    }
    return chk;
}

std::vector<uint8_t> hrp_expand(std::string_view hrp) {
    std::vector<uint8_t> out;
    out.reserve(hrp.size() * 2 + 1);
    for (char c : hrp) out.push_back(static_cast<uint8_t>(c) >> 5);
    out.push_back(0);
    for (char c : hrp) out.push_back(static_cast<uint8_t>(c) & 0x1f);
    return out;
}

uint64_t encoding_const(Bech32Encoding enc) {
    return enc == Bech32Encoding::BECH32M ? BLECH32M_CONST : BLECH32_CONST;
}

Bech32Encoding encoding_for(uint8_t witness_version) {
    return witness_version == 0 ? Bech32Encoding::BECH32
                                : Bech32Encoding::BECH32M;
}

struct Decoded {
    Bech32Encoding       encoding = Bech32Encoding::INVALID;
    std::string          hrp;
    std::vector<uint8_t> values;
};

Decoded blech32_decode(std::string_view str) {
    Decoded out;
    bool lower = false;
    bool upper = false;
    for (char c : str) {
        if (c < 33 || c > 126) return out;
        if (std::islower(static_cast<unsigned char>(c))) lower = true;
        if (std::isupper(static_cast<unsigned char>(c))) upper = true;
    }
    if ((lower && upper) || str.size() > MAX_ADDRESS_LEN) return out;

    const auto sep = str.rfind('1');
    if (sep == std::string_view::npos || sep == 0 ||
        sep + CHECKSUM_LEN + 1 > str.size()) {
        return out;
    }

    std::string hrp;
    for (char c : str.substr(0, sep)) {
        hrp.push_back(static_cast<char>(
            std::tolower(static_cast<unsigned char>(c))));
    }
    std::vector<uint8_t> values;
    for (char c : str.substr(sep + 1)) {
        const auto lc = static_cast<unsigned char>(
            std::tolower(static_cast<unsigned char>(c)));
        if (lc >= 128 || CHARSET_REV[lc] < 0) return out;
        values.push_back(static_cast<uint8_t>(CHARSET_REV[lc]));
    }

    auto exp = hrp_expand(hrp);
    exp.insert(exp.end(), values.begin(), values.end());
    const uint64_t check = polymod(exp);
    if (check == BLECH32_CONST) {
        out.encoding = Bech32Encoding::BECH32;
    } else if (check == BLECH32M_CONST) {
        out.encoding = Bech32Encoding::BECH32M;
    } else {
        return out;
    }
    values.resize(values.size() - CHECKSUM_LEN);
    out.hrp = std::move(hrp);
    out.values = std::move(values);
    return out;
}

}  // namespace

// ---------------------------------------------------------------------------
// blech32_encode
// ---------------------------------------------------------------------------
std::string blech32_encode(
    std::string_view hrp,
    std::span<const uint8_t> values,
    Bech32Encoding encoding)
{
    if (hrp.empty() || hrp.size() > 83 ||
        encoding == Bech32Encoding::INVALID) {
        return {};
    }
    for (char c : hrp) {
        if (c < 33 || c > 126) return {};
    }
    for (uint8_t v : values) {
        if (v > 31) return {};
    }

    std::string lower_hrp;
    for (char c : hrp) {
        lower_hrp.push_back(static_cast<char>(
            std::tolower(static_cast<unsigned char>(c))));
    }

    auto exp = hrp_expand(lower_hrp);
    exp.insert(exp.end(), values.begin(), values.end());
    exp.resize(exp.size() + CHECKSUM_LEN, 0);
    const uint64_t mod = polymod(exp) ^ encoding_const(encoding);

    std::string result = lower_hrp;
    result.push_back('1');
    for (uint8_t v : values) result.push_back(CHARSET[v]);
    for (size_t i = 0; i < CHECKSUM_LEN; ++i) {
        result.push_back(CHARSET[(mod >> (5 * (CHECKSUM_LEN - 1 - i))) & 0x1f]);
    }
    return result;
}

// ---------------------------------------------------------------------------
// Confidential segwit helpers
// ---------------------------------------------------------------------------
std::string encode_blech32_segwit(
    std::string_view hrp,
    uint8_t witness_version,
    std::span<const uint8_t> program)
{
    if (witness_version > 16 || program.size() < BLINDING_KEY_LEN + 2 ||
        program.size() > BLINDING_KEY_LEN + 40) {
        return {};
    }
    auto five = convert_bits(program, 8, 5, true);
    if (!five) return {};

    std::vector<uint8_t> values;
    values.reserve(1 + five->size());
    values.push_back(witness_version);
    values.insert(values.end(), five->begin(), five->end());

    return blech32_encode(hrp, values, encoding_for(witness_version));
}

std::optional<std::pair<uint8_t, std::vector<uint8_t>>>
decode_blech32_segwit(std::string_view hrp, std::string_view addr)
{
    auto dec = blech32_decode(addr);
    if (dec.encoding == Bech32Encoding::INVALID || dec.hrp != hrp ||
        dec.values.empty()) {
        return std::nullopt;
    }

    const uint8_t version = dec.values[0];
    if (version > 16 || dec.encoding != encoding_for(version)) {
        return std::nullopt;
    }

    auto program = convert_bits(
        std::span<const uint8_t>(dec.values).subspan(1), 5, 8, false);
    if (!program || program->size() < BLINDING_KEY_LEN + 2 ||
        program->size() > BLINDING_KEY_LEN + 40) {
        return std::nullopt;
    }
    const size_t witness_len = program->size() - BLINDING_KEY_LEN;
    if (version == 0 && witness_len != 20 && witness_len != 32) {
        return std::nullopt;
    }
    return std::pair{version, std::move(*program)};
}

}  // namespace core
