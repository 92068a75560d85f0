// Copyright (c) 2024-2026 The ELMS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/bech32.h"

#include <array>
#include <cctype>

namespace core {

// ---------------------------------------------------------------------------
// Constants
// ---------------------------------------------------------------------------
namespace {

constexpr char BECH32_CHARSET[] = "qpzry9x8gf2tvdw0s3jn54khce6mua7l";

constexpr std::array<int8_t, 128> make_charset_rev() {
    std::array<int8_t, 128> table{};
    for (auto& v : table) v = -1;
    for (int i = 0; i < 32; ++i) {
        table[static_cast<uint8_t>(BECH32_CHARSET[i])] =
            static_cast<int8_t>(i);
    }
    return table;
}

constexpr auto CHARSET_REV = make_charset_rev();

constexpr uint32_t BECH32_CONST  = 1;
constexpr uint32_t BECH32M_CONST = 0x2bc830a3;

// GF(2^5) BCH checksum from BIP173.
uint32_t polymod(const std::vector<uint8_t>& values) {
    static constexpr uint32_t GEN[5] = {
        0x3b6a57b2, 0x26508e6d, 0x1ea119fa, 0x3d4233dd, 0x2a1462b3};
    uint32_t chk = 1;
    for (uint8_t v : values) {
        const uint32_t top = chk >> 25;
        chk = ((chk & 0x1ffffff) << 5) ^ v;
        for (int i = 0; i < 5; ++i) {
            if ((top >> i) & 1) chk ^= GEN[i];
        }
    }
    return chk;
}

// [high bits of each char] ++ [0] ++ [low 5 bits of each char]
std::vector<uint8_t> hrp_expand(std::string_view hrp) {
    std::vector<uint8_t> out;
    out.reserve(hrp.size() * 2 + 1);
    for (char c : hrp) out.push_back(static_cast<uint8_t>(c) >> 5);
    out.push_back(0);
    for (char c : hrp) out.push_back(static_cast<uint8_t>(c) & 0x1f);
    return out;
}

uint32_t encoding_const(Bech32Encoding enc) {
    return enc == Bech32Encoding::BECH32M ? BECH32M_CONST : BECH32_CONST;
}

struct Decoded {
    Bech32Encoding       encoding = Bech32Encoding::INVALID;
    std::string          hrp;
    std::vector<uint8_t> values;
};

Decoded bech32_decode(std::string_view str) {
    Decoded out;
    bool lower = false;
    bool upper = false;
    for (char c : str) {
        if (c < 33 || c > 126) return out;
        if (std::islower(static_cast<unsigned char>(c))) lower = true;
        if (std::isupper(static_cast<unsigned char>(c))) upper = true;
    }
    if ((lower && upper) || str.size() > 90) return out;

    const auto sep = str.rfind('1');
    if (sep == std::string_view::npos || sep == 0 || sep + 7 > str.size()) {
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
    const uint32_t check = polymod(exp);
    if (check == BECH32_CONST) {
        out.encoding = Bech32Encoding::BECH32;
    } else if (check == BECH32M_CONST) {
        out.encoding = Bech32Encoding::BECH32M;
    } else {
        return out;
    }
    values.resize(values.size() - 6);
    out.hrp = std::move(hrp);
    out.values = std::move(values);
    return out;
}

}  // namespace

// ---------------------------------------------------------------------------
// bech32_encode
// ---------------------------------------------------------------------------
std::string bech32_encode(
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
    exp.resize(exp.size() + 6, 0);
    const uint32_t mod = polymod(exp) ^ encoding_const(encoding);

    std::string result = lower_hrp;
    result.push_back('1');
    for (uint8_t v : values) result.push_back(BECH32_CHARSET[v]);
    for (int i = 0; i < 6; ++i) {
        result.push_back(BECH32_CHARSET[(mod >> (5 * (5 - i))) & 0x1f]);
    }
    return result;
}

// ---------------------------------------------------------------------------
// convert_bits
// ---------------------------------------------------------------------------
std::optional<std::vector<uint8_t>> convert_bits(
    std::span<const uint8_t> data,
    int from_bits,
    int to_bits,
    bool pad)
{
    uint32_t acc = 0;
    int bits = 0;
    const uint32_t maxv = (1u << to_bits) - 1;
    std::vector<uint8_t> out;
    for (uint8_t value : data) {
        if ((value >> from_bits) != 0) return std::nullopt;
        acc = (acc << from_bits) | value;
        bits += from_bits;
        while (bits >= to_bits) {
            bits -= to_bits;
            out.push_back(static_cast<uint8_t>((acc >> bits) & maxv));
        }
    }
    if (pad) {
        if (bits > 0) {
            out.push_back(
                static_cast<uint8_t>((acc << (to_bits - bits)) & maxv));
        }
    } else if (bits >= from_bits || ((acc << (to_bits - bits)) & maxv) != 0) {
        return std::nullopt;
    }
    return out;
}

// ---------------------------------------------------------------------------
// Segwit helpers
// ---------------------------------------------------------------------------
std::string encode_segwit(
    std::string_view hrp,
    uint8_t witness_version,
    std::span<const uint8_t> program)
{
    if (witness_version > 16 || program.size() < 2 || program.size() > 40) {
        return {};
    }
    auto five = convert_bits(program, 8, 5, true);
    if (!five) return {};

    std::vector<uint8_t> values;
    values.reserve(1 + five->size());
    values.push_back(witness_version);
    values.insert(values.end(), five->begin(), five->end());

    return bech32_encode(hrp, values,
                         witness_version == 0 ? Bech32Encoding::BECH32
                                              : Bech32Encoding::BECH32M);
}

std::optional<std::pair<uint8_t, std::vector<uint8_t>>>
decode_segwit(std::string_view hrp, std::string_view addr)
{
    auto dec = bech32_decode(addr);
    if (dec.encoding == Bech32Encoding::INVALID || dec.hrp != hrp ||
        dec.values.empty()) {
        return std::nullopt;
    }

    const uint8_t version = dec.values[0];
    if (version > 16) return std::nullopt;
    const auto expected = version == 0 ? Bech32Encoding::BECH32
                                       : Bech32Encoding::BECH32M;
    if (dec.encoding != expected) return std::nullopt;

    auto program = convert_bits(
        std::span<const uint8_t>(dec.values).subspan(1), 5, 8, false);
    if (!program || program->size() < 2 || program->size() > 40) {
        return std::nullopt;
    }
    if (version == 0 && program->size() != 20 && program->size() != 32) {
        return std::nullopt;
    }
    return std::pair{version, std::move(*program)};
}

}  // namespace core
