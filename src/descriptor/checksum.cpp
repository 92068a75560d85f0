// Copyright (c) 2024-2026 The ELMS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "descriptor/checksum.h"

#include <cstdint>

namespace descriptor {

namespace {

// Characters are grouped so that the most common ones (hex digits, key
// path punctuation) differ only in the low 5 bits.
constexpr std::string_view INPUT_CHARSET =
    "0123456789()[],'/*abcdefgh@:$%{}"
    "IJKLMNOPQRSTUVWXYZ&+-.;<=>?!^_|~"
    "ijklmnopqrstuvwxyzABCDEFGH`#\"\\ ";

constexpr std::string_view CHECKSUM_CHARSET = "qpzry9x8gf2tvdw0s3jn54khce6mua7l";

uint64_t poly_mod(uint64_t c, uint64_t val) {
    const uint64_t c0 = c >> 35;
    c = ((c & 0x7ffffffffULL) << 5) ^ val;
    if (c0 & 1) c ^= 0xf5dee51989ULL;
    if (c0 & 2) c ^= 0xa9fdca3312ULL;
    if (c0 & 4) c ^= 0x1bab10e32dULL;
    if (c0 & 8) c ^= 0x3706b1677aULL;
    if (c0 & 16) c ^= 0x644d626ffdULL;
    return c;
}

} // anonymous namespace

core::Result<std::string> desc_checksum(std::string_view desc) {
    uint64_t c = 1;
    uint64_t cls = 0;
    int cls_count = 0;
    for (char ch : desc) {
        const size_t pos = INPUT_CHARSET.find(ch);
        if (pos == std::string_view::npos) {
            return core::make_error(core::ErrorCode::BAD_CHECKSUM,
                                    std::string("invalid character '") + ch +
                                        "' in descriptor");
        }
        c = poly_mod(c, pos & 31);
        cls = cls * 3 + (pos >> 5);
        if (++cls_count == 3) {
            c = poly_mod(c, cls);
            cls = 0;
            cls_count = 0;
        }
    }
    if (cls_count > 0) c = poly_mod(c, cls);
    for (size_t j = 0; j < CHECKSUM_LENGTH; ++j) c = poly_mod(c, 0);
    c ^= 1;

    std::string out(CHECKSUM_LENGTH, ' ');
    for (size_t j = 0; j < CHECKSUM_LENGTH; ++j) {
        out[j] = CHECKSUM_CHARSET[(c >> (5 * (7 - j))) & 31];
    }
    return out;
}

core::Result<std::string> with_checksum(std::string_view desc) {
    ELMS_TRY_ASSIGN(sum, desc_checksum(desc));
    return std::string(desc) + "#" + sum;
}

core::Result<std::string_view> verify_checksum(std::string_view s) {
    const size_t hash = s.find('#');
    if (hash == std::string_view::npos) {
        return core::make_error(core::ErrorCode::BAD_CHECKSUM,
                                "missing descriptor checksum");
    }
    if (s.find('#', hash + 1) != std::string_view::npos) {
        return core::make_error(core::ErrorCode::BAD_CHECKSUM,
                                "multiple '#' in descriptor");
    }
    const std::string_view desc = s.substr(0, hash);
    const std::string_view given = s.substr(hash + 1);
    ELMS_TRY_ASSIGN(expected, desc_checksum(desc));
    if (given != expected) {
        return core::make_error(core::ErrorCode::BAD_CHECKSUM,
                                "invalid checksum '" + std::string(given) +
                                    "', expected '" + expected + "'");
    }
    return desc;
}

} // namespace descriptor
