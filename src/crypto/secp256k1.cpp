// Copyright (c) 2024-2026 The ELMS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "crypto/secp256k1.h"

#include <cstring>
#include <memory>

#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/obj_mac.h>

namespace crypto {

// ---------------------------------------------------------------------------
// RAII helpers for OpenSSL objects
// ---------------------------------------------------------------------------
namespace {

struct BN_Deleter  { void operator()(BIGNUM* p)   const { BN_free(p); } };
struct BN_CTX_Del  { void operator()(BN_CTX* p)   const { BN_CTX_free(p); } };
struct EC_GRP_Del  { void operator()(EC_GROUP* p) const { EC_GROUP_free(p); } };
struct EC_PT_Del   { void operator()(EC_POINT* p) const { EC_POINT_free(p); } };

using BN_ptr     = std::unique_ptr<BIGNUM, BN_Deleter>;
using BN_CTX_ptr = std::unique_ptr<BN_CTX, BN_CTX_Del>;
using EC_GRP_ptr = std::unique_ptr<EC_GROUP, EC_GRP_Del>;
using EC_PT_ptr  = std::unique_ptr<EC_POINT, EC_PT_Del>;

// n = FFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFEBAAEDCE6AF48A03BBFD25E8CD0364141
const uint8_t SECP256K1_ORDER_BYTES[] = {
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFE,
    0xBA, 0xAE, 0xDC, 0xE6, 0xAF, 0x48, 0xA0, 0x3B,
    0xBF, 0xD2, 0x5E, 0x8C, 0xD0, 0x36, 0x41, 0x41
};

// p = FFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFEFFFFFC2F
const uint8_t SECP256K1_P_BYTES[] = {
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
    0xFF, 0xFF, 0xFF, 0xFE, 0xFF, 0xFF, 0xFC, 0x2F
};

EC_GROUP* secp256k1_group() {
    static EC_GRP_ptr group{EC_GROUP_new_by_curve_name(NID_secp256k1)};
    return group.get();
}

const BIGNUM* secp256k1_order_bn() {
    static BN_ptr order{BN_bin2bn(SECP256K1_ORDER_BYTES,
                                  sizeof(SECP256K1_ORDER_BYTES), nullptr)};
    return order.get();
}

const BIGNUM* secp256k1_p_bn() {
    static BN_ptr p{BN_bin2bn(SECP256K1_P_BYTES,
                              sizeof(SECP256K1_P_BYTES), nullptr)};
    return p.get();
}

void bn_to_bytes32(const BIGNUM* bn, uint8_t out[32]) {
    std::memset(out, 0, 32);
    int nb = BN_num_bytes(bn);
    if (nb > 0 && nb <= 32) {
        BN_bn2bin(bn, out + (32 - nb));
    }
}

// BIP-340 lift_x: the point with x-coordinate @p x_bytes and even y.
// Returns nullptr if x >= p or x^3 + 7 has no square root.
EC_PT_ptr lift_x(EC_GROUP* grp, BN_CTX* ctx, const uint8_t x_bytes[32]) {
    BN_ptr x{BN_bin2bn(x_bytes, 32, nullptr)};
    const BIGNUM* p = secp256k1_p_bn();
    if (!x || !p || BN_cmp(x.get(), p) >= 0) return nullptr;

    BN_ptr x3{BN_new()};
    BN_ptr y_sq{BN_new()};
    BN_ptr seven{BN_new()};
    if (!x3 || !y_sq || !seven || !BN_set_word(seven.get(), 7)) {
        return nullptr;
    }

    // y^2 = x^3 + 7 mod p
    if (!BN_mod_sqr(x3.get(), x.get(), p, ctx) ||
        !BN_mod_mul(x3.get(), x3.get(), x.get(), p, ctx) ||
        !BN_mod_add(y_sq.get(), x3.get(), seven.get(), p, ctx)) {
        return nullptr;
    }

    BN_ptr y{BN_mod_sqrt(nullptr, y_sq.get(), p, ctx)};
    if (!y) return nullptr;

    // BN_mod_sqrt does not verify that the input is a residue.
    BN_ptr check{BN_new()};
    if (!check || !BN_mod_sqr(check.get(), y.get(), p, ctx) ||
        BN_cmp(check.get(), y_sq.get()) != 0) {
        return nullptr;
    }

    if (BN_is_odd(y.get()) && !BN_sub(y.get(), p, y.get())) {
        return nullptr;
    }

    EC_PT_ptr pt{EC_POINT_new(grp)};
    if (!pt || !EC_POINT_set_affine_coordinates(grp, pt.get(), x.get(),
                                                y.get(), ctx)) {
        return nullptr;
    }
    return pt;
}

// DER INTEGER body: non-empty, non-negative, minimally encoded.
bool der_integer_ok(std::span<const uint8_t> v) {
    if (v.empty()) return false;
    if (v[0] & 0x80) return false;                      // negative
    if (v.size() > 1 && v[0] == 0x00 && !(v[1] & 0x80)) {
        return false;                                   // excess padding
    }
    return true;
}

}  // namespace

// ---------------------------------------------------------------------------
// Key validation
// ---------------------------------------------------------------------------

bool is_valid_pubkey(std::span<const uint8_t> pubkey) {
    if (pubkey.size() == 33) {
        if (pubkey[0] != 0x02 && pubkey[0] != 0x03) return false;
    } else if (pubkey.size() == 65) {
        if (pubkey[0] != 0x04) return false;
    } else {
        return false;
    }

    EC_GROUP* grp = secp256k1_group();
    BN_CTX_ptr ctx{BN_CTX_new()};
    EC_PT_ptr pt{EC_POINT_new(grp)};
    if (!grp || !ctx || !pt) return false;
    if (!EC_POINT_oct2point(grp, pt.get(), pubkey.data(), pubkey.size(),
                            ctx.get())) {
        return false;
    }
    return EC_POINT_is_on_curve(grp, pt.get(), ctx.get()) == 1;
}

bool is_valid_xonly(std::span<const uint8_t> xonly) {
    if (xonly.size() != 32) return false;
    EC_GROUP* grp = secp256k1_group();
    BN_CTX_ptr ctx{BN_CTX_new()};
    if (!grp || !ctx) return false;
    return lift_x(grp, ctx.get(), xonly.data()) != nullptr;
}

// ---------------------------------------------------------------------------
// Taproot tweak
// ---------------------------------------------------------------------------

core::Result<TweakedKey> xonly_tweak_add(
    std::span<const uint8_t, 32> internal,
    std::span<const uint8_t, 32> tweak) {
    EC_GROUP* grp = secp256k1_group();
    BN_CTX_ptr ctx{BN_CTX_new()};
    if (!grp || !ctx) {
        return core::make_error(core::ErrorCode::CRYPTO_ERROR,
                                "secp256k1 context unavailable");
    }

    EC_PT_ptr P = lift_x(grp, ctx.get(), internal.data());
    if (!P) {
        return core::make_error(core::ErrorCode::CRYPTO_KEY_FAIL,
                                "internal key is not a valid x-only key");
    }

    BN_ptr t{BN_bin2bn(tweak.data(), 32, nullptr)};
    if (!t || BN_cmp(t.get(), secp256k1_order_bn()) >= 0) {
        return core::make_error(core::ErrorCode::CRYPTO_KEY_FAIL,
                                "tweak exceeds curve order");
    }

    // Q = P + t*G
    EC_PT_ptr Q{EC_POINT_new(grp)};
    if (!Q || !EC_POINT_mul(grp, Q.get(), t.get(), P.get(),
                            BN_value_one(), ctx.get())) {
        return core::make_error(core::ErrorCode::CRYPTO_ERROR,
                                "EC_POINT_mul failed");
    }
    if (EC_POINT_is_at_infinity(grp, Q.get())) {
        return core::make_error(core::ErrorCode::CRYPTO_KEY_FAIL,
                                "tweaked key is the point at infinity");
    }

    BN_ptr x{BN_new()};
    BN_ptr y{BN_new()};
    if (!x || !y || !EC_POINT_get_affine_coordinates(grp, Q.get(), x.get(),
                                                     y.get(), ctx.get())) {
        return core::make_error(core::ErrorCode::CRYPTO_ERROR,
                                "cannot read tweaked key coordinates");
    }

    TweakedKey out;
    bn_to_bytes32(x.get(), out.xonly.data());
    out.odd_y = BN_is_odd(y.get()) != 0;
    return out;
}

// ---------------------------------------------------------------------------
// DER signature shape
// ---------------------------------------------------------------------------
// 0x30 [total-len] 0x02 [R-len] [R] 0x02 [S-len] [S]
// ---------------------------------------------------------------------------

bool is_valid_der_signature(std::span<const uint8_t> sig) {
    if (sig.size() < 8 || sig.size() > 72) return false;
    if (sig[0] != 0x30) return false;
    if (sig[1] != sig.size() - 2) return false;

    const size_t len_r = sig[3];
    if (sig[2] != 0x02 || 5 + len_r >= sig.size()) return false;
    const size_t len_s = sig[5 + len_r];
    if (len_r + len_s + 6 != sig.size()) return false;
    if (sig[4 + len_r] != 0x02) return false;

    return der_integer_ok(sig.subspan(4, len_r)) &&
           der_integer_ok(sig.subspan(6 + len_r, len_s));
}

}  // namespace crypto
