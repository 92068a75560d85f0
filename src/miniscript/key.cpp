// Copyright (c) 2024-2026 The ELMS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "miniscript/key.h"
#include "core/hex.h"
#include "crypto/hash.h"
#include "crypto/secp256k1.h"

namespace miniscript {

core::Result<PublicKey> PublicKey::from_bytes(std::span<const uint8_t> bytes) {
    std::vector<uint8_t> raw(bytes.begin(), bytes.end());
    switch (bytes.size()) {
    case 33:
    case 65:
        if (!crypto::is_valid_pubkey(bytes)) {
            return core::make_error(core::ErrorCode::BAD_KEY,
                                    "not a valid SEC1 public key: " +
                                        core::to_hex(bytes));
        }
        return PublicKey(Kind::FULL, std::move(raw));
    case 32:
        if (!crypto::is_valid_xonly(bytes)) {
            return core::make_error(core::ErrorCode::BAD_KEY,
                                    "not a valid x-only public key: " +
                                        core::to_hex(bytes));
        }
        return PublicKey(Kind::XONLY, std::move(raw));
    default:
        return core::make_error(
            core::ErrorCode::BAD_KEY,
            "invalid public key length " + std::to_string(bytes.size()));
    }
}

core::Result<PublicKey> PublicKey::from_string(std::string_view hex) {
    auto raw = core::from_hex(hex);
    if (!raw) {
        return core::make_error(core::ErrorCode::BAD_KEY,
                                "public key is not hex: " + std::string(hex));
    }
    return from_bytes(*raw);
}

KeyHash PublicKey::hash160() const {
    return KeyHash{crypto::hash160(span()), kind_};
}

std::string PublicKey::to_string() const {
    return core::to_hex(span());
}

} // namespace miniscript
