#pragma once
// Copyright (c) 2024-2026 The ELMS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "core/types.h"

#include <compare>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace miniscript {

struct KeyHash;

// ---------------------------------------------------------------------------
// PublicKey -- a secp256k1 key as it appears inside a script
// ---------------------------------------------------------------------------
// FULL keys are SEC1 encoded (33 bytes compressed, 65 bytes uncompressed)
// and belong to the Legacy, Segwitv0 and Bare contexts.  XONLY keys are the
// 32-byte BIP-340 form used by tapscript.  The kind is recorded per key so
// that a tree converted to the NoChecks context keeps its encoding.
// ---------------------------------------------------------------------------
class PublicKey {
public:
    enum class Kind : uint8_t { FULL, XONLY };

    PublicKey() = default;

    /// Validate and wrap a serialized key.  The length selects the kind:
    /// 33/65 bytes give FULL, 32 bytes give XONLY.
    static core::Result<PublicKey> from_bytes(std::span<const uint8_t> bytes);

    /// Parse the hex form used in descriptor strings.
    static core::Result<PublicKey> from_string(std::string_view hex);

    [[nodiscard]] Kind kind() const noexcept { return kind_; }
    [[nodiscard]] bool is_xonly() const noexcept { return kind_ == Kind::XONLY; }
    [[nodiscard]] bool is_uncompressed() const noexcept {
        return bytes_.size() == 65;
    }

    [[nodiscard]] const std::vector<uint8_t>& bytes() const noexcept {
        return bytes_;
    }
    [[nodiscard]] std::span<const uint8_t> span() const noexcept {
        return std::span<const uint8_t>(bytes_);
    }

    /// Bytes taken by the key push in a script, length prefix included.
    [[nodiscard]] size_t serialized_len() const noexcept {
        return bytes_.size() + 1;
    }

    [[nodiscard]] KeyHash hash160() const;

    [[nodiscard]] std::string to_string() const;

    auto operator<=>(const PublicKey&) const = default;
    bool operator==(const PublicKey&) const = default;

private:
    PublicKey(Kind kind, std::vector<uint8_t> bytes)
        : kind_(kind), bytes_(std::move(bytes)) {}

    Kind kind_ = Kind::FULL;
    std::vector<uint8_t> bytes_;
};

// ---------------------------------------------------------------------------
// KeyHash -- HASH160 of a key, tagged with the refinement it was taken over
// ---------------------------------------------------------------------------
struct KeyHash {
    core::uint160 hash;
    PublicKey::Kind kind = PublicKey::Kind::FULL;

    [[nodiscard]] std::string to_string() const { return hash.to_hex(); }

    auto operator<=>(const KeyHash&) const = default;
    bool operator==(const KeyHash&) const = default;
};

// ---------------------------------------------------------------------------
// KeyTranslator -- structure-preserving key substitution
// ---------------------------------------------------------------------------
// pk() maps keys held by pk_k, pk_h, multi and multi_a; pkh() maps the bare
// hashes of pk_h fragments recovered from a script.  The first failure is
// propagated by the caller.
class KeyTranslator {
public:
    virtual ~KeyTranslator() = default;

    virtual core::Result<PublicKey> pk(const PublicKey& key) const = 0;

    virtual core::Result<KeyHash> pkh(const KeyHash& hash) const {
        return hash;
    }
};

} // namespace miniscript
