#pragma once
// Copyright (c) 2024-2026 The ELMS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// SHA-256 / RIPEMD-160 wrappers around the OpenSSL 3.0+ EVP API.
//
// Provides:
//   - sha256(), sha256d(), ripemd160(), hash160()  -- one-shot digests
//   - Sha256Hasher  -- incremental SHA-256 (move-only, owns an EVP ctx)
//   - HashWriter    -- stream adapter for the ser_write_* helpers
//   - tagged_hash() -- BIP-340 style domain-separated hashing
// ---------------------------------------------------------------------------

#include "core/types.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

// Forward-declare the OpenSSL context type so callers do not need the
// OpenSSL headers just to include this header.
struct evp_md_ctx_st;       // EVP_MD_CTX
typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace crypto {

// ===================================================================
// One-shot hash functions
// ===================================================================

[[nodiscard]] core::uint256 sha256(std::span<const uint8_t> data);

/// SHA256(SHA256(data)). Used for hash256 fragments, Base58Check, and
/// the covenant hashOutputs item.
[[nodiscard]] core::uint256 sha256d(std::span<const uint8_t> data);

[[nodiscard]] core::uint160 ripemd160(std::span<const uint8_t> data);

/// RIPEMD160(SHA256(data)). Key hashes and script hashes.
[[nodiscard]] core::uint160 hash160(std::span<const uint8_t> data);

// ===================================================================
// Incremental hasher (streaming interface)
// ===================================================================

/// Move-only incremental SHA-256 hasher backed by an OpenSSL
/// EVP_MD_CTX.  Feed data with write(), obtain the digest with
/// finalize().  Call reset() to reuse the object for another hash.
class Sha256Hasher {
public:
    Sha256Hasher();
    ~Sha256Hasher();

    Sha256Hasher(const Sha256Hasher&) = delete;
    Sha256Hasher& operator=(const Sha256Hasher&) = delete;

    Sha256Hasher(Sha256Hasher&& other) noexcept;
    Sha256Hasher& operator=(Sha256Hasher&& other) noexcept;

    Sha256Hasher& write(std::span<const uint8_t> data);

    /// Produce the digest.  The context is consumed; call reset()
    /// before hashing again.
    [[nodiscard]] core::uint256 finalize();

    void reset();

private:
    EVP_MD_CTX* ctx_ = nullptr;
    bool finalized_ = false;
};

// ===================================================================
// HashWriter -- stream adapter for incremental hashing
// ===================================================================

/// Satisfies the write side of the stream interface so that the
/// serialization helpers can feed a digest directly.
class HashWriter {
public:
    HashWriter() = default;

    void write(std::span<const uint8_t> data) {
        buf_.insert(buf_.end(), data.begin(), data.end());
    }

    /// Single SHA-256 of everything written so far.
    [[nodiscard]] core::uint256 hash() const {
        return sha256(std::span<const uint8_t>(buf_));
    }

    /// Double SHA-256 of everything written so far.
    [[nodiscard]] core::uint256 hash_double() const {
        return sha256d(std::span<const uint8_t>(buf_));
    }

    [[nodiscard]] size_t size() const noexcept { return buf_.size(); }

    void clear() { buf_.clear(); }

private:
    std::vector<uint8_t> buf_;
};

// ===================================================================
// Tagged hash
// ===================================================================

/// SHA256( SHA256(tag) || SHA256(tag) || msg )
///
/// Elements taproot uses the tags "TapLeaf/elements",
/// "TapBranch/elements" and "TapTweak/elements".
[[nodiscard]] core::uint256 tagged_hash(
    std::string_view tag,
    std::span<const uint8_t> msg);

}  // namespace crypto
