// Copyright (c) 2024-2026 The ELMS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "crypto/hash.h"

#include <stdexcept>
#include <string>

#include <openssl/evp.h>

namespace crypto {

// ===================================================================
// Internal helpers
// ===================================================================

namespace {

/// Run a single EVP digest of @p md over @p data into @p out.
/// @p out must hold EVP_MD_get_size(md) bytes.
void raw_digest(const EVP_MD* md, const char* name,
                std::span<const uint8_t> data, uint8_t* out) {
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        throw std::runtime_error(
            std::string(name) + ": EVP_MD_CTX_new() allocation failed");
    }

    bool ok = EVP_DigestInit_ex(ctx, md, nullptr) == 1;
    if (ok && !data.empty()) {
        ok = EVP_DigestUpdate(ctx, data.data(), data.size()) == 1;
    }
    unsigned int digest_len = 0;
    if (ok) {
        ok = EVP_DigestFinal_ex(ctx, out, &digest_len) == 1;
    }
    EVP_MD_CTX_free(ctx);

    if (!ok) {
        throw std::runtime_error(std::string(name) + ": digest failed");
    }
}

core::uint256 make_uint256(const uint8_t (&buf)[32]) {
    return core::uint256::from_bytes(std::span<const uint8_t, 32>(buf, 32));
}

core::uint160 make_uint160(const uint8_t (&buf)[20]) {
    return core::uint160::from_bytes(std::span<const uint8_t, 20>(buf, 20));
}

}  // namespace

// ===================================================================
// One-shot functions
// ===================================================================

core::uint256 sha256(std::span<const uint8_t> data) {
    uint8_t buf[32];
    raw_digest(EVP_sha256(), "sha256", data, buf);
    return make_uint256(buf);
}

core::uint256 sha256d(std::span<const uint8_t> data) {
    uint8_t first[32];
    raw_digest(EVP_sha256(), "sha256d", data, first);
    uint8_t second[32];
    raw_digest(EVP_sha256(), "sha256d",
               std::span<const uint8_t>(first, 32), second);
    return make_uint256(second);
}

core::uint160 ripemd160(std::span<const uint8_t> data) {
    uint8_t buf[20];
    raw_digest(EVP_ripemd160(), "ripemd160", data, buf);
    return make_uint160(buf);
}

core::uint160 hash160(std::span<const uint8_t> data) {
    uint8_t first[32];
    raw_digest(EVP_sha256(), "hash160", data, first);
    uint8_t second[20];
    raw_digest(EVP_ripemd160(), "hash160",
               std::span<const uint8_t>(first, 32), second);
    return make_uint160(second);
}

// ===================================================================
// Sha256Hasher -- incremental interface
// ===================================================================

Sha256Hasher::Sha256Hasher() {
    reset();
}

Sha256Hasher::~Sha256Hasher() {
    if (ctx_) {
        EVP_MD_CTX_free(ctx_);
    }
}

Sha256Hasher::Sha256Hasher(Sha256Hasher&& other) noexcept
    : ctx_(other.ctx_), finalized_(other.finalized_) {
    other.ctx_ = nullptr;
    other.finalized_ = true;
}

Sha256Hasher& Sha256Hasher::operator=(Sha256Hasher&& other) noexcept {
    if (this != &other) {
        if (ctx_) {
            EVP_MD_CTX_free(ctx_);
        }
        ctx_ = other.ctx_;
        finalized_ = other.finalized_;
        other.ctx_ = nullptr;
        other.finalized_ = true;
    }
    return *this;
}

Sha256Hasher& Sha256Hasher::write(std::span<const uint8_t> data) {
    if (!ctx_ || finalized_) {
        throw std::runtime_error(
            "Sha256Hasher::write(): context not initialised "
            "or already finalised");
    }
    if (!data.empty() &&
        EVP_DigestUpdate(ctx_, data.data(), data.size()) != 1) {
        throw std::runtime_error(
            "Sha256Hasher::write(): EVP_DigestUpdate() failed");
    }
    return *this;
}

core::uint256 Sha256Hasher::finalize() {
    if (!ctx_ || finalized_) {
        throw std::runtime_error(
            "Sha256Hasher::finalize(): context not initialised "
            "or already finalised");
    }
    uint8_t buf[32];
    unsigned int digest_len = 0;
    if (EVP_DigestFinal_ex(ctx_, buf, &digest_len) != 1 || digest_len != 32) {
        throw std::runtime_error(
            "Sha256Hasher::finalize(): EVP_DigestFinal_ex() failed");
    }
    finalized_ = true;
    return make_uint256(buf);
}

void Sha256Hasher::reset() {
    if (!ctx_) {
        ctx_ = EVP_MD_CTX_new();
        if (!ctx_) {
            throw std::runtime_error(
                "Sha256Hasher: EVP_MD_CTX_new() allocation failed");
        }
    }
    if (EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error(
            "Sha256Hasher: EVP_DigestInit_ex() failed");
    }
    finalized_ = false;
}

// ===================================================================
// Tagged hash
// ===================================================================

core::uint256 tagged_hash(
    std::string_view tag,
    std::span<const uint8_t> msg) {
    core::uint256 tag_hash = sha256(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(tag.data()), tag.size()));

    Sha256Hasher hasher;
    hasher.write(tag_hash.span());
    hasher.write(tag_hash.span());
    hasher.write(msg);
    return hasher.finalize();
}

}  // namespace crypto
