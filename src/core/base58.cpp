// Copyright (c) 2024-2026 The ELMS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/base58.h"

#include <algorithm>
#include <array>
#include <cstring>
#include <memory>
#include <stdexcept>

#include <openssl/evp.h>

namespace core {

// ---------------------------------------------------------------------------
// Internal helpers
// ---------------------------------------------------------------------------
namespace {

// Reverse lookup: ASCII value -> Base58 digit index (0-57), or -1 if invalid.
constexpr std::array<int8_t, 256> make_base58_map() {
    std::array<int8_t, 256> table{};
    for (auto& v : table) v = -1;
    for (int i = 0; i < 58; ++i) {
        table[static_cast<uint8_t>(BASE58_ALPHABET[i])] =
            static_cast<int8_t>(i);
    }
    return table;
}

constexpr auto BASE58_MAP = make_base58_map();

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

void sha256_into(const uint8_t* data, size_t len, uint8_t* out) {
    std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
    unsigned int out_len = 0;
    if (!ctx ||
        EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data, len) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), out, &out_len) != 1) {
        throw std::runtime_error("base58: SHA-256 computation failed");
    }
}

// First four bytes of SHA256(SHA256(data)).
std::array<uint8_t, 4> compute_checksum(std::span<const uint8_t> data) {
    std::array<uint8_t, 32> first{};
    std::array<uint8_t, 32> second{};
    sha256_into(data.data(), data.size(), first.data());
    sha256_into(first.data(), first.size(), second.data());
    std::array<uint8_t, 4> out{};
    std::copy_n(second.begin(), 4, out.begin());
    return out;
}

}  // namespace

// ---------------------------------------------------------------------------
// base58_encode
// ---------------------------------------------------------------------------
// Treat the input as a big-endian integer and repeatedly divide by 58.
// ---------------------------------------------------------------------------
std::string base58_encode(std::span<const uint8_t> data) {
    size_t zeros = 0;
    while (zeros < data.size() && data[zeros] == 0) ++zeros;

    // log(256) / log(58) ~ 1.366
    std::vector<uint8_t> digits(data.size() * 138 / 100 + 1, 0);
    for (size_t i = zeros; i < data.size(); ++i) {
        int carry = data[i];
        for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
            carry += 256 * static_cast<int>(*it);
            *it = static_cast<uint8_t>(carry % 58);
            carry /= 58;
        }
    }

    auto it = std::find_if(digits.begin(), digits.end(),
                           [](uint8_t d) { return d != 0; });
    std::string result(zeros, '1');
    for (; it != digits.end(); ++it) {
        result.push_back(BASE58_ALPHABET[*it]);
    }
    return result;
}

// ---------------------------------------------------------------------------
// base58_decode
// ---------------------------------------------------------------------------
std::optional<std::vector<uint8_t>> base58_decode(std::string_view str) {
    size_t ones = 0;
    while (ones < str.size() && str[ones] == '1') ++ones;

    // log(58) / log(256) ~ 0.733
    std::vector<uint8_t> bytes(str.size() * 733 / 1000 + 1, 0);
    for (size_t i = ones; i < str.size(); ++i) {
        int carry = BASE58_MAP[static_cast<uint8_t>(str[i])];
        if (carry < 0) return std::nullopt;
        for (auto it = bytes.rbegin(); it != bytes.rend(); ++it) {
            carry += 58 * static_cast<int>(*it);
            *it = static_cast<uint8_t>(carry % 256);
            carry /= 256;
        }
        if (carry != 0) return std::nullopt;
    }

    auto it = std::find_if(bytes.begin(), bytes.end(),
                           [](uint8_t b) { return b != 0; });
    std::vector<uint8_t> result(ones, 0x00);
    result.insert(result.end(), it, bytes.end());
    return result;
}

// ---------------------------------------------------------------------------
// Base58Check
// ---------------------------------------------------------------------------

std::string base58check_encode(std::span<const uint8_t> data) {
    std::vector<uint8_t> buf(data.begin(), data.end());
    auto checksum = compute_checksum(data);
    buf.insert(buf.end(), checksum.begin(), checksum.end());
    return base58_encode(buf);
}

std::optional<std::vector<uint8_t>> base58check_decode(
    std::string_view str)
{
    auto decoded = base58_decode(str);
    if (!decoded || decoded->size() < 4) {
        return std::nullopt;
    }

    const size_t payload_len = decoded->size() - 4;
    std::span<const uint8_t> payload(decoded->data(), payload_len);
    auto expected = compute_checksum(payload);
    if (std::memcmp(decoded->data() + payload_len, expected.data(), 4) != 0) {
        return std::nullopt;
    }
    decoded->resize(payload_len);
    return decoded;
}

std::string encode_with_version(
    uint8_t version,
    std::span<const uint8_t> payload)
{
    std::vector<uint8_t> versioned;
    versioned.reserve(1 + payload.size());
    versioned.push_back(version);
    versioned.insert(versioned.end(), payload.begin(), payload.end());
    return base58check_encode(versioned);
}

std::optional<std::pair<uint8_t, std::vector<uint8_t>>>
decode_with_version(std::string_view str)
{
    auto decoded = base58check_decode(str);
    if (!decoded || decoded->empty()) {
        return std::nullopt;
    }
    uint8_t version = decoded->front();
    std::vector<uint8_t> payload(decoded->begin() + 1, decoded->end());
    return std::pair{version, std::move(payload)};
}

}  // namespace core
