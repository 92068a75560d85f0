// Copyright (c) 2024-2026 The ELMS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "primitives/script/script.h"
#include "core/hex.h"
#include "crypto/hash.h"

#include <cstring>
#include <limits>

namespace primitives::script {

// ===================================================================
// Internal helpers
// ===================================================================

namespace {

/// Write a push-data prefix + payload into a byte vector using the
/// shortest valid encoding (consensus MINIMALDATA rules).
void append_push_data(std::vector<uint8_t>& out,
                      std::span<const uint8_t> payload) {
    auto len = payload.size();

    if (len == 0) {
        out.push_back(static_cast<uint8_t>(Opcode::OP_0));
        return;
    }
    if (len == 1 && payload[0] >= 1 && payload[0] <= 16) {
        out.push_back(static_cast<uint8_t>(encode_small_int(payload[0])));
        return;
    }
    if (len == 1 && payload[0] == 0x81) {
        out.push_back(static_cast<uint8_t>(Opcode::OP_1NEGATE));
        return;
    }

    if (len <= 75) {
        // OP_PUSHBYTES_N: the length byte IS the opcode.
        out.push_back(static_cast<uint8_t>(len));
    } else if (len <= 0xFF) {
        out.push_back(static_cast<uint8_t>(Opcode::OP_PUSHDATA1));
        out.push_back(static_cast<uint8_t>(len));
    } else if (len <= 0xFFFF) {
        out.push_back(static_cast<uint8_t>(Opcode::OP_PUSHDATA2));
        out.push_back(static_cast<uint8_t>(len & 0xFF));
        out.push_back(static_cast<uint8_t>((len >> 8) & 0xFF));
    } else {
        out.push_back(static_cast<uint8_t>(Opcode::OP_PUSHDATA4));
        for (int i = 0; i < 4; ++i) {
            out.push_back(static_cast<uint8_t>((len >> (8 * i)) & 0xFF));
        }
    }
    out.insert(out.end(), payload.begin(), payload.end());
}

/// Encode a signed 64-bit integer as a CScriptNum byte sequence:
/// little-endian magnitude with the sign in the top bit of the last byte.
std::vector<uint8_t> encode_script_num(int64_t n) {
    if (n == 0) {
        return {};
    }

    std::vector<uint8_t> result;
    const bool negative = n < 0;
    uint64_t abs_val = negative
        ? (n == std::numeric_limits<int64_t>::min()
            ? static_cast<uint64_t>(std::numeric_limits<int64_t>::max()) + 1
            : static_cast<uint64_t>(-n))
        : static_cast<uint64_t>(n);

    while (abs_val > 0) {
        result.push_back(static_cast<uint8_t>(abs_val & 0xFF));
        abs_val >>= 8;
    }

    if (result.back() & 0x80) {
        result.push_back(negative ? 0x80 : 0x00);
    } else if (negative) {
        result.back() |= 0x80;
    }
    return result;
}

Script witness_v0(std::span<const uint8_t> program) {
    std::vector<uint8_t> out;
    out.reserve(2 + program.size());
    out.push_back(static_cast<uint8_t>(Opcode::OP_0));
    append_push_data(out, program);
    return Script(std::move(out));
}

} // anonymous namespace

// ===================================================================
// Standard script template constructors
// ===================================================================

Script Script::p2pk(std::span<const uint8_t> pubkey) {
    Script s;
    s.push_data(pubkey).push_opcode(Opcode::OP_CHECKSIG);
    return s;
}

Script Script::p2pkh(const core::uint160& pubkey_hash) {
    Script s;
    s.push_opcode(Opcode::OP_DUP)
     .push_opcode(Opcode::OP_HASH160)
     .push_data(pubkey_hash.span())
     .push_opcode(Opcode::OP_EQUALVERIFY)
     .push_opcode(Opcode::OP_CHECKSIG);
    return s;
}

Script Script::p2sh(const core::uint160& script_hash) {
    Script s;
    s.push_opcode(Opcode::OP_HASH160)
     .push_data(script_hash.span())
     .push_opcode(Opcode::OP_EQUAL);
    return s;
}

Script Script::p2wpkh(const core::uint160& pubkey_hash) {
    return witness_v0(pubkey_hash.span());
}

Script Script::p2wsh(const core::uint256& script_hash) {
    return witness_v0(script_hash.span());
}

Script Script::p2tr(const core::uint256& output_key) {
    Script s;
    s.push_opcode(Opcode::OP_1).push_data(output_key.span());
    return s;
}

// ===================================================================
// Script type detection
// ===================================================================

bool Script::is_p2pk() const {
    // 35 bytes: 0x21 <33 bytes> OP_CHECKSIG
    // 67 bytes: 0x41 <65 bytes> OP_CHECKSIG
    const auto checksig = static_cast<uint8_t>(Opcode::OP_CHECKSIG);
    if (data_.size() == 35) {
        return data_[0] == 33 && data_[34] == checksig;
    }
    if (data_.size() == 67) {
        return data_[0] == 65 && data_[66] == checksig;
    }
    return false;
}

bool Script::is_p2pkh() const {
    // 25 bytes: OP_DUP OP_HASH160 0x14 <20 bytes> OP_EQUALVERIFY OP_CHECKSIG
    return data_.size() == 25
        && data_[0]  == static_cast<uint8_t>(Opcode::OP_DUP)
        && data_[1]  == static_cast<uint8_t>(Opcode::OP_HASH160)
        && data_[2]  == 20
        && data_[23] == static_cast<uint8_t>(Opcode::OP_EQUALVERIFY)
        && data_[24] == static_cast<uint8_t>(Opcode::OP_CHECKSIG);
}

bool Script::is_p2sh() const {
    // 23 bytes: OP_HASH160 0x14 <20 bytes> OP_EQUAL
    return data_.size() == 23
        && data_[0]  == static_cast<uint8_t>(Opcode::OP_HASH160)
        && data_[1]  == 20
        && data_[22] == static_cast<uint8_t>(Opcode::OP_EQUAL);
}

bool Script::is_p2wpkh() const {
    // 22 bytes: OP_0 0x14 <20 bytes>
    return data_.size() == 22
        && data_[0] == static_cast<uint8_t>(Opcode::OP_0)
        && data_[1] == 20;
}

bool Script::is_p2wsh() const {
    // 34 bytes: OP_0 0x20 <32 bytes>
    return data_.size() == 34
        && data_[0] == static_cast<uint8_t>(Opcode::OP_0)
        && data_[1] == 32;
}

bool Script::is_p2tr() const {
    // 34 bytes: OP_1 0x20 <32 bytes>
    return data_.size() == 34
        && data_[0] == static_cast<uint8_t>(Opcode::OP_1)
        && data_[1] == 32;
}

bool Script::is_witness_program() const {
    if (data_.size() < 4 || data_.size() > 42) {
        return false;
    }
    auto version_byte = data_[0];
    if (version_byte != 0x00 &&
        (version_byte < 0x51 || version_byte > 0x60)) {
        return false;
    }
    auto program_len = data_[1];
    if (program_len < 2 || program_len > 40) {
        return false;
    }
    return data_.size() == static_cast<size_t>(2 + program_len);
}

std::optional<std::pair<int, std::vector<uint8_t>>>
Script::witness_program() const {
    if (!is_witness_program()) {
        return std::nullopt;
    }
    const int version = data_[0] == 0x00 ? 0 : data_[0] - 0x50;
    std::vector<uint8_t> program(data_.begin() + 2, data_.end());
    return std::make_pair(version, std::move(program));
}

// ===================================================================
// Payload extraction
// ===================================================================

std::optional<std::vector<uint8_t>> Script::get_p2pk_key() const {
    if (!is_p2pk()) {
        return std::nullopt;
    }
    return std::vector<uint8_t>(data_.begin() + 1, data_.end() - 1);
}

std::optional<core::uint160> Script::get_p2pkh_hash() const {
    if (!is_p2pkh()) {
        return std::nullopt;
    }
    return core::uint160::from_bytes(
        std::span<const uint8_t, 20>(data_.data() + 3, 20));
}

std::optional<core::uint160> Script::get_p2sh_hash() const {
    if (!is_p2sh()) {
        return std::nullopt;
    }
    return core::uint160::from_bytes(
        std::span<const uint8_t, 20>(data_.data() + 2, 20));
}

std::optional<core::uint160> Script::get_p2wpkh_hash() const {
    if (!is_p2wpkh()) {
        return std::nullopt;
    }
    return core::uint160::from_bytes(
        std::span<const uint8_t, 20>(data_.data() + 2, 20));
}

std::optional<core::uint256> Script::get_p2wsh_hash() const {
    if (!is_p2wsh()) {
        return std::nullopt;
    }
    return core::uint256::from_bytes(
        std::span<const uint8_t, 32>(data_.data() + 2, 32));
}

std::optional<core::uint256> Script::get_p2tr_key() const {
    if (!is_p2tr()) {
        return std::nullopt;
    }
    return core::uint256::from_bytes(
        std::span<const uint8_t, 32>(data_.data() + 2, 32));
}

// ===================================================================
// Builder helpers
// ===================================================================

Script& Script::push_opcode(Opcode op) {
    data_.push_back(static_cast<uint8_t>(op));
    return *this;
}

Script& Script::push_data(std::span<const uint8_t> payload) {
    append_push_data(data_, payload);
    return *this;
}

Script& Script::push_int(int64_t n) {
    if (n == -1) {
        return push_opcode(Opcode::OP_1NEGATE);
    }
    if (n >= 0 && n <= 16) {
        return push_opcode(encode_small_int(static_cast<int>(n)));
    }
    auto encoded = encode_script_num(n);
    append_push_data(data_, encoded);
    return *this;
}

Script& Script::append(const Script& other) {
    data_.insert(data_.end(), other.data_.begin(), other.data_.end());
    return *this;
}

void Script::set_last_opcode(Opcode op) {
    if (!data_.empty()) {
        data_.back() = static_cast<uint8_t>(op);
    }
}

// ===================================================================
// Iterator
// ===================================================================

Script::Iterator::Iterator(const uint8_t* begin, const uint8_t* end)
    : ptr_(begin), end_(end) {}

std::optional<Script::Element> Script::Iterator::next() {
    if (ptr_ >= end_) {
        return std::nullopt;
    }

    const auto raw = *ptr_++;
    const auto op = static_cast<Opcode>(raw);

    size_t count = 0;
    size_t len_bytes = 0;
    if (raw >= 0x01 && raw <= 0x4b) {
        count = raw;
    } else if (op == Opcode::OP_PUSHDATA1) {
        len_bytes = 1;
    } else if (op == Opcode::OP_PUSHDATA2) {
        len_bytes = 2;
    } else if (op == Opcode::OP_PUSHDATA4) {
        len_bytes = 4;
    } else {
        return Element{op, {}};
    }

    if (static_cast<size_t>(end_ - ptr_) < len_bytes) {
        ptr_ = end_;
        failed_ = true;
        return std::nullopt;
    }
    for (size_t i = 0; i < len_bytes; ++i) {
        count |= static_cast<size_t>(ptr_[i]) << (8 * i);
    }
    ptr_ += len_bytes;

    if (static_cast<size_t>(end_ - ptr_) < count) {
        ptr_ = end_;
        failed_ = true;
        return std::nullopt;
    }
    Element elem{op, std::span<const uint8_t>(ptr_, count)};
    ptr_ += count;
    return elem;
}

Script::Iterator Script::begin_iter() const {
    return Iterator(data_.data(), data_.data() + data_.size());
}

std::optional<std::vector<Script::Element>> Script::elements() const {
    std::vector<Element> out;
    auto it = begin_iter();
    while (auto elem = it.next()) {
        out.push_back(*elem);
    }
    if (it.failed()) {
        return std::nullopt;
    }
    return out;
}

bool is_minimal_push(const Script::Element& elem) {
    const auto raw = static_cast<uint8_t>(elem.opcode);
    const size_t len = elem.data.size();
    if (len == 0) {
        return elem.opcode == Opcode::OP_0;
    }
    if (len == 1 && elem.data[0] >= 1 && elem.data[0] <= 16) {
        return false;   // should have been OP_1..OP_16
    }
    if (len == 1 && elem.data[0] == 0x81) {
        return false;   // should have been OP_1NEGATE
    }
    if (len <= 75) {
        return raw == len;
    }
    if (len <= 0xFF) {
        return elem.opcode == Opcode::OP_PUSHDATA1;
    }
    if (len <= 0xFFFF) {
        return elem.opcode == Opcode::OP_PUSHDATA2;
    }
    return true;
}

// ===================================================================
// Rendering
// ===================================================================

std::string Script::to_asm() const {
    std::string out;
    auto it = begin_iter();
    while (auto elem = it.next()) {
        if (!out.empty()) out.push_back(' ');
        out += opcode_name(elem->opcode);
        if (!elem->data.empty()) {
            out.push_back(' ');
            out += core::to_hex(elem->data);
        }
    }
    if (it.failed()) {
        if (!out.empty()) out.push_back(' ');
        out += "<push past end>";
    }
    return out;
}

std::string Script::to_hex() const {
    return core::to_hex(span());
}

// ===================================================================
// Hashing
// ===================================================================

core::uint160 Script::script_hash() const {
    return crypto::hash160(span());
}

core::uint256 Script::witness_script_hash() const {
    return crypto::sha256(span());
}

} // namespace primitives::script
