#pragma once
// Copyright (c) 2024-2026 The ELMS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "primitives/script/opcodes.h"
#include "core/types.h"
#include "core/serialize.h"
#include "core/stream.h"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace primitives::script {

/// Maximum number of bytes pushable to the stack.
static constexpr size_t MAX_SCRIPT_ELEMENT_SIZE = 520;

/// Maximum number of bytes in a serialised script.
static constexpr size_t MAX_SCRIPT_SIZE = 10'000;

/// Maximum number of public keys per multisig.
static constexpr int MAX_PUBKEYS_PER_MULTISIG = 20;

/// Maximum number of non-push operations per script.
static constexpr int MAX_OPS_PER_SCRIPT = 201;

/// Leading byte of a taproot annex witness element.
static constexpr uint8_t TAPROOT_ANNEX_PREFIX = 0x50;

// -----------------------------------------------------------------------
// Script  --  bytecode container for Elements scripts
// -----------------------------------------------------------------------

class Script {
    std::vector<uint8_t> data_;

public:
    // -------------------------------------------------------------------
    // Construction
    // -------------------------------------------------------------------

    Script() = default;

    explicit Script(std::vector<uint8_t> data)
        : data_(std::move(data)) {}

    explicit Script(std::span<const uint8_t> data)
        : data_(data.begin(), data.end()) {}

    // -------------------------------------------------------------------
    // Standard script template constructors
    // -------------------------------------------------------------------

    /// P2PK: <pubkey> OP_CHECKSIG
    static Script p2pk(std::span<const uint8_t> pubkey);

    /// P2PKH: OP_DUP OP_HASH160 <20-byte hash> OP_EQUALVERIFY OP_CHECKSIG
    static Script p2pkh(const core::uint160& pubkey_hash);

    /// P2SH: OP_HASH160 <20-byte hash> OP_EQUAL
    static Script p2sh(const core::uint160& script_hash);

    /// P2WPKH: OP_0 <20-byte hash>
    static Script p2wpkh(const core::uint160& pubkey_hash);

    /// P2WSH: OP_0 <32-byte hash>
    static Script p2wsh(const core::uint256& script_hash);

    /// P2TR (Taproot): OP_1 <32-byte output key>
    static Script p2tr(const core::uint256& output_key);

    // -------------------------------------------------------------------
    // Script type detection
    // -------------------------------------------------------------------

    /// <33 or 65 byte push> OP_CHECKSIG
    bool is_p2pk() const;
    bool is_p2pkh() const;
    bool is_p2sh() const;
    bool is_p2wpkh() const;
    bool is_p2wsh() const;
    bool is_p2tr() const;

    /// True for any valid witness program (version 0-16, program 2-40 bytes).
    bool is_witness_program() const;

    /// If this is a witness program, return (version, program).
    std::optional<std::pair<int, std::vector<uint8_t>>>
    witness_program() const;

    // -------------------------------------------------------------------
    // Extract payloads from standard scripts
    // -------------------------------------------------------------------

    std::optional<std::vector<uint8_t>> get_p2pk_key() const;
    std::optional<core::uint160> get_p2pkh_hash() const;
    std::optional<core::uint160> get_p2sh_hash() const;
    std::optional<core::uint160> get_p2wpkh_hash() const;
    std::optional<core::uint256> get_p2wsh_hash() const;
    std::optional<core::uint256> get_p2tr_key() const;

    // -------------------------------------------------------------------
    // Raw access
    // -------------------------------------------------------------------

    const std::vector<uint8_t>& data() const { return data_; }
    std::span<const uint8_t> span() const {
        return std::span<const uint8_t>(data_);
    }
    size_t size() const { return data_.size(); }
    bool empty() const { return data_.empty(); }

    bool operator==(const Script& other) const = default;
    auto operator<=>(const Script& other) const = default;

    // -------------------------------------------------------------------
    // Script builder helpers
    // -------------------------------------------------------------------

    /// Append a single opcode byte.
    Script& push_opcode(Opcode op);

    /// Append a data push with the minimal encoding: OP_0 for an empty
    /// push, OP_1..OP_16 and OP_1NEGATE for the matching single bytes,
    /// otherwise the shortest of OP_PUSHBYTES_N / OP_PUSHDATA1/2/4.
    Script& push_data(std::span<const uint8_t> payload);

    /// Push a CScriptNum-encoded integer.
    Script& push_int(int64_t n);

    /// Append another script's raw bytes.
    Script& append(const Script& other);

    /// Replace the final byte. Used to fold a trailing CHECKSIG/EQUAL
    /// into its VERIFY twin.
    void set_last_opcode(Opcode op);

    // -------------------------------------------------------------------
    // Script element iteration
    // -------------------------------------------------------------------

    /// A single decoded script element: an opcode and optional push data.
    struct Element {
        Opcode opcode;
        std::span<const uint8_t> data;  // non-empty only for push ops

        bool is_push() const { return is_push_opcode(opcode); }
    };

    /// Forward-only iterator that decodes script elements one at a time.
    /// next() returns std::nullopt at end-of-script or on a truncated
    /// push; failed() tells the two apart.
    class Iterator {
        const uint8_t* ptr_;
        const uint8_t* end_;
        bool failed_ = false;

    public:
        Iterator(const uint8_t* begin, const uint8_t* end);

        std::optional<Element> next();

        bool has_more() const { return ptr_ < end_; }
        bool failed() const { return failed_; }
    };

    Iterator begin_iter() const;

    /// Decode every element. Returns std::nullopt if the script ends in
    /// the middle of a push.
    std::optional<std::vector<Element>> elements() const;

    // -------------------------------------------------------------------
    // Rendering
    // -------------------------------------------------------------------

    /// Space-separated opcode names with pushes shown as
    /// "OP_PUSHBYTES_N <hex>".
    std::string to_asm() const;

    std::string to_hex() const;

    // -------------------------------------------------------------------
    // Serialization (compact-size prefixed byte vector)
    // -------------------------------------------------------------------

    template <typename Stream>
    void serialize(Stream& s) const {
        core::ser_write_vector(s, std::span<const uint8_t>(data_));
    }

    // -------------------------------------------------------------------
    // Hashing helpers
    // -------------------------------------------------------------------

    /// HASH160 of the script bytes (P2SH commitment).
    core::uint160 script_hash() const;

    /// SHA256 of the script bytes (P2WSH commitment).
    core::uint256 witness_script_hash() const;
};

/// True when @p elem is pushed with the encoding push_data() would pick.
bool is_minimal_push(const Script::Element& elem);

} // namespace primitives::script
