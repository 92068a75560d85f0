#pragma once
// Copyright (c) 2024-2026 The ELMS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "core/types.h"
#include "primitives/script/script.h"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace primitives {

// ---------------------------------------------------------------------------
// AddressParams  --  per-chain address encoding parameters
// ---------------------------------------------------------------------------

struct AddressParams {
    std::string_view name;
    uint8_t p2pkh_prefix;
    uint8_t p2sh_prefix;
    std::string_view bech_hrp;
    uint8_t blinded_prefix;     // leads confidential base58 addresses
    std::string_view blech_hrp;

    /// Elements regtest. The default for every address() call.
    static const AddressParams ELEMENTS;
    static const AddressParams LIQUID;
    static const AddressParams LIQUID_TESTNET;

    /// Look up "elements", "liquid" or "liquidtestnet".
    static std::optional<AddressParams> from_name(std::string_view name);

    bool operator==(const AddressParams& o) const = default;
};

// ---------------------------------------------------------------------------
// Address types
// ---------------------------------------------------------------------------

enum class AddressType {
    P2PKH,      // base58check, params.p2pkh_prefix
    P2SH,       // base58check, params.p2sh_prefix
    P2WPKH,     // segwit v0 keyhash: bech32
    P2WSH,      // segwit v0 scripthash: bech32
    P2TR,       // segwit v1: bech32m
};

// ---------------------------------------------------------------------------
// Address  --  an Elements address, unconfidential or confidential
// ---------------------------------------------------------------------------
//
// A confidential address carries the 33-byte blinding key of the receiver
// ahead of the payload: base58check(blinded_prefix || prefix || key || hash)
// for P2PKH/P2SH, blech32 under params.blech_hrp for segwit outputs.

class Address {
public:
    // -- Factory methods ------------------------------------------------------

    static Address p2pkh(const core::uint160& hash,
                         const AddressParams& params);
    static Address p2sh(const core::uint160& hash,
                        const AddressParams& params);
    static Address p2wpkh(const core::uint160& hash,
                          const AddressParams& params);
    static Address p2wsh(const core::uint256& hash,
                         const AddressParams& params);
    static Address p2tr(const core::uint256& output_key,
                        const AddressParams& params);

    /// Address for a standard output script. Fails with ADDRESS_ERROR for
    /// scripts that have no address form.
    static core::Result<Address> from_script(const script::Script& spk,
                                             const AddressParams& params);

    /// Parse an address string under @p params: base58check or bech32, or
    /// their confidential forms.
    static core::Result<Address> from_string(std::string_view str,
                                             const AddressParams& params);

    /// The confidential form of this address under @p blinder. Fails with
    /// ADDRESS_ERROR unless @p blinder is a valid compressed public key.
    core::Result<Address> blinded(std::span<const uint8_t> blinder) const;

    /// The same output without its blinding key.
    [[nodiscard]] Address unblinded() const;

    // -- Accessors ------------------------------------------------------------

    /// The scriptPubKey paying to this address.
    script::Script script_pubkey() const;

    [[nodiscard]] AddressType type() const { return type_; }
    [[nodiscard]] const std::string& to_string() const { return encoded_; }
    [[nodiscard]] const std::vector<uint8_t>& payload() const {
        return payload_;
    }
    [[nodiscard]] const AddressParams& params() const { return params_; }
    [[nodiscard]] bool is_blinded() const { return !blinder_.empty(); }
    /// The 33-byte blinding key, empty for unconfidential addresses.
    [[nodiscard]] const std::vector<uint8_t>& blinding_key() const {
        return blinder_;
    }

    bool operator==(const Address& other) const {
        return encoded_ == other.encoded_;
    }

private:
    Address(AddressType type, std::vector<uint8_t> payload,
            const AddressParams& params, std::vector<uint8_t> blinder = {});

    static core::Result<Address> from_witness(uint8_t version,
                                              std::vector<uint8_t> program,
                                              const AddressParams& params,
                                              std::vector<uint8_t> blinder);

    AddressType type_;
    std::vector<uint8_t> payload_;  // 20 bytes for P2PKH/P2SH/P2WPKH,
                                    // 32 bytes for P2WSH/P2TR
    std::vector<uint8_t> blinder_;  // empty, or a compressed key
    AddressParams params_;
    std::string encoded_;
};

} // namespace primitives
