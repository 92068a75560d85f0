// Copyright (c) 2024-2026 The ELMS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "primitives/address.h"

#include "core/base58.h"
#include "core/bech32.h"
#include "core/blech32.h"
#include "crypto/secp256k1.h"

#include <utility>

namespace primitives {

// =========================================================================
// Chain parameters
// =========================================================================

const AddressParams AddressParams::ELEMENTS{
    "elements", 235, 75, "ert", 4, "el"};
const AddressParams AddressParams::LIQUID{"liquid", 57, 39, "ex", 12, "lq"};
const AddressParams AddressParams::LIQUID_TESTNET{
    "liquidtestnet", 36, 19, "tex", 23, "tlq"};

std::optional<AddressParams> AddressParams::from_name(std::string_view name) {
    for (const auto* p : {&ELEMENTS, &LIQUID, &LIQUID_TESTNET}) {
        if (p->name == name) return *p;
    }
    return std::nullopt;
}

// =========================================================================
// Construction
// =========================================================================

namespace {

constexpr size_t BLINDING_KEY_LEN = 33;

// base58check(blinded_prefix || prefix || key || hash)
std::string encode_confidential_base58(uint8_t blinded_prefix,
                                       uint8_t prefix,
                                       const std::vector<uint8_t>& blinder,
                                       const std::vector<uint8_t>& hash) {
    std::vector<uint8_t> data{blinded_prefix, prefix};
    data.insert(data.end(), blinder.begin(), blinder.end());
    data.insert(data.end(), hash.begin(), hash.end());
    return core::base58check_encode(data);
}

std::string encode_segwit_for(const AddressParams& params, uint8_t version,
                              const std::vector<uint8_t>& program,
                              const std::vector<uint8_t>& blinder) {
    if (blinder.empty()) {
        return core::encode_segwit(params.bech_hrp, version, program);
    }
    std::vector<uint8_t> data(blinder);
    data.insert(data.end(), program.begin(), program.end());
    return core::encode_blech32_segwit(params.blech_hrp, version, data);
}

bool is_blinding_key(std::span<const uint8_t> key) {
    return key.size() == BLINDING_KEY_LEN && crypto::is_valid_pubkey(key);
}

}  // namespace

Address::Address(AddressType type, std::vector<uint8_t> payload,
                 const AddressParams& params, std::vector<uint8_t> blinder)
    : type_(type), payload_(std::move(payload)),
      blinder_(std::move(blinder)), params_(params) {
    switch (type_) {
    case AddressType::P2PKH:
    case AddressType::P2SH: {
        const uint8_t prefix = type_ == AddressType::P2PKH
                                   ? params_.p2pkh_prefix
                                   : params_.p2sh_prefix;
        encoded_ = blinder_.empty()
                       ? core::encode_with_version(prefix, payload_)
                       : encode_confidential_base58(params_.blinded_prefix,
                                                    prefix, blinder_,
                                                    payload_);
        break;
    }
    case AddressType::P2WPKH:
    case AddressType::P2WSH:
        encoded_ = encode_segwit_for(params_, 0, payload_, blinder_);
        break;
    case AddressType::P2TR:
        encoded_ = encode_segwit_for(params_, 1, payload_, blinder_);
        break;
    }
}

Address Address::p2pkh(const core::uint160& hash,
                       const AddressParams& params) {
    return Address(AddressType::P2PKH,
                   {hash.bytes().begin(), hash.bytes().end()}, params);
}

Address Address::p2sh(const core::uint160& hash,
                      const AddressParams& params) {
    return Address(AddressType::P2SH,
                   {hash.bytes().begin(), hash.bytes().end()}, params);
}

Address Address::p2wpkh(const core::uint160& hash,
                        const AddressParams& params) {
    return Address(AddressType::P2WPKH,
                   {hash.bytes().begin(), hash.bytes().end()}, params);
}

Address Address::p2wsh(const core::uint256& hash,
                       const AddressParams& params) {
    return Address(AddressType::P2WSH,
                   {hash.bytes().begin(), hash.bytes().end()}, params);
}

Address Address::p2tr(const core::uint256& output_key,
                      const AddressParams& params) {
    return Address(AddressType::P2TR,
                   {output_key.bytes().begin(), output_key.bytes().end()},
                   params);
}

core::Result<Address> Address::from_script(const script::Script& spk,
                                           const AddressParams& params) {
    if (auto h = spk.get_p2pkh_hash()) return p2pkh(*h, params);
    if (auto h = spk.get_p2sh_hash()) return p2sh(*h, params);
    if (auto h = spk.get_p2wpkh_hash()) return p2wpkh(*h, params);
    if (auto h = spk.get_p2wsh_hash()) return p2wsh(*h, params);
    if (auto k = spk.get_p2tr_key()) return p2tr(*k, params);
    return core::make_error(core::ErrorCode::ADDRESS_ERROR,
                            "script has no address form: " + spk.to_hex());
}

core::Result<Address> Address::blinded(
    std::span<const uint8_t> blinder) const {
    if (!is_blinding_key(blinder)) {
        return core::make_error(core::ErrorCode::ADDRESS_ERROR,
                                "blinding key must be a compressed public key");
    }
    return Address(type_, payload_, params_,
                   std::vector<uint8_t>(blinder.begin(), blinder.end()));
}

Address Address::unblinded() const {
    return Address(type_, payload_, params_);
}

core::Result<Address> Address::from_witness(uint8_t version,
                                            std::vector<uint8_t> program,
                                            const AddressParams& params,
                                            std::vector<uint8_t> blinder) {
    if (version == 0 && program.size() == 20) {
        return Address(AddressType::P2WPKH, std::move(program), params,
                       std::move(blinder));
    }
    if (version == 0 && program.size() == 32) {
        return Address(AddressType::P2WSH, std::move(program), params,
                       std::move(blinder));
    }
    if (version == 1 && program.size() == 32) {
        return Address(AddressType::P2TR, std::move(program), params,
                       std::move(blinder));
    }
    return core::make_error(core::ErrorCode::ADDRESS_ERROR,
                            "unsupported witness program");
}

core::Result<Address> Address::from_string(std::string_view str,
                                           const AddressParams& params) {
    if (auto seg = core::decode_segwit(params.bech_hrp, str)) {
        auto& [version, program] = *seg;
        return from_witness(version, std::move(program), params, {});
    }
    if (auto seg = core::decode_blech32_segwit(params.blech_hrp, str)) {
        auto& [version, data] = *seg;
        std::vector<uint8_t> blinder(data.begin(),
                                     data.begin() + BLINDING_KEY_LEN);
        if (!is_blinding_key(blinder)) {
            return core::make_error(core::ErrorCode::ADDRESS_ERROR,
                                    "invalid blinding key");
        }
        return from_witness(
            version,
            std::vector<uint8_t>(data.begin() + BLINDING_KEY_LEN, data.end()),
            params, std::move(blinder));
    }

    auto raw = core::base58check_decode(str);
    if (!raw) {
        return core::make_error(core::ErrorCode::ADDRESS_ERROR,
                                "invalid address encoding");
    }
    uint8_t prefix = 0;
    std::vector<uint8_t> blinder;
    std::vector<uint8_t> hash;
    if (raw->size() == 1 + 20) {
        prefix = (*raw)[0];
        hash.assign(raw->begin() + 1, raw->end());
    } else if (raw->size() == 2 + BLINDING_KEY_LEN + 20 &&
               (*raw)[0] == params.blinded_prefix) {
        prefix = (*raw)[1];
        blinder.assign(raw->begin() + 2, raw->begin() + 2 + BLINDING_KEY_LEN);
        hash.assign(raw->begin() + 2 + BLINDING_KEY_LEN, raw->end());
        if (!is_blinding_key(blinder)) {
            return core::make_error(core::ErrorCode::ADDRESS_ERROR,
                                    "invalid blinding key");
        }
    } else {
        return core::make_error(core::ErrorCode::ADDRESS_ERROR,
                                "invalid address encoding");
    }
    if (prefix == params.p2pkh_prefix) {
        return Address(AddressType::P2PKH, std::move(hash), params,
                       std::move(blinder));
    }
    if (prefix == params.p2sh_prefix) {
        return Address(AddressType::P2SH, std::move(hash), params,
                       std::move(blinder));
    }
    return core::make_error(core::ErrorCode::ADDRESS_ERROR,
                            "address version byte does not match network");
}

// =========================================================================
// Script generation
// =========================================================================

script::Script Address::script_pubkey() const {
    switch (type_) {
    case AddressType::P2PKH:
        return script::Script::p2pkh(core::uint160::from_bytes(
            std::span<const uint8_t, 20>(payload_.data(), 20)));
    case AddressType::P2SH:
        return script::Script::p2sh(core::uint160::from_bytes(
            std::span<const uint8_t, 20>(payload_.data(), 20)));
    case AddressType::P2WPKH:
        return script::Script::p2wpkh(core::uint160::from_bytes(
            std::span<const uint8_t, 20>(payload_.data(), 20)));
    case AddressType::P2WSH:
        return script::Script::p2wsh(core::uint256::from_bytes(
            std::span<const uint8_t, 32>(payload_.data(), 32)));
    case AddressType::P2TR:
        return script::Script::p2tr(core::uint256::from_bytes(
            std::span<const uint8_t, 32>(payload_.data(), 32)));
    }
    return script::Script{};
}

} // namespace primitives
