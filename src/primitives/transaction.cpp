// Copyright (c) 2024-2026 The ELMS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "primitives/transaction.h"
#include "crypto/hash.h"

namespace primitives {

std::string OutPoint::to_string() const {
    return txid.to_display_hex() + ":" + std::to_string(vout);
}

core::uint256 hash_prevouts(const Transaction& tx) {
    crypto::HashWriter writer;
    for (const auto& in : tx.inputs) {
        in.previous_output.serialize(writer);
    }
    return writer.hash_double();
}

core::uint256 hash_sequence(const Transaction& tx) {
    crypto::HashWriter writer;
    for (const auto& in : tx.inputs) {
        core::ser_write_u32(writer, in.sequence);
    }
    return writer.hash_double();
}

core::uint256 hash_issuances(const Transaction& tx) {
    crypto::HashWriter writer;
    for (size_t i = 0; i < tx.inputs.size(); ++i) {
        core::ser_write_u8(writer, 0x00);
    }
    return writer.hash_double();
}

std::vector<uint8_t> serialize_outputs(std::span<const TxOut> outputs) {
    core::DataStream stream;
    for (const auto& out : outputs) {
        out.serialize(stream);
    }
    return stream.release();
}

core::uint256 hash_outputs(std::span<const TxOut> outputs) {
    crypto::HashWriter writer;
    for (const auto& out : outputs) {
        out.serialize(writer);
    }
    return writer.hash_double();
}

} // namespace primitives
