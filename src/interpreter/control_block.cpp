// Copyright (c) 2024-2026 The ELMS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "interpreter/control_block.h"
#include "core/logging.h"
#include "core/serialize.h"
#include "core/stream.h"
#include "crypto/hash.h"
#include "crypto/secp256k1.h"

#include <algorithm>

namespace interpreter {

using core::ErrorCode;
using core::make_error;

core::uint256 tap_leaf_hash(uint8_t leaf_version,
                            const primitives::script::Script& script) {
    core::DataStream stream;
    core::ser_write_u8(stream, leaf_version);
    script.serialize(stream);
    return crypto::tagged_hash("TapLeaf/elements", stream.view());
}

core::uint256 tap_branch_hash(const core::uint256& a, const core::uint256& b) {
    const auto sa = a.span();
    const auto sb = b.span();
    const bool a_first = std::lexicographical_compare(sa.begin(), sa.end(),
                                                      sb.begin(), sb.end());
    const auto lo = a_first ? sa : sb;
    const auto hi = a_first ? sb : sa;
    std::array<uint8_t, 64> msg{};
    std::copy(lo.begin(), lo.end(), msg.begin());
    std::copy(hi.begin(), hi.end(), msg.begin() + 32);
    return crypto::tagged_hash("TapBranch/elements", msg);
}

core::Result<ControlBlock> ControlBlock::from_slice(
    std::span<const uint8_t> bytes) {
    if (bytes.size() < TAPROOT_CONTROL_BASE_SIZE ||
        (bytes.size() - TAPROOT_CONTROL_BASE_SIZE) %
                TAPROOT_CONTROL_NODE_SIZE != 0) {
        return make_error(ErrorCode::CONTROL_BLOCK_PARSE,
                          "invalid control block size " +
                              std::to_string(bytes.size()));
    }
    const size_t nodes = (bytes.size() - TAPROOT_CONTROL_BASE_SIZE) /
                         TAPROOT_CONTROL_NODE_SIZE;
    if (nodes > TAPROOT_CONTROL_MAX_NODE_COUNT) {
        return make_error(ErrorCode::CONTROL_BLOCK_PARSE,
                          "control block path of " + std::to_string(nodes) +
                              " nodes");
    }

    ControlBlock cb;
    cb.leaf_version = bytes[0] & 0xfe;
    cb.output_key_odd = (bytes[0] & 0x01) != 0;
    if (cb.leaf_version == primitives::script::TAPROOT_ANNEX_PREFIX) {
        return make_error(ErrorCode::CONTROL_BLOCK_PARSE,
                          "control block leaf version collides with annex");
    }

    auto key = bytes.subspan(1, 32);
    if (!crypto::is_valid_xonly(key)) {
        return make_error(ErrorCode::CONTROL_BLOCK_PARSE,
                          "invalid internal key in control block");
    }
    std::copy(key.begin(), key.end(), cb.internal_key.begin());

    cb.merkle_branch.reserve(nodes);
    for (size_t i = 0; i < nodes; ++i) {
        auto node = bytes.subspan(TAPROOT_CONTROL_BASE_SIZE +
                                      i * TAPROOT_CONTROL_NODE_SIZE,
                                  TAPROOT_CONTROL_NODE_SIZE);
        cb.merkle_branch.push_back(
            core::uint256::from_bytes(node.first<32>()));
    }
    return cb;
}

bool ControlBlock::verify_taproot_commitment(
    std::span<const uint8_t, 32> output_key,
    const primitives::script::Script& script) const {
    core::uint256 node = tap_leaf_hash(leaf_version, script);
    for (const auto& sibling : merkle_branch) {
        node = tap_branch_hash(node, sibling);
    }

    std::array<uint8_t, 64> msg{};
    std::copy(internal_key.begin(), internal_key.end(), msg.begin());
    const auto node_bytes = node.span();
    std::copy(node_bytes.begin(), node_bytes.end(), msg.begin() + 32);
    const core::uint256 tweak = crypto::tagged_hash("TapTweak/elements", msg);

    auto tweaked = crypto::xonly_tweak_add(
        std::span<const uint8_t, 32>(internal_key),
        std::span<const uint8_t, 32>(tweak.span().data(), 32));
    if (!tweaked) {
        LOG_DEBUG(core::LogCategory::INTERPRETER,
                  "taproot tweak failed: " + tweaked.error().message());
        return false;
    }
    const auto& q = tweaked.value();
    return q.odd_y == output_key_odd &&
           std::equal(q.xonly.begin(), q.xonly.end(), output_key.begin());
}

} // namespace interpreter
