// Copyright (c) 2024-2026 The ELMS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "miniscript/context.h"
#include "miniscript/node.h"
#include "miniscript/satisfy.h"

namespace miniscript {

using core::ErrorCode;
using core::make_error;
using core::make_ok;

std::string_view context_name(Context ctx) noexcept {
    switch (ctx) {
    case Context::LEGACY:    return "Legacy";
    case Context::SEGWITV0:  return "Segwitv0";
    case Context::TAP:       return "Tap";
    case Context::BARE:      return "Bare";
    case Context::NO_CHECKS: return "NoChecks";
    }
    return "unknown";
}

size_t max_sig_push_size(Context ctx) noexcept {
    return ctx == Context::TAP ? 66 : 73;
}

// ===================================================================
// Keys and fragments
// ===================================================================

core::Result<void> check_pk(Context ctx, const PublicKey& key) {
    switch (ctx) {
    case Context::NO_CHECKS:
        return make_ok();
    case Context::TAP:
        if (!key.is_xonly()) {
            return make_error(ErrorCode::XONLY_REQUIRED,
                              "tapscript requires x-only key " +
                                  key.to_string());
        }
        return make_ok();
    case Context::SEGWITV0:
        if (key.is_uncompressed()) {
            return make_error(ErrorCode::COMPRESSED_ONLY,
                              "uncompressed key in segwit context: " +
                                  key.to_string());
        }
        [[fallthrough]];
    case Context::LEGACY:
    case Context::BARE:
        if (key.is_xonly()) {
            return make_error(ErrorCode::BAD_KEY,
                              "x-only key outside tapscript: " +
                                  key.to_string());
        }
        return make_ok();
    }
    return make_ok();
}

core::Result<void> check_terminal(Context ctx, const Node& node) {
    if (ctx == Context::NO_CHECKS) return make_ok();

    if (node.fragment == Fragment::MULTI_A && !is_tapscript(ctx)) {
        return make_error(ErrorCode::MULTI_A_NOT_ALLOWED,
                          "multi_a is only valid in tapscript");
    }
    if (node.fragment == Fragment::MULTI && is_tapscript(ctx)) {
        return make_error(ErrorCode::MULTI_NOT_ALLOWED,
                          "multi is not valid in tapscript");
    }
    for (const auto& key : node.keys) ELMS_TRY_VOID(check_pk(ctx, key));
    if (node.raw_pkh) {
        const bool want_xonly = is_tapscript(ctx);
        if ((node.raw_pkh->kind == PublicKey::Kind::XONLY) != want_xonly) {
            return make_error(ErrorCode::BAD_KEY,
                              "key hash refinement does not match context " +
                                  std::string(context_name(ctx)));
        }
    }
    return make_ok();
}

// ===================================================================
// Limits
// ===================================================================

core::Result<void> check_global_consensus_validity(Context ctx,
                                                   const Node& node) {
    using primitives::script::MAX_SCRIPT_ELEMENT_SIZE;
    using primitives::script::MAX_SCRIPT_SIZE;

    switch (ctx) {
    case Context::LEGACY:
        if (node.script_len > MAX_SCRIPT_ELEMENT_SIZE) {
            return make_error(ErrorCode::MAX_REDEEM_SCRIPT_SIZE,
                              "redeem script is " +
                                  std::to_string(node.script_len) +
                                  " bytes, limit 520");
        }
        break;
    case Context::SEGWITV0:
    case Context::BARE:
        if (node.script_len > MAX_SCRIPT_SIZE) {
            return make_error(ErrorCode::SCRIPT_SIZE_TOO_LARGE,
                              "script is " + std::to_string(node.script_len) +
                                  " bytes, limit 10000");
        }
        break;
    case Context::TAP:
        if (node.script_len > MAX_BLOCK_WEIGHT) {
            return make_error(ErrorCode::SCRIPT_SIZE_TOO_LARGE,
                              "tapscript exceeds the block weight limit");
        }
        break;
    case Context::NO_CHECKS:
        break;
    }
    return make_ok();
}

core::Result<void> check_global_policy_validity(Context ctx,
                                                const Node& node) {
    if (ctx == Context::SEGWITV0 &&
        node.script_len > MAX_STANDARD_P2WSH_SCRIPT_SIZE) {
        return make_error(ErrorCode::SCRIPT_SIZE_TOO_LARGE,
                          "witness script is " +
                              std::to_string(node.script_len) +
                              " bytes, standard limit 3600");
    }
    return make_ok();
}

core::Result<void> check_local_consensus_validity(Context ctx,
                                                  const Node& node) {
    switch (ctx) {
    case Context::LEGACY:
    case Context::SEGWITV0:
    case Context::BARE: {
        auto ops = node.ops_count_sat();
        if (!ops) {
            return make_error(ErrorCode::IMPOSSIBLE_SATISFACTION,
                              "script has no satisfaction");
        }
        if (*ops > static_cast<uint32_t>(
                       primitives::script::MAX_OPS_PER_SCRIPT)) {
            return make_error(ErrorCode::MAX_OPS_EXCEEDED,
                              "satisfaction executes " + std::to_string(*ops) +
                                  " opcodes, limit 201");
        }
        break;
    }
    case Context::TAP: {
        auto elems = node.max_sat_elements();
        if (elems && *elems + 1 > MAX_STACK_SIZE) {
            return make_error(ErrorCode::MAX_WITNESS_ITEMS,
                              "satisfaction exceeds the stack size limit");
        }
        break;
    }
    case Context::NO_CHECKS:
        break;
    }
    return make_ok();
}

core::Result<void> check_local_policy_validity(Context ctx,
                                               const Node& node) {
    switch (ctx) {
    case Context::LEGACY: {
        auto size = max_satisfaction_size(ctx, node);
        if (!size) {
            return make_error(ErrorCode::IMPOSSIBLE_SATISFACTION,
                              "script has no satisfaction");
        }
        if (*size > MAX_SCRIPTSIG_SIZE) {
            return make_error(ErrorCode::MAX_SCRIPTSIG_SIZE,
                              "scriptSig could reach " +
                                  std::to_string(*size) +
                                  " bytes, standard limit 1650");
        }
        break;
    }
    case Context::SEGWITV0: {
        auto elems = node.max_sat_elements();
        if (!elems) {
            return make_error(ErrorCode::IMPOSSIBLE_SATISFACTION,
                              "script has no satisfaction");
        }
        if (*elems > MAX_STANDARD_P2WSH_STACK_ITEMS) {
            return make_error(ErrorCode::MAX_WITNESS_ITEMS,
                              "satisfaction needs " + std::to_string(*elems) +
                                  " witness items, standard limit 100");
        }
        break;
    }
    default:
        break;
    }
    return make_ok();
}

core::Result<void> check_global_validity(Context ctx, const Node& node) {
    ELMS_TRY_VOID(check_global_consensus_validity(ctx, node));
    return check_global_policy_validity(ctx, node);
}

core::Result<void> check_local_validity(Context ctx, const Node& node) {
    ELMS_TRY_VOID(check_local_consensus_validity(ctx, node));
    return check_local_policy_validity(ctx, node);
}

// ===================================================================
// Top level
// ===================================================================

core::Result<void> top_level_type_check(const Node& node) {
    if (!(node.type << "B"_mst)) {
        return make_error(ErrorCode::NON_TOP_LEVEL,
                          node_to_string(node) + " is not of type B");
    }
    return make_ok();
}

core::Result<void> top_level_checks(Context ctx, const Node& node) {
    ELMS_TRY_VOID(top_level_type_check(node));
    if (ctx != Context::BARE) return make_ok();

    if (node.fragment == Fragment::WRAP_C) {
        const Fragment inner = node.subs[0]->fragment;
        if (inner == Fragment::PK_K || inner == Fragment::PK_H) {
            return make_ok();
        }
    }
    if (node.fragment == Fragment::MULTI && node.keys.size() <= 3) {
        return make_ok();
    }
    return make_error(ErrorCode::NON_STANDARD_BARE_SCRIPT,
                      "bare scripts are limited to pk, pkh and multi with at "
                      "most 3 keys");
}

std::optional<size_t> max_satisfaction_size(Context ctx, const Node& node) {
    const SatInfo& table = (ctx == Context::LEGACY || ctx == Context::BARE)
                               ? node.script_sig_size
                               : node.witness_size;
    auto size = table.sat.get();
    if (!size) return std::nullopt;
    return static_cast<size_t>(*size);
}

core::Result<void> check_witness(
    Context ctx, const std::vector<std::vector<uint8_t>>& witness) {
    switch (ctx) {
    case Context::LEGACY:
        if (witness_to_script_sig(witness).size() > MAX_SCRIPTSIG_SIZE) {
            return make_error(ErrorCode::MAX_SCRIPTSIG_SIZE,
                              "scriptSig exceeds the standard limit");
        }
        break;
    case Context::SEGWITV0:
        if (witness.size() > MAX_STANDARD_P2WSH_STACK_ITEMS) {
            return make_error(ErrorCode::MAX_WITNESS_ITEMS,
                              "witness has " + std::to_string(witness.size()) +
                                  " items, standard limit 100");
        }
        break;
    case Context::TAP:
        if (witness.size() > MAX_STACK_SIZE) {
            return make_error(ErrorCode::MAX_WITNESS_ITEMS,
                              "witness exceeds the stack size limit");
        }
        break;
    default:
        break;
    }
    return make_ok();
}

} // namespace miniscript
