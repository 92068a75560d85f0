// Copyright (c) 2024-2026 The ELMS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "miniscript/miniscript.h"
#include "core/hex.h"
#include "core/logging.h"
#include "miniscript/decode.h"

#include <set>

namespace miniscript {

using core::ErrorCode;
using core::make_error;

namespace {

// ===================================================================
// Tree -> Node
// ===================================================================

core::Result<NodeRef> node_from_tree(const Tree& tree, Context ctx);

core::Error unexpected_node(const Tree& tree) {
    return make_error(ErrorCode::UNEXPECTED,
                      tree.name + "(" + std::to_string(tree.args.size()) +
                          " args) while parsing Miniscript");
}

/// A leaf argument: a Tree with a name and no arguments of its own.
core::Result<std::string_view> terminal(const Tree& tree) {
    if (!tree.args.empty()) return unexpected_node(tree);
    return std::string_view(tree.name);
}

core::Result<PublicKey> key_arg(const Tree& tree) {
    ELMS_TRY_ASSIGN(text, terminal(tree));
    return PublicKey::from_string(text);
}

core::Result<uint32_t> num_arg(const Tree& tree) {
    ELMS_TRY_ASSIGN(text, terminal(tree));
    return parse_num(text);
}

core::Result<std::vector<uint8_t>> hash_arg(const Tree& tree, size_t len) {
    ELMS_TRY_ASSIGN(text, terminal(tree));
    auto bytes = text.size() == len * 2 ? core::from_hex(text) : std::nullopt;
    if (!bytes) {
        return make_error(ErrorCode::BAD_HEX,
                          "expected " + std::to_string(len) +
                              "-byte hex hash, got '" + std::string(text) +
                              "'");
    }
    return std::move(*bytes);
}

core::Result<std::vector<NodeRef>> sub_args(const Tree& tree, size_t from,
                                            Context ctx) {
    std::vector<NodeRef> subs;
    for (size_t i = from; i < tree.args.size(); ++i) {
        ELMS_TRY_ASSIGN(sub, node_from_tree(tree.args[i], ctx));
        subs.push_back(std::move(sub));
    }
    return subs;
}

core::Result<NodeRef> fragment_from_tree(std::string_view name,
                                         const Tree& tree, Context ctx) {
    const size_t n = tree.args.size();

    if ((name == "0" || name == "1") && n == 0) {
        return make_node(ctx, name == "0" ? Fragment::JUST_0
                                          : Fragment::JUST_1);
    }
    if ((name == "pk_k" || name == "pk_h") && n == 1) {
        ELMS_TRY_ASSIGN(key, key_arg(tree.args[0]));
        return make_node(ctx, name == "pk_k" ? Fragment::PK_K
                                             : Fragment::PK_H,
                         {}, {std::move(key)});
    }
    if (name == "expr_raw_pkh" && n == 1) {
        ELMS_TRY_ASSIGN(bytes, hash_arg(tree.args[0], 20));
        KeyHash hash{core::uint160::from_bytes(
                         std::span<const uint8_t, 20>(bytes.data(), 20)),
                     is_tapscript(ctx) ? PublicKey::Kind::XONLY
                                       : PublicKey::Kind::FULL};
        return make_raw_pkh(ctx, hash);
    }
    if ((name == "older" || name == "after") && n == 1) {
        ELMS_TRY_ASSIGN(k, num_arg(tree.args[0]));
        return make_node(ctx, name == "older" ? Fragment::OLDER
                                              : Fragment::AFTER,
                         {}, {}, {}, k);
    }
    if (n == 1) {
        std::optional<Fragment> f;
        size_t len = 32;
        if (name == "sha256") f = Fragment::SHA256;
        if (name == "hash256") f = Fragment::HASH256;
        if (name == "ripemd160") { f = Fragment::RIPEMD160; len = 20; }
        if (name == "hash160") { f = Fragment::HASH160; len = 20; }
        if (f) {
            ELMS_TRY_ASSIGN(data, hash_arg(tree.args[0], len));
            return make_node(ctx, *f, {}, {}, std::move(data));
        }
    }
    if (n == 2) {
        std::optional<Fragment> f;
        if (name == "and_v") f = Fragment::AND_V;
        if (name == "and_b") f = Fragment::AND_B;
        if (name == "or_b") f = Fragment::OR_B;
        if (name == "or_c") f = Fragment::OR_C;
        if (name == "or_d") f = Fragment::OR_D;
        if (name == "or_i") f = Fragment::OR_I;
        if (f) {
            ELMS_TRY_ASSIGN(subs, sub_args(tree, 0, ctx));
            return make_node(ctx, *f, std::move(subs));
        }
        if (name == "and_n") {
            ELMS_TRY_ASSIGN(subs, sub_args(tree, 0, ctx));
            ELMS_TRY_ASSIGN(zero, make_node(ctx, Fragment::JUST_0));
            subs.push_back(std::move(zero));
            return make_node(ctx, Fragment::ANDOR, std::move(subs));
        }
    }
    if (name == "andor" && n == 3) {
        ELMS_TRY_ASSIGN(subs, sub_args(tree, 0, ctx));
        return make_node(ctx, Fragment::ANDOR, std::move(subs));
    }
    if (name == "thresh" && n >= 2) {
        ELMS_TRY_ASSIGN(k, num_arg(tree.args[0]));
        ELMS_TRY_ASSIGN(subs, sub_args(tree, 1, ctx));
        return make_node(ctx, Fragment::THRESH, std::move(subs), {}, {}, k);
    }
    if ((name == "multi" || name == "multi_a") && n >= 2) {
        ELMS_TRY_ASSIGN(k, num_arg(tree.args[0]));
        std::vector<PublicKey> keys;
        for (size_t i = 1; i < n; ++i) {
            ELMS_TRY_ASSIGN(key, key_arg(tree.args[i]));
            keys.push_back(std::move(key));
        }
        return make_node(ctx, name == "multi" ? Fragment::MULTI
                                              : Fragment::MULTI_A,
                         {}, std::move(keys), {}, k);
    }
    return unexpected_node(tree);
}

core::Result<NodeRef> apply_wrapper(char w, NodeRef sub, Context ctx) {
    switch (w) {
    case 'a': return make_node(ctx, Fragment::WRAP_A, {std::move(sub)});
    case 's': return make_node(ctx, Fragment::WRAP_S, {std::move(sub)});
    case 'c': return make_node(ctx, Fragment::WRAP_C, {std::move(sub)});
    case 'd': return make_node(ctx, Fragment::WRAP_D, {std::move(sub)});
    case 'v': return make_node(ctx, Fragment::WRAP_V, {std::move(sub)});
    case 'j': return make_node(ctx, Fragment::WRAP_J, {std::move(sub)});
    case 'n': return make_node(ctx, Fragment::WRAP_N, {std::move(sub)});
    case 't': {
        ELMS_TRY_ASSIGN(one, make_node(ctx, Fragment::JUST_1));
        return make_node(ctx, Fragment::AND_V, {std::move(sub), std::move(one)});
    }
    case 'l': {
        ELMS_TRY_ASSIGN(zero, make_node(ctx, Fragment::JUST_0));
        return make_node(ctx, Fragment::OR_I, {std::move(zero), std::move(sub)});
    }
    case 'u': {
        ELMS_TRY_ASSIGN(zero, make_node(ctx, Fragment::JUST_0));
        return make_node(ctx, Fragment::OR_I, {std::move(sub), std::move(zero)});
    }
    default:
        return make_error(ErrorCode::UNEXPECTED,
                          std::string("unknown wrapper '") + w + "'");
    }
}

core::Result<NodeRef> node_from_tree(const Tree& tree, Context ctx) {
    std::string wrappers;
    std::string_view name = tree.name;

    const auto colon = name.find(':');
    if (colon != std::string_view::npos) {
        if (name.find(':', colon + 1) != std::string_view::npos) {
            return make_error(ErrorCode::PARSE_ERROR,
                              "multiple ':' in " + tree.name);
        }
        if (colon == 0) {
            return make_error(ErrorCode::PARSE_ERROR,
                              "empty wrapper list in " + tree.name);
        }
        wrappers = std::string(name.substr(0, colon));
        name = name.substr(colon + 1);
    }

    // pk(K) is c:pk_k(K) and pkh(K) is c:pk_h(K).
    if (name == "pk") {
        name = "pk_k";
        wrappers += 'c';
    } else if (name == "pkh") {
        name = "pk_h";
        wrappers += 'c';
    }

    ELMS_TRY_ASSIGN(node, fragment_from_tree(name, tree, ctx));
    for (auto it = wrappers.rbegin(); it != wrappers.rend(); ++it) {
        ELMS_TRY_ASSIGN(wrapped, apply_wrapper(*it, std::move(node), ctx));
        node = std::move(wrapped);
    }
    return node;
}

// ===================================================================
// Rebuilding
// ===================================================================

core::Result<NodeRef> rebuild(const Node& n, Context ctx,
                              const KeyTranslator* t) {
    std::vector<NodeRef> subs;
    subs.reserve(n.subs.size());
    for (const auto& s : n.subs) {
        ELMS_TRY_ASSIGN(sub, rebuild(*s, ctx, t));
        subs.push_back(std::move(sub));
    }

    if (n.is_raw_pkh()) {
        KeyHash hash = *n.raw_pkh;
        if (t) {
            ELMS_TRY_ASSIGN(mapped, t->pkh(hash));
            hash = mapped;
        }
        return make_raw_pkh(ctx, hash);
    }

    std::vector<PublicKey> keys;
    keys.reserve(n.keys.size());
    for (const auto& key : n.keys) {
        if (t) {
            ELMS_TRY_ASSIGN(mapped, t->pk(key));
            keys.push_back(std::move(mapped));
        } else {
            keys.push_back(key);
        }
    }
    return make_node(ctx, n.fragment, std::move(subs), std::move(keys),
                     n.data, n.k);
}

void collect_keys(const Node& n, std::vector<PublicKey>& keys,
                  std::vector<KeyHash>& hashes) {
    if (n.is_raw_pkh()) hashes.push_back(*n.raw_pkh);
    keys.insert(keys.end(), n.keys.begin(), n.keys.end());
    for (const auto& s : n.subs) collect_keys(*s, keys, hashes);
}

} // anonymous namespace

// ===================================================================
// Construction
// ===================================================================

core::Result<Miniscript> Miniscript::from_tree(const Tree& tree, Context ctx) {
    ELMS_TRY_ASSIGN(node, node_from_tree(tree, ctx));
    return Miniscript(std::move(node));
}

core::Result<Miniscript> Miniscript::from_str_insane(std::string_view s,
                                                     Context ctx) {
    ELMS_TRY_ASSIGN(tree, Tree::from_str(s));
    ELMS_TRY_ASSIGN(ms, from_tree(tree, ctx));
    ELMS_TRY_VOID(top_level_type_check(ms.node()));
    return ms;
}

core::Result<Miniscript> Miniscript::from_str(std::string_view s,
                                              Context ctx) {
    ELMS_TRY_ASSIGN(ms, from_str_insane(s, ctx));
    ELMS_TRY_VOID(ms.sanity_check());
    return ms;
}

core::Result<Miniscript> Miniscript::parse_insane(
    const primitives::script::Script& script, Context ctx) {
    ELMS_TRY_ASSIGN(tokens, lex(script));
    ELMS_TRY_ASSIGN(node, decode_tokens(tokens, ctx));
    ELMS_TRY_VOID(check_global_validity(ctx, *node));
    ELMS_TRY_VOID(top_level_type_check(*node));
    LOG_TRACE(core::LogCategory::MINISCRIPT,
              "decoded " + std::string(context_name(ctx)) + " script as " +
                  node_to_string(*node));
    return Miniscript(std::move(node));
}

core::Result<Miniscript> Miniscript::parse(
    const primitives::script::Script& script, Context ctx) {
    ELMS_TRY_ASSIGN(ms, parse_insane(script, ctx));
    ELMS_TRY_VOID(ms.sanity_check());
    return ms;
}

// ===================================================================
// Analysis
// ===================================================================

std::optional<size_t> Miniscript::max_satisfaction_witness_elements() const {
    auto elems = node_->max_sat_elements();
    if (!elems) return std::nullopt;
    return static_cast<size_t>(*elems) + 1;
}

bool Miniscript::has_repeated_keys() const {
    std::vector<PublicKey> keys;
    std::vector<KeyHash> hashes;
    collect_keys(*node_, keys, hashes);

    std::set<KeyHash> seen;
    for (const auto& key : keys) {
        if (!seen.insert(key.hash160()).second) return true;
    }
    for (const auto& hash : hashes) {
        if (!seen.insert(hash).second) return true;
    }
    return false;
}

core::Result<void> Miniscript::sanity_check() const {
    if (!requires_sig()) {
        return make_error(ErrorCode::SIG_FREE_PATH,
                          "a satisfaction path needs no signature: " +
                              to_string());
    }
    if (!is_non_malleable()) {
        return make_error(ErrorCode::MALLEABLE,
                          "malleable satisfaction exists: " + to_string());
    }
    ELMS_TRY_VOID(check_global_validity(context(), *node_));
    ELMS_TRY_VOID(check_local_validity(context(), *node_));
    if (has_repeated_keys()) {
        return make_error(ErrorCode::REPEATED_KEYS,
                          "repeated key in " + to_string());
    }
    if (has_mixed_timelocks()) {
        return make_error(ErrorCode::MIXED_TIMELOCKS,
                          "height and time locks mixed in " + to_string());
    }
    return core::make_ok();
}

// ===================================================================
// Keys
// ===================================================================

bool Miniscript::for_each_key(
    const std::function<bool(const PublicKey&)>& pred) const {
    std::vector<PublicKey> keys;
    std::vector<KeyHash> hashes;
    collect_keys(*node_, keys, hashes);
    for (const auto& key : keys) {
        if (!pred(key)) return false;
    }
    return true;
}

core::Result<Miniscript> Miniscript::translate(const KeyTranslator& t) const {
    ELMS_TRY_ASSIGN(node, rebuild(*node_, context(), &t));
    return Miniscript(std::move(node));
}

core::Result<Miniscript> Miniscript::to_no_checks() const {
    ELMS_TRY_ASSIGN(node, rebuild(*node_, Context::NO_CHECKS, nullptr));
    return Miniscript(std::move(node));
}

} // namespace miniscript
