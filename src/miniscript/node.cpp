// Copyright (c) 2024-2026 The ELMS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "miniscript/node.h"
#include "core/hex.h"

#include <algorithm>

namespace miniscript {

using primitives::script::Opcode;
using primitives::script::Script;

namespace {

/// BIP-68 type flag: set for time-based relative locks.
constexpr uint32_t SEQUENCE_LOCKTIME_TYPE_FLAG = 1u << 22;

/// nLockTime values at or above this are UNIX timestamps.
constexpr uint32_t LOCKTIME_THRESHOLD = 500'000'000;

size_t script_num_len(int64_t n) {
    Script s;
    s.push_int(n);
    return s.size();
}

// ===================================================================
// Argument validation
// ===================================================================

core::Result<void> check_shape(Fragment fragment, size_t n_subs,
                               size_t n_keys, size_t data_size, uint32_t k) {
    auto bad = [fragment](const std::string& what) {
        return core::make_error(core::ErrorCode::PARSE_ERROR,
                                std::string(fragment_name(fragment)) + ": " +
                                    what);
    };

    size_t want_subs = 0;
    switch (fragment) {
    case Fragment::WRAP_A: case Fragment::WRAP_S: case Fragment::WRAP_C:
    case Fragment::WRAP_D: case Fragment::WRAP_V: case Fragment::WRAP_J:
    case Fragment::WRAP_N:
        want_subs = 1;
        break;
    case Fragment::AND_V: case Fragment::AND_B: case Fragment::OR_B:
    case Fragment::OR_C: case Fragment::OR_D: case Fragment::OR_I:
        want_subs = 2;
        break;
    case Fragment::ANDOR:
        want_subs = 3;
        break;
    case Fragment::THRESH:
        want_subs = n_subs;
        if (n_subs == 0) return bad("no subexpressions");
        break;
    default:
        break;
    }
    if (n_subs != want_subs) return bad("wrong number of subexpressions");

    switch (fragment) {
    case Fragment::PK_K:
        if (n_keys != 1) return bad("expects exactly one key");
        break;
    case Fragment::PK_H:
        if (n_keys > 1) return bad("expects at most one key");
        break;
    case Fragment::MULTI:
        if (n_keys < 1 ||
            n_keys > static_cast<size_t>(
                         primitives::script::MAX_PUBKEYS_PER_MULTISIG)) {
            return bad("key count out of range");
        }
        break;
    case Fragment::MULTI_A:
        if (n_keys < 1 || n_keys > MAX_PUBKEYS_PER_MULTI_A) {
            return bad("key count out of range");
        }
        break;
    default:
        if (n_keys != 0) return bad("takes no keys");
        break;
    }

    switch (fragment) {
    case Fragment::SHA256: case Fragment::HASH256:
        if (data_size != 32) return bad("expects a 32-byte hash");
        break;
    case Fragment::RIPEMD160: case Fragment::HASH160:
        if (data_size != 20) return bad("expects a 20-byte hash");
        break;
    default:
        if (data_size != 0) return bad("takes no hash");
        break;
    }

    switch (fragment) {
    case Fragment::OLDER: case Fragment::AFTER:
        if (k < 1 || k >= 0x80000000u) {
            return core::make_error(core::ErrorCode::BAD_NUMBER,
                                    std::string(fragment_name(fragment)) +
                                        " value out of range: " +
                                        std::to_string(k));
        }
        break;
    case Fragment::MULTI: case Fragment::MULTI_A:
        if (k < 1 || k > n_keys) {
            return core::make_error(core::ErrorCode::BAD_NUMBER,
                                    "threshold " + std::to_string(k) +
                                        " out of range for " +
                                        std::to_string(n_keys) + " keys");
        }
        break;
    case Fragment::THRESH:
        if (k < 1 || k > n_subs) {
            return core::make_error(core::ErrorCode::BAD_NUMBER,
                                    "threshold " + std::to_string(k) +
                                        " out of range for " +
                                        std::to_string(n_subs) +
                                        " subexpressions");
        }
        break;
    default:
        if (k != 0) return bad("takes no number");
        break;
    }
    return core::make_ok();
}

// ===================================================================
// Type rules
// ===================================================================

/// k survives a combination unless one side locks on time and the other
/// on height for the same lock kind.
bool no_timelock_mix(Type x, Type y) {
    return !(((x << "g"_mst) && (y << "h"_mst)) ||
             ((x << "h"_mst) && (y << "g"_mst)) ||
             ((x << "i"_mst) && (y << "j"_mst)) ||
             ((x << "j"_mst) && (y << "i"_mst)));
}

Type compute_type(const Node& n) {
    const Type x = n.subs.size() > 0 ? n.subs[0]->type : Type();
    const Type y = n.subs.size() > 1 ? n.subs[1]->type : Type();
    const Type z = n.subs.size() > 2 ? n.subs[2]->type : Type();

    switch (n.fragment) {
    case Fragment::PK_K: return "Konudemsxk"_mst;
    case Fragment::PK_H: return "Knudemsxk"_mst;
    case Fragment::OLDER:
        return "g"_mst.only_if(n.k & SEQUENCE_LOCKTIME_TYPE_FLAG) |
               "h"_mst.only_if(!(n.k & SEQUENCE_LOCKTIME_TYPE_FLAG)) |
               "Bzfmxk"_mst;
    case Fragment::AFTER:
        return "i"_mst.only_if(n.k >= LOCKTIME_THRESHOLD) |
               "j"_mst.only_if(n.k < LOCKTIME_THRESHOLD) |
               "Bzfmxk"_mst;
    case Fragment::SHA256:
    case Fragment::RIPEMD160:
    case Fragment::HASH256:
    case Fragment::HASH160:
        return "Bonudmk"_mst;
    case Fragment::JUST_1: return "Bzufmxk"_mst;
    case Fragment::JUST_0: return "Bzudemsxk"_mst;
    case Fragment::WRAP_A:
        return "W"_mst.only_if(x << "B"_mst) |
               (x & "ghijk"_mst) |
               (x & "udfems"_mst) |
               "x"_mst;
    case Fragment::WRAP_S:
        return "W"_mst.only_if(x << "Bo"_mst) |
               (x & "ghijk"_mst) |
               (x & "udfemsx"_mst);
    case Fragment::WRAP_C:
        return "B"_mst.only_if(x << "K"_mst) |
               (x & "ghijk"_mst) |
               (x & "ondfem"_mst) |
               "us"_mst;
    case Fragment::WRAP_D:
        // Elements enforces MINIMALIF on segwit scripts, so d: is always u.
        return "B"_mst.only_if(x << "Vz"_mst) |
               "o"_mst.only_if(x << "z"_mst) |
               "e"_mst.only_if(x << "f"_mst) |
               (x & "ghijk"_mst) |
               (x & "ms"_mst) |
               "nudx"_mst;
    case Fragment::WRAP_V:
        return "V"_mst.only_if(x << "B"_mst) |
               (x & "ghijk"_mst) |
               (x & "zonms"_mst) |
               "fx"_mst;
    case Fragment::WRAP_J:
        return "B"_mst.only_if(x << "Bn"_mst) |
               "e"_mst.only_if(x << "f"_mst) |
               (x & "ghijk"_mst) |
               (x & "oums"_mst) |
               "ndx"_mst;
    case Fragment::WRAP_N:
        return (x & "ghijk"_mst) |
               (x & "Bzondfems"_mst) |
               "ux"_mst;
    case Fragment::AND_V:
        return (y & "KVB"_mst).only_if(x << "V"_mst) |
               (x & "n"_mst) | (y & "n"_mst).only_if(x << "z"_mst) |
               ((x | y) & "o"_mst).only_if((x | y) << "z"_mst) |
               (x & y & "dmz"_mst) |
               ((x | y) & "s"_mst) |
               "f"_mst.only_if((y << "f"_mst) || (x << "s"_mst)) |
               (y & "ux"_mst) |
               ((x | y) & "ghij"_mst) |
               "k"_mst.only_if(((x & y) << "k"_mst) && no_timelock_mix(x, y));
    case Fragment::AND_B:
        return (x & "B"_mst).only_if(y << "W"_mst) |
               ((x | y) & "o"_mst).only_if((x | y) << "z"_mst) |
               (x & "n"_mst) | (y & "n"_mst).only_if(x << "z"_mst) |
               (x & y & "e"_mst).only_if((x & y) << "s"_mst) |
               (x & y & "dzm"_mst) |
               "f"_mst.only_if(((x & y) << "f"_mst) || (x << "sf"_mst) ||
                               (y << "sf"_mst)) |
               ((x | y) & "s"_mst) |
               "ux"_mst |
               ((x | y) & "ghij"_mst) |
               "k"_mst.only_if(((x & y) << "k"_mst) && no_timelock_mix(x, y));
    case Fragment::OR_B:
        return "B"_mst.only_if(x << "Bd"_mst && y << "Wd"_mst) |
               ((x | y) & "o"_mst).only_if((x | y) << "z"_mst) |
               (x & y & "m"_mst).only_if((x | y) << "s"_mst &&
                                         (x & y) << "e"_mst) |
               (x & y & "zse"_mst) |
               "dux"_mst |
               ((x | y) & "ghij"_mst) |
               (x & y & "k"_mst);
    case Fragment::OR_D:
        return (y & "B"_mst).only_if(x << "Bdu"_mst) |
               (x & "o"_mst).only_if(y << "z"_mst) |
               (x & y & "m"_mst).only_if(x << "e"_mst && (x | y) << "s"_mst) |
               (x & y & "zes"_mst) |
               (y & "ufd"_mst) |
               "x"_mst |
               ((x | y) & "ghij"_mst) |
               (x & y & "k"_mst);
    case Fragment::OR_C:
        return (y & "V"_mst).only_if(x << "Bdu"_mst) |
               (x & "o"_mst).only_if(y << "z"_mst) |
               (x & y & "m"_mst).only_if(x << "e"_mst && (x | y) << "s"_mst) |
               (x & y & "zs"_mst) |
               "fx"_mst |
               ((x | y) & "ghij"_mst) |
               (x & y & "k"_mst);
    case Fragment::OR_I:
        return (x & y & "VBKufs"_mst) |
               "o"_mst.only_if((x & y) << "z"_mst) |
               ((x | y) & "e"_mst).only_if((x | y) << "f"_mst) |
               (x & y & "m"_mst).only_if((x | y) << "s"_mst) |
               ((x | y) & "d"_mst) |
               "x"_mst |
               ((x | y) & "ghij"_mst) |
               (x & y & "k"_mst);
    case Fragment::ANDOR:
        return (y & z & "BKV"_mst).only_if(x << "Bdu"_mst) |
               (x & y & z & "z"_mst) |
               ((x | (y & z)) & "o"_mst).only_if((x | (y & z)) << "z"_mst) |
               (y & z & "u"_mst) |
               (z & "f"_mst).only_if((x << "s"_mst) || (y << "f"_mst)) |
               (z & "d"_mst) |
               (z & "e"_mst).only_if((x << "s"_mst) || (y << "f"_mst)) |
               (x & y & z & "m"_mst).only_if(x << "e"_mst &&
                                             (x | y | z) << "s"_mst) |
               (z & (x | y) & "s"_mst) |
               "x"_mst |
               ((x | y | z) & "ghij"_mst) |
               "k"_mst.only_if(((x & y & z) << "k"_mst) &&
                               no_timelock_mix(x, y));
    case Fragment::MULTI: return "Bnudemsk"_mst;
    case Fragment::MULTI_A: return "Budemsk"_mst;
    case Fragment::THRESH: {
        bool all_e = true;
        bool all_m = true;
        uint32_t args = 0;
        uint32_t num_s = 0;
        Type acc_tl = "k"_mst;
        for (size_t i = 0; i < n.subs.size(); ++i) {
            const Type t = n.subs[i]->type;
            if (!(t << (i ? "Wdu"_mst : "Bdu"_mst))) return Type();
            if (!(t << "e"_mst)) all_e = false;
            if (!(t << "m"_mst)) all_m = false;
            if (t << "s"_mst) num_s += 1;
            args += (t << "z"_mst) ? 0 : (t << "o"_mst) ? 1 : 2;
            acc_tl = ((acc_tl | t) & "ghij"_mst) |
                     "k"_mst.only_if(((acc_tl & t) << "k"_mst) &&
                                     (n.k <= 1 || no_timelock_mix(acc_tl, t)));
        }
        const auto n_subs = static_cast<uint32_t>(n.subs.size());
        return "Bdu"_mst |
               "z"_mst.only_if(args == 0) |
               "o"_mst.only_if(args == 1) |
               "e"_mst.only_if(all_e && num_s == n_subs) |
               "m"_mst.only_if(all_e && all_m && num_s >= n_subs - n.k) |
               "s"_mst.only_if(num_s >= n_subs - n.k + 1) |
               acc_tl;
    }
    }
    return Type();
}

// ===================================================================
// Op counts
// ===================================================================

Ops compute_ops(const Node& n) {
    using M = MaxInt<uint32_t>;
    const auto nkeys = static_cast<uint32_t>(n.keys.size());
    auto sub = [&n](size_t i) -> const Ops& { return n.subs[i]->ops; };

    switch (n.fragment) {
    case Fragment::JUST_1: return {0, 0, {}};
    case Fragment::JUST_0: return {0, {}, 0};
    case Fragment::PK_K: return {0, 0, 0};
    case Fragment::PK_H: return {3, 0, 0};
    case Fragment::OLDER:
    case Fragment::AFTER: return {1, 0, {}};
    case Fragment::SHA256:
    case Fragment::RIPEMD160:
    case Fragment::HASH256:
    case Fragment::HASH160: return {4, 0, {}};
    case Fragment::AND_V:
        return {sub(0).count + sub(1).count, sub(0).sat + sub(1).sat, {}};
    case Fragment::AND_B:
        return {1 + sub(0).count + sub(1).count,
                sub(0).sat + sub(1).sat,
                sub(0).dsat + sub(1).dsat};
    case Fragment::OR_B:
        return {1 + sub(0).count + sub(1).count,
                (sub(0).sat + sub(1).dsat) | (sub(1).sat + sub(0).dsat),
                sub(0).dsat + sub(1).dsat};
    case Fragment::OR_D:
        return {3 + sub(0).count + sub(1).count,
                sub(0).sat | (sub(1).sat + sub(0).dsat),
                sub(0).dsat + sub(1).dsat};
    case Fragment::OR_C:
        return {2 + sub(0).count + sub(1).count,
                sub(0).sat | (sub(1).sat + sub(0).dsat),
                {}};
    case Fragment::OR_I:
        return {3 + sub(0).count + sub(1).count,
                sub(0).sat | sub(1).sat,
                sub(0).dsat | sub(1).dsat};
    case Fragment::ANDOR:
        return {3 + sub(0).count + sub(1).count + sub(2).count,
                (sub(1).sat + sub(0).sat) | (sub(0).dsat + sub(2).sat),
                sub(0).dsat + sub(2).dsat};
    case Fragment::MULTI: return {1, nkeys, nkeys};
    case Fragment::MULTI_A: return {nkeys + 1, 0, 0};
    case Fragment::WRAP_S:
    case Fragment::WRAP_C:
    case Fragment::WRAP_N:
        return {1 + sub(0).count, sub(0).sat, sub(0).dsat};
    case Fragment::WRAP_A:
        return {2 + sub(0).count, sub(0).sat, sub(0).dsat};
    case Fragment::WRAP_D:
        return {3 + sub(0).count, sub(0).sat, 0};
    case Fragment::WRAP_J:
        return {4 + sub(0).count, sub(0).sat, 0};
    case Fragment::WRAP_V:
        return {sub(0).count + (n.subs[0]->type << "x"_mst ? 1u : 0u),
                sub(0).sat, {}};
    case Fragment::THRESH: {
        uint32_t count = 0;
        std::vector<M> sats{M(0)};
        for (const auto& s : n.subs) {
            count += s->ops.count + 1;
            std::vector<M> next{sats[0] + s->ops.dsat};
            for (size_t j = 1; j < sats.size(); ++j) {
                next.push_back((sats[j] + s->ops.dsat) |
                               (sats[j - 1] + s->ops.sat));
            }
            next.push_back(sats.back() + s->ops.sat);
            sats = std::move(next);
        }
        return {count, sats[n.k], sats[0]};
    }
    }
    return {};
}

// ===================================================================
// Satisfaction cost tables
// ===================================================================
// The same combination rules apply to stack element counts, witness bytes
// and scriptSig bytes.  Only the leaves differ, together with the cost of
// the constant 1 and 0 that or_i, d: and j: place on the stack.

struct ConstCost {
    uint32_t one;
    uint32_t zero;
};

/// Combine the children's figures for @p n; @p pick selects which table of a
/// child to read and @p leaf holds the figures of a terminal.
template <typename Pick>
SatInfo combine_with(const Node& n, const SatInfo& leaf, ConstCost c,
                     Pick pick) {
    using M = MaxInt<uint32_t>;
    auto x = [&]() -> const SatInfo& { return pick(*n.subs[0]); };
    auto y = [&]() -> const SatInfo& { return pick(*n.subs[1]); };
    auto z = [&]() -> const SatInfo& { return pick(*n.subs[2]); };

    switch (n.fragment) {
    case Fragment::ANDOR:
        return {(x().sat + y().sat) | (x().dsat + z().sat),
                x().dsat + z().dsat};
    case Fragment::AND_V:
        return {x().sat + y().sat, {}};
    case Fragment::AND_B:
        return {x().sat + y().sat, x().dsat + y().dsat};
    case Fragment::OR_B:
        return {(x().dsat + y().sat) | (x().sat + y().dsat),
                x().dsat + y().dsat};
    case Fragment::OR_C:
        return {x().sat | (x().dsat + y().sat), {}};
    case Fragment::OR_D:
        return {x().sat | (x().dsat + y().sat), x().dsat + y().dsat};
    case Fragment::OR_I:
        return {(x().sat + M(c.one)) | (y().sat + M(c.zero)),
                (x().dsat + M(c.one)) | (y().dsat + M(c.zero))};
    case Fragment::WRAP_A:
    case Fragment::WRAP_S:
    case Fragment::WRAP_C:
    case Fragment::WRAP_N:
        return x();
    case Fragment::WRAP_D:
        return {x().sat + M(c.one), M(c.zero)};
    case Fragment::WRAP_V:
        return {x().sat, {}};
    case Fragment::WRAP_J:
        return {x().sat, M(c.zero)};
    case Fragment::THRESH: {
        std::vector<M> sats{M(0)};
        for (const auto& s : n.subs) {
            const SatInfo& si = pick(*s);
            std::vector<M> next{sats[0] + si.dsat};
            for (size_t j = 1; j < sats.size(); ++j) {
                next.push_back((sats[j] + si.dsat) | (sats[j - 1] + si.sat));
            }
            next.push_back(sats.back() + si.sat);
            sats = std::move(next);
        }
        return {sats[n.k], sats[0]};
    }
    default:
        return leaf;
    }
}

SatInfo leaf_stack(const Node& n) {
    using M = MaxInt<uint32_t>;
    const auto nkeys = static_cast<uint32_t>(n.keys.size());
    switch (n.fragment) {
    case Fragment::JUST_0: return {{}, M(0)};
    case Fragment::JUST_1:
    case Fragment::OLDER:
    case Fragment::AFTER: return {M(0), {}};
    case Fragment::PK_K: return {M(1), M(1)};
    case Fragment::PK_H: return {M(2), M(2)};
    case Fragment::SHA256:
    case Fragment::RIPEMD160:
    case Fragment::HASH256:
    case Fragment::HASH160: return {M(1), M(1)};
    case Fragment::MULTI: return {M(n.k + 1), M(n.k + 1)};
    case Fragment::MULTI_A: return {M(nkeys), M(nkeys)};
    default: return {};
    }
}

/// Push size of the key a pk_h satisfaction reveals.  When only the hash is
/// known the largest key the context admits is assumed.
uint32_t pkh_key_size(const Node& n) {
    if (!n.keys.empty()) return static_cast<uint32_t>(n.keys[0].serialized_len());
    switch (n.ctx) {
    case Context::TAP: return 33;
    case Context::SEGWITV0: return 34;
    default: return 66;
    }
}

SatInfo leaf_size(const Node& n) {
    using M = MaxInt<uint32_t>;
    const auto sig = static_cast<uint32_t>(max_sig_push_size(n.ctx));
    const auto nkeys = static_cast<uint32_t>(n.keys.size());
    switch (n.fragment) {
    case Fragment::JUST_0: return {{}, M(0)};
    case Fragment::JUST_1:
    case Fragment::OLDER:
    case Fragment::AFTER: return {M(0), {}};
    case Fragment::PK_K: return {M(sig), M(1)};
    case Fragment::PK_H: {
        const uint32_t key = pkh_key_size(n);
        return {M(sig + key), M(1 + key)};
    }
    case Fragment::SHA256:
    case Fragment::RIPEMD160:
    case Fragment::HASH256:
    case Fragment::HASH160: return {M(33), M(33)};
    case Fragment::MULTI: return {M(1 + sig * n.k), M(1 + n.k)};
    case Fragment::MULTI_A:
        return {M((nkeys - n.k) + sig * n.k), M(nkeys)};
    default: return {};
    }
}

// ===================================================================
// Script length
// ===================================================================

size_t compute_script_len(const Node& n) {
    size_t subsize = 0;
    for (const auto& s : n.subs) subsize += s->script_len;

    switch (n.fragment) {
    case Fragment::JUST_1:
    case Fragment::JUST_0: return 1;
    case Fragment::PK_K: return n.keys[0].serialized_len();
    case Fragment::PK_H: return 3 + 21;
    case Fragment::OLDER:
    case Fragment::AFTER: return 1 + script_num_len(n.k);
    case Fragment::HASH256:
    case Fragment::SHA256: return 4 + 2 + 33;
    case Fragment::HASH160:
    case Fragment::RIPEMD160: return 4 + 2 + 21;
    case Fragment::MULTI: {
        size_t len = 1 + script_num_len(static_cast<int64_t>(n.keys.size())) +
                     script_num_len(n.k);
        for (const auto& key : n.keys) len += key.serialized_len();
        return len;
    }
    case Fragment::MULTI_A: {
        size_t len = script_num_len(n.k) + 1;
        for (const auto& key : n.keys) len += key.serialized_len() + 1;
        return len;
    }
    case Fragment::AND_V: return subsize;
    case Fragment::WRAP_V:
        return subsize + (n.subs[0]->type << "x"_mst ? 1 : 0);
    case Fragment::WRAP_S:
    case Fragment::WRAP_C:
    case Fragment::WRAP_N:
    case Fragment::AND_B:
    case Fragment::OR_B: return subsize + 1;
    case Fragment::WRAP_A:
    case Fragment::OR_C: return subsize + 2;
    case Fragment::WRAP_D:
    case Fragment::OR_D:
    case Fragment::OR_I:
    case Fragment::ANDOR: return subsize + 3;
    case Fragment::WRAP_J: return subsize + 4;
    case Fragment::THRESH:
        return subsize + n.subs.size() + script_num_len(n.k);
    }
    return subsize;
}

std::string join_types(const std::vector<NodeRef>& subs) {
    std::string out;
    for (size_t i = 0; i < subs.size(); ++i) {
        if (i) out += ",";
        out += subs[i]->type.to_string();
    }
    return out;
}

// ===================================================================
// Encoding
// ===================================================================

void encode_into(const Node& n, Script& out) {
    switch (n.fragment) {
    case Fragment::JUST_0:
        out.push_opcode(Opcode::OP_0);
        return;
    case Fragment::JUST_1:
        out.push_opcode(Opcode::OP_1);
        return;
    case Fragment::PK_K:
        out.push_data(n.keys[0].span());
        return;
    case Fragment::PK_H:
        out.push_opcode(Opcode::OP_DUP).push_opcode(Opcode::OP_HASH160);
        out.push_data(n.pkh_hash().hash.span());
        out.push_opcode(Opcode::OP_EQUALVERIFY);
        return;
    case Fragment::OLDER:
        out.push_int(n.k).push_opcode(Opcode::OP_CHECKSEQUENCEVERIFY);
        return;
    case Fragment::AFTER:
        out.push_int(n.k).push_opcode(Opcode::OP_CHECKLOCKTIMEVERIFY);
        return;
    case Fragment::SHA256:
    case Fragment::HASH256:
    case Fragment::RIPEMD160:
    case Fragment::HASH160: {
        Opcode op = Opcode::OP_SHA256;
        if (n.fragment == Fragment::HASH256) op = Opcode::OP_HASH256;
        if (n.fragment == Fragment::RIPEMD160) op = Opcode::OP_RIPEMD160;
        if (n.fragment == Fragment::HASH160) op = Opcode::OP_HASH160;
        out.push_opcode(Opcode::OP_SIZE).push_int(32)
           .push_opcode(Opcode::OP_EQUALVERIFY).push_opcode(op);
        out.push_data(n.data);
        out.push_opcode(Opcode::OP_EQUAL);
        return;
    }
    case Fragment::WRAP_A:
        out.push_opcode(Opcode::OP_TOALTSTACK);
        encode_into(*n.subs[0], out);
        out.push_opcode(Opcode::OP_FROMALTSTACK);
        return;
    case Fragment::WRAP_S:
        out.push_opcode(Opcode::OP_SWAP);
        encode_into(*n.subs[0], out);
        return;
    case Fragment::WRAP_C:
        encode_into(*n.subs[0], out);
        out.push_opcode(Opcode::OP_CHECKSIG);
        return;
    case Fragment::WRAP_D:
        out.push_opcode(Opcode::OP_DUP).push_opcode(Opcode::OP_IF);
        encode_into(*n.subs[0], out);
        out.push_opcode(Opcode::OP_ENDIF);
        return;
    case Fragment::WRAP_V: {
        encode_into(*n.subs[0], out);
        std::optional<Opcode> twin;
        if (n.subs[0]->has_free_verify() && !out.empty()) {
            twin = primitives::script::verify_variant(
                static_cast<Opcode>(out.data().back()));
        }
        if (twin) {
            out.set_last_opcode(*twin);
        } else {
            out.push_opcode(Opcode::OP_VERIFY);
        }
        return;
    }
    case Fragment::WRAP_J:
        out.push_opcode(Opcode::OP_SIZE).push_opcode(Opcode::OP_0NOTEQUAL)
           .push_opcode(Opcode::OP_IF);
        encode_into(*n.subs[0], out);
        out.push_opcode(Opcode::OP_ENDIF);
        return;
    case Fragment::WRAP_N:
        encode_into(*n.subs[0], out);
        out.push_opcode(Opcode::OP_0NOTEQUAL);
        return;
    case Fragment::AND_V:
        encode_into(*n.subs[0], out);
        encode_into(*n.subs[1], out);
        return;
    case Fragment::AND_B:
        encode_into(*n.subs[0], out);
        encode_into(*n.subs[1], out);
        out.push_opcode(Opcode::OP_BOOLAND);
        return;
    case Fragment::OR_B:
        encode_into(*n.subs[0], out);
        encode_into(*n.subs[1], out);
        out.push_opcode(Opcode::OP_BOOLOR);
        return;
    case Fragment::OR_C:
        encode_into(*n.subs[0], out);
        out.push_opcode(Opcode::OP_NOTIF);
        encode_into(*n.subs[1], out);
        out.push_opcode(Opcode::OP_ENDIF);
        return;
    case Fragment::OR_D:
        encode_into(*n.subs[0], out);
        out.push_opcode(Opcode::OP_IFDUP).push_opcode(Opcode::OP_NOTIF);
        encode_into(*n.subs[1], out);
        out.push_opcode(Opcode::OP_ENDIF);
        return;
    case Fragment::OR_I:
        out.push_opcode(Opcode::OP_IF);
        encode_into(*n.subs[0], out);
        out.push_opcode(Opcode::OP_ELSE);
        encode_into(*n.subs[1], out);
        out.push_opcode(Opcode::OP_ENDIF);
        return;
    case Fragment::ANDOR:
        encode_into(*n.subs[0], out);
        out.push_opcode(Opcode::OP_NOTIF);
        encode_into(*n.subs[2], out);
        out.push_opcode(Opcode::OP_ELSE);
        encode_into(*n.subs[1], out);
        out.push_opcode(Opcode::OP_ENDIF);
        return;
    case Fragment::THRESH:
        for (size_t i = 0; i < n.subs.size(); ++i) {
            encode_into(*n.subs[i], out);
            if (i) out.push_opcode(Opcode::OP_ADD);
        }
        out.push_int(n.k).push_opcode(Opcode::OP_EQUAL);
        return;
    case Fragment::MULTI:
        out.push_int(n.k);
        for (const auto& key : n.keys) out.push_data(key.span());
        out.push_int(static_cast<int64_t>(n.keys.size()))
           .push_opcode(Opcode::OP_CHECKMULTISIG);
        return;
    case Fragment::MULTI_A:
        for (size_t i = 0; i < n.keys.size(); ++i) {
            out.push_data(n.keys[i].span());
            out.push_opcode(i == 0 ? Opcode::OP_CHECKSIG
                                   : Opcode::OP_CHECKSIGADD);
        }
        out.push_int(n.k).push_opcode(Opcode::OP_NUMEQUAL);
        return;
    }
}

// ===================================================================
// Text
// ===================================================================

std::string to_string_impl(const Node& n, bool wrapped) {
    const std::string pfx = wrapped ? ":" : "";
    auto sub = [&n](size_t i) { return to_string_impl(*n.subs[i], false); };
    auto wrap = [&n](const char* letter, size_t i) {
        return letter + to_string_impl(*n.subs[i], true);
    };

    switch (n.fragment) {
    case Fragment::WRAP_A: return wrap("a", 0);
    case Fragment::WRAP_S: return wrap("s", 0);
    case Fragment::WRAP_C: {
        const Node& inner = *n.subs[0];
        if (inner.fragment == Fragment::PK_K) {
            return pfx + "pk(" + inner.keys[0].to_string() + ")";
        }
        if (inner.fragment == Fragment::PK_H && !inner.is_raw_pkh()) {
            return pfx + "pkh(" + inner.keys[0].to_string() + ")";
        }
        return wrap("c", 0);
    }
    case Fragment::WRAP_D: return wrap("d", 0);
    case Fragment::WRAP_V: return wrap("v", 0);
    case Fragment::WRAP_J: return wrap("j", 0);
    case Fragment::WRAP_N: return wrap("n", 0);
    case Fragment::AND_V:
        if (n.subs[1]->fragment == Fragment::JUST_1) return wrap("t", 0);
        break;
    case Fragment::OR_I:
        if (n.subs[0]->fragment == Fragment::JUST_0) return wrap("l", 1);
        if (n.subs[1]->fragment == Fragment::JUST_0) return wrap("u", 0);
        break;
    default:
        break;
    }

    switch (n.fragment) {
    case Fragment::JUST_0: return pfx + "0";
    case Fragment::JUST_1: return pfx + "1";
    case Fragment::PK_K: return pfx + "pk_k(" + n.keys[0].to_string() + ")";
    case Fragment::PK_H:
        if (n.is_raw_pkh()) {
            return pfx + "expr_raw_pkh(" + n.raw_pkh->to_string() + ")";
        }
        return pfx + "pk_h(" + n.keys[0].to_string() + ")";
    case Fragment::OLDER:
    case Fragment::AFTER:
        return pfx + std::string(fragment_name(n.fragment)) + "(" +
               std::to_string(n.k) + ")";
    case Fragment::SHA256:
    case Fragment::HASH256:
    case Fragment::RIPEMD160:
    case Fragment::HASH160:
        return pfx + std::string(fragment_name(n.fragment)) + "(" +
               core::to_hex(n.data) + ")";
    case Fragment::ANDOR:
        if (n.subs[2]->fragment == Fragment::JUST_0) {
            return pfx + "and_n(" + sub(0) + "," + sub(1) + ")";
        }
        return pfx + "andor(" + sub(0) + "," + sub(1) + "," + sub(2) + ")";
    case Fragment::MULTI:
    case Fragment::MULTI_A: {
        std::string out = pfx + std::string(fragment_name(n.fragment)) + "(" +
                          std::to_string(n.k);
        for (const auto& key : n.keys) out += "," + key.to_string();
        return out + ")";
    }
    case Fragment::THRESH: {
        std::string out = pfx + "thresh(" + std::to_string(n.k);
        for (size_t i = 0; i < n.subs.size(); ++i) out += "," + sub(i);
        return out + ")";
    }
    default: {
        // Binary combinators.
        return pfx + std::string(fragment_name(n.fragment)) + "(" + sub(0) +
               "," + sub(1) + ")";
    }
    }
}

} // anonymous namespace

// ===================================================================
// Node queries
// ===================================================================

KeyHash Node::pkh_hash() const {
    if (raw_pkh) return *raw_pkh;
    return keys.at(0).hash160();
}

std::optional<uint32_t> Node::ops_count_sat() const {
    if (!ops.sat.valid) return std::nullopt;
    return ops.count + ops.sat.value;
}

// ===================================================================
// Construction
// ===================================================================

namespace {

core::Result<NodeRef> finish_node(std::shared_ptr<Node> node) {
    for (const auto& sub : node->subs) {
        node->tree_height = std::max(node->tree_height, sub->tree_height + 1);
    }
    if (node->tree_height > MAX_RECURSION_DEPTH) {
        return core::make_error(
            core::ErrorCode::PARSE_ERROR,
            "expression nesting exceeds " +
                std::to_string(MAX_RECURSION_DEPTH) + " levels");
    }

    node->type = sanitize_type(compute_type(*node));
    if (node->type == Type()) {
        return core::make_error(
            core::ErrorCode::TYPE_CHECK,
            std::string(fragment_name(node->fragment)) + " over [" +
                join_types(node->subs) + "] has no valid type");
    }
    node->ops = compute_ops(*node);
    node->script_len = compute_script_len(*node);

    const ConstCost count_cost{1, 1};
    const ConstCost witness_cost{2, 1};   // [0x01] and [] with length bytes
    const ConstCost script_sig_cost{1, 1};  // OP_1 and OP_0
    node->stack = combine_with(*node, leaf_stack(*node), count_cost,
                               [](const Node& c) -> const SatInfo& {
                                   return c.stack;
                               });
    const SatInfo leaf = leaf_size(*node);
    node->witness_size = combine_with(*node, leaf, witness_cost,
                                      [](const Node& c) -> const SatInfo& {
                                          return c.witness_size;
                                      });
    node->script_sig_size = combine_with(
        *node, leaf, script_sig_cost,
        [](const Node& c) -> const SatInfo& { return c.script_sig_size; });

    ELMS_TRY_VOID(check_terminal(node->ctx, *node));
    ELMS_TRY_VOID(check_global_consensus_validity(node->ctx, *node));
    return NodeRef(std::move(node));
}

} // anonymous namespace

core::Result<NodeRef> make_node(Context ctx, Fragment fragment,
                                std::vector<NodeRef> subs,
                                std::vector<PublicKey> keys,
                                std::vector<uint8_t> data, uint32_t k) {
    ELMS_TRY_VOID(check_shape(fragment, subs.size(), keys.size(),
                              data.size(), k));
    if (fragment == Fragment::PK_H && keys.empty()) {
        return core::make_error(core::ErrorCode::PARSE_ERROR,
                                "pk_h needs a key; use make_raw_pkh");
    }
    for (const auto& s : subs) {
        if (!s) {
            return core::make_error(core::ErrorCode::INTERNAL_ERROR,
                                    "null subexpression");
        }
    }

    auto node = std::make_shared<Node>();
    node->fragment = fragment;
    node->ctx = ctx;
    node->k = k;
    node->keys = std::move(keys);
    node->data = std::move(data);
    node->subs = std::move(subs);
    return finish_node(std::move(node));
}

core::Result<NodeRef> make_raw_pkh(Context ctx, const KeyHash& hash) {
    auto node = std::make_shared<Node>();
    node->fragment = Fragment::PK_H;
    node->ctx = ctx;
    node->raw_pkh = hash;
    return finish_node(std::move(node));
}

bool node_equal(const Node& a, const Node& b) {
    if (a.fragment != b.fragment || a.ctx != b.ctx || a.k != b.k ||
        a.keys != b.keys || a.raw_pkh != b.raw_pkh || a.data != b.data ||
        a.subs.size() != b.subs.size()) {
        return false;
    }
    for (size_t i = 0; i < a.subs.size(); ++i) {
        if (!node_equal(*a.subs[i], *b.subs[i])) return false;
    }
    return true;
}

// ===================================================================
// Rendering
// ===================================================================

Script encode_node(const Node& node) {
    Script out;
    encode_into(node, out);
    return out;
}

std::string node_to_string(const Node& node) {
    return to_string_impl(node, false);
}

std::string_view fragment_name(Fragment fragment) noexcept {
    switch (fragment) {
    case Fragment::JUST_0:    return "0";
    case Fragment::JUST_1:    return "1";
    case Fragment::PK_K:      return "pk_k";
    case Fragment::PK_H:      return "pk_h";
    case Fragment::OLDER:     return "older";
    case Fragment::AFTER:     return "after";
    case Fragment::SHA256:    return "sha256";
    case Fragment::HASH256:   return "hash256";
    case Fragment::RIPEMD160: return "ripemd160";
    case Fragment::HASH160:   return "hash160";
    case Fragment::WRAP_A:    return "a";
    case Fragment::WRAP_S:    return "s";
    case Fragment::WRAP_C:    return "c";
    case Fragment::WRAP_D:    return "d";
    case Fragment::WRAP_V:    return "v";
    case Fragment::WRAP_J:    return "j";
    case Fragment::WRAP_N:    return "n";
    case Fragment::AND_V:     return "and_v";
    case Fragment::AND_B:     return "and_b";
    case Fragment::OR_B:      return "or_b";
    case Fragment::OR_C:      return "or_c";
    case Fragment::OR_D:      return "or_d";
    case Fragment::OR_I:      return "or_i";
    case Fragment::ANDOR:     return "andor";
    case Fragment::THRESH:    return "thresh";
    case Fragment::MULTI:     return "multi";
    case Fragment::MULTI_A:   return "multi_a";
    }
    return "unknown";
}

} // namespace miniscript
