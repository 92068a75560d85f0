#pragma once
// Copyright (c) 2024-2026 The ELMS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "miniscript/context.h"
#include "miniscript/key.h"
#include "miniscript/types.h"
#include "primitives/script/script.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace miniscript {

// ---------------------------------------------------------------------------
// Fragments
// ---------------------------------------------------------------------------
// Script templates use [X] for the encoding of a subexpression.
// ---------------------------------------------------------------------------
enum class Fragment : uint8_t {
    JUST_0,     // OP_0
    JUST_1,     // OP_1
    PK_K,       // <key>
    PK_H,       // OP_DUP OP_HASH160 <keyhash> OP_EQUALVERIFY
    OLDER,      // <k> OP_CHECKSEQUENCEVERIFY
    AFTER,      // <k> OP_CHECKLOCKTIMEVERIFY
    SHA256,     // OP_SIZE 32 OP_EQUALVERIFY OP_SHA256 <h> OP_EQUAL
    HASH256,    // OP_SIZE 32 OP_EQUALVERIFY OP_HASH256 <h> OP_EQUAL
    RIPEMD160,  // OP_SIZE 32 OP_EQUALVERIFY OP_RIPEMD160 <h> OP_EQUAL
    HASH160,    // OP_SIZE 32 OP_EQUALVERIFY OP_HASH160 <h> OP_EQUAL
    WRAP_A,     // OP_TOALTSTACK [X] OP_FROMALTSTACK
    WRAP_S,     // OP_SWAP [X]
    WRAP_C,     // [X] OP_CHECKSIG
    WRAP_D,     // OP_DUP OP_IF [X] OP_ENDIF
    WRAP_V,     // [X] OP_VERIFY, or the VERIFY twin of X's last opcode
    WRAP_J,     // OP_SIZE OP_0NOTEQUAL OP_IF [X] OP_ENDIF
    WRAP_N,     // [X] OP_0NOTEQUAL
    AND_V,      // [X] [Y]
    AND_B,      // [X] [Y] OP_BOOLAND
    OR_B,       // [X] [Y] OP_BOOLOR
    OR_C,       // [X] OP_NOTIF [Y] OP_ENDIF
    OR_D,       // [X] OP_IFDUP OP_NOTIF [Y] OP_ENDIF
    OR_I,       // OP_IF [X] OP_ELSE [Y] OP_ENDIF
    ANDOR,      // [X] OP_NOTIF [Z] OP_ELSE [Y] OP_ENDIF
    THRESH,     // [X1] ([Xn] OP_ADD)* <k> OP_EQUAL
    MULTI,      // <k> <keys...> <n> OP_CHECKMULTISIG
    MULTI_A,    // <key1> OP_CHECKSIG (<keyn> OP_CHECKSIGADD)* <k> OP_NUMEQUAL
};

struct Node;
using NodeRef = std::shared_ptr<const Node>;

/// Deepest expression accepted from text or script.  Every recursive walk
/// over a node (encoding, typing, satisfaction, destruction) is bounded by
/// it.
inline constexpr uint32_t MAX_RECURSION_DEPTH = 402;

// ---------------------------------------------------------------------------
// Node -- one immutable Miniscript expression
// ---------------------------------------------------------------------------
// Nodes are built only through make_node(), which fills in the derived
// fields below and rejects expressions that do not type check or that the
// context does not admit.  Children are shared, never mutated.
// ---------------------------------------------------------------------------
struct Node {
    Fragment fragment = Fragment::JUST_0;
    Context ctx = Context::NO_CHECKS;

    /// Threshold for THRESH/MULTI/MULTI_A, lock value for OLDER/AFTER.
    uint32_t k = 0;

    /// PK_K: one key.  PK_H: one key, or empty when only the hash is known.
    /// MULTI/MULTI_A: the keys in script order.
    std::vector<PublicKey> keys;

    /// PK_H decoded from a script, where only the key hash is known.
    std::optional<KeyHash> raw_pkh;

    /// Hash fragments: the digest, in the byte order it is pushed.
    std::vector<uint8_t> data;

    std::vector<NodeRef> subs;

    // -- Derived ------------------------------------------------------------

    Type type;
    Ops ops;
    size_t script_len = 0;

    /// Longest path to a leaf; leaves are 0.
    uint32_t tree_height = 0;

    /// Witness stack elements consumed by a (dis)satisfaction.
    SatInfo stack;

    /// Witness bytes of a (dis)satisfaction, each element counted with
    /// its length prefix.
    SatInfo witness_size;

    /// scriptSig bytes of the same (dis)satisfaction, each element counted
    /// with its push opcode.
    SatInfo script_sig_size;

    // -- Queries --------------------------------------------------------------

    [[nodiscard]] bool is_raw_pkh() const noexcept {
        return fragment == Fragment::PK_H && keys.empty();
    }

    /// The key hash a PK_H fragment commits to.
    [[nodiscard]] KeyHash pkh_hash() const;

    /// True when the script ends in an opcode with a VERIFY twin, so a
    /// wrapping v: costs no extra opcode.
    [[nodiscard]] bool has_free_verify() const noexcept {
        return !(type << "x"_mst);
    }

    /// Static op count plus the worst satisfaction's executed key count.
    [[nodiscard]] std::optional<uint32_t> ops_count_sat() const;

    [[nodiscard]] std::optional<uint32_t> max_sat_elements() const {
        return stack.sat.get();
    }
};

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

/// Build, type check and context check a node.  Fails with TYPE_CHECK when
/// the subexpressions do not combine into a valid type, and with the
/// context's error when a key, fragment or script size is not admissible.
core::Result<NodeRef> make_node(Context ctx, Fragment fragment,
                                std::vector<NodeRef> subs = {},
                                std::vector<PublicKey> keys = {},
                                std::vector<uint8_t> data = {},
                                uint32_t k = 0);

/// PK_H whose key is unknown (recovered from a script).
core::Result<NodeRef> make_raw_pkh(Context ctx, const KeyHash& hash);

/// Structural equality, context included.
[[nodiscard]] bool node_equal(const Node& a, const Node& b);

// ---------------------------------------------------------------------------
// Rendering
// ---------------------------------------------------------------------------

/// Script bytes for @p node.
[[nodiscard]] primitives::script::Script encode_node(const Node& node);

/// Canonical descriptor text, using the pk/pkh, t:, l:, u: and and_n
/// shorthands wherever they apply.
[[nodiscard]] std::string node_to_string(const Node& node);

[[nodiscard]] std::string_view fragment_name(Fragment fragment) noexcept;

} // namespace miniscript
