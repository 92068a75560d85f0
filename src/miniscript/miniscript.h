#pragma once
// Copyright (c) 2024-2026 The ELMS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "miniscript/context.h"
#include "miniscript/expression.h"
#include "miniscript/key.h"
#include "miniscript/node.h"
#include "miniscript/satisfy.h"
#include "miniscript/types.h"
#include "primitives/script/script.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace miniscript {

// ---------------------------------------------------------------------------
// Miniscript -- a type-checked expression bound to one script context
// ---------------------------------------------------------------------------
// Immutable.  The "insane" constructors only require a well-typed B
// expression; from_str() and parse() additionally run sanity_check().
// Translation and context conversion return new trees.
// ---------------------------------------------------------------------------
class Miniscript {
public:
    /// Wrap an already built node.  The node's context is the tree's.
    explicit Miniscript(NodeRef node) : node_(std::move(node)) {}

    // -- Construction from text ---------------------------------------------

    /// Build from an expression tree without the top-level B check.
    static core::Result<Miniscript> from_tree(const Tree& tree, Context ctx);

    static core::Result<Miniscript> from_str_insane(std::string_view s,
                                                    Context ctx);
    static core::Result<Miniscript> from_str(std::string_view s, Context ctx);

    // -- Construction from script -------------------------------------------

    static core::Result<Miniscript> parse_insane(
        const primitives::script::Script& script, Context ctx);
    static core::Result<Miniscript> parse(
        const primitives::script::Script& script, Context ctx);

    // -- Rendering ------------------------------------------------------------

    [[nodiscard]] primitives::script::Script encode() const {
        return encode_node(*node_);
    }
    [[nodiscard]] std::string to_string() const {
        return node_to_string(*node_);
    }

    // -- Cost accounting ------------------------------------------------------

    [[nodiscard]] size_t script_size() const { return node_->script_len; }
    [[nodiscard]] std::optional<uint32_t> ops_count_sat() const {
        return node_->ops_count_sat();
    }
    [[nodiscard]] bool has_free_verify() const {
        return node_->has_free_verify();
    }

    /// Witness elements of the largest satisfaction, plus one for the
    /// script itself.
    [[nodiscard]] std::optional<size_t> max_satisfaction_witness_elements()
        const;

    /// Bytes of the largest satisfaction: witness bytes for segwit
    /// contexts, scriptSig bytes for Legacy and Bare.
    [[nodiscard]] std::optional<size_t> max_satisfaction_size() const {
        return miniscript::max_satisfaction_size(node_->ctx, *node_);
    }

    // -- Analysis -------------------------------------------------------------

    /// Every satisfaction needs a signature (type property s).
    [[nodiscard]] bool requires_sig() const {
        return node_->type << "s"_mst;
    }
    [[nodiscard]] bool is_non_malleable() const {
        return node_->type << "m"_mst;
    }
    [[nodiscard]] bool has_mixed_timelocks() const {
        return !(node_->type << "k"_mst);
    }
    [[nodiscard]] bool has_repeated_keys() const;

    /// Fails with the first of SIG_FREE_PATH, MALLEABLE, a context limit,
    /// REPEATED_KEYS or MIXED_TIMELOCKS that applies.
    core::Result<void> sanity_check() const;

    // -- Satisfaction ---------------------------------------------------------

    core::Result<Witness> satisfy(const Satisfier& sat) const {
        return satisfy_node(*node_, sat, true);
    }
    core::Result<Witness> satisfy_malleable(const Satisfier& sat) const {
        return satisfy_node(*node_, sat, false);
    }

    // -- Keys -----------------------------------------------------------------

    /// Visit every key until @p pred returns false.  Returns whether all
    /// keys were accepted.  Key hashes without a known key are skipped.
    bool for_each_key(const std::function<bool(const PublicKey&)>& pred) const;

    core::Result<Miniscript> translate(const KeyTranslator& t) const;

    /// The same tree in the NO_CHECKS context.
    core::Result<Miniscript> to_no_checks() const;

    // -- Access ---------------------------------------------------------------

    [[nodiscard]] const Node& node() const noexcept { return *node_; }
    [[nodiscard]] const NodeRef& node_ref() const noexcept { return node_; }
    [[nodiscard]] Context context() const noexcept { return node_->ctx; }
    [[nodiscard]] Type type() const noexcept { return node_->type; }

    bool operator==(const Miniscript& other) const {
        return node_equal(*node_, *other.node_);
    }

private:
    NodeRef node_;
};

} // namespace miniscript
