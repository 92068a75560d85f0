#pragma once
// Copyright (c) 2024-2026 The ELMS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace miniscript {

/// Deepest nesting accepted by Tree::from_str.
inline constexpr size_t MAX_TREE_DEPTH = 402;

// ---------------------------------------------------------------------------
// Tree -- parsed `name(arg,arg,...)` expression
// ---------------------------------------------------------------------------
// The shared front end of descriptor and Miniscript parsing.  Names are kept
// verbatim, so "and_v", "elwsh" and "v:pk" are all single names.  A leaf
// such as a key or a number is a Tree with no arguments.
// ---------------------------------------------------------------------------
struct Tree {
    std::string name;
    std::vector<Tree> args;

    /// Parse a complete expression.  Fails with PARSE_ERROR on unbalanced
    /// parentheses, trailing characters or excessive nesting.
    static core::Result<Tree> from_str(std::string_view s);

    bool operator==(const Tree&) const = default;
};

/// Decimal u32 without sign or leading zeros.
core::Result<uint32_t> parse_num(std::string_view s);

} // namespace miniscript
