// Copyright (c) 2024-2026 The ELMS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "miniscript/expression.h"

#include <limits>

namespace miniscript {

namespace {

using core::ErrorCode;
using core::make_error;

// Parses one expression starting at s[pos].  On success pos points just
// past it, at a ',' or ')' belonging to the caller, or at the end.
core::Result<Tree> parse_tree(std::string_view s, size_t& pos,
                              size_t depth) {
    if (depth > MAX_TREE_DEPTH) {
        return make_error(ErrorCode::PARSE_ERROR,
                          "expression nested deeper than " +
                              std::to_string(MAX_TREE_DEPTH));
    }

    const size_t start = pos;
    const size_t stop = s.find_first_of("(,)", pos);
    if (stop == std::string_view::npos) {
        pos = s.size();
        return Tree{std::string(s.substr(start)), {}};
    }

    Tree tree{std::string(s.substr(start, stop - start)), {}};
    pos = stop;
    if (s[pos] != '(') return tree;

    ++pos;  // '('
    for (;;) {
        ELMS_TRY_ASSIGN(arg, parse_tree(s, pos, depth + 1));
        tree.args.push_back(std::move(arg));
        if (pos >= s.size()) {
            return make_error(ErrorCode::PARSE_ERROR,
                              "expected ',' or ')' after argument of " +
                                  tree.name);
        }
        if (s[pos] == ',') {
            ++pos;
            continue;
        }
        if (s[pos] == ')') {
            ++pos;
            return tree;
        }
        return make_error(ErrorCode::PARSE_ERROR,
                          std::string("unexpected '") + s[pos] + "' in " +
                              tree.name);
    }
}

} // anonymous namespace

core::Result<Tree> Tree::from_str(std::string_view s) {
    size_t pos = 0;
    ELMS_TRY_ASSIGN(tree, parse_tree(s, pos, 0));
    if (pos != s.size()) {
        return make_error(ErrorCode::PARSE_ERROR,
                          "trailing characters: " +
                              std::string(s.substr(pos)));
    }
    return tree;
}

core::Result<uint32_t> parse_num(std::string_view s) {
    auto bad = [s]() {
        return make_error(ErrorCode::BAD_NUMBER,
                          "invalid number '" + std::string(s) + "'");
    };
    if (s.empty() || s.size() > 10) return bad();
    if (s.size() > 1 && s[0] == '0') return bad();

    uint64_t value = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return bad();
        value = value * 10 + static_cast<uint64_t>(c - '0');
    }
    if (value > std::numeric_limits<uint32_t>::max()) return bad();
    return static_cast<uint32_t>(value);
}

} // namespace miniscript
