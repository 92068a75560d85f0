#pragma once
// Copyright (c) 2024-2026 The ELMS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "miniscript/context.h"
#include "miniscript/node.h"
#include "primitives/script/opcodes.h"
#include "primitives/script/script.h"

#include <cstdint>
#include <optional>
#include <vector>

namespace miniscript {

/// One lexed script instruction.  Pushes carry their payload; OP_1..OP_16
/// carry the single byte they stand for so numbers parse uniformly.
struct Token {
    primitives::script::Opcode opcode;
    std::vector<uint8_t> data;

    bool operator==(const Token&) const = default;
};

/// Split a script into tokens, in script order.  The VERIFY forms of
/// CHECKSIG, CHECKMULTISIG, EQUAL, NUMEQUAL and CHECKSIGFROMSTACK become
/// the base opcode followed by OP_VERIFY.  Fails with BAD_SCRIPT on a
/// truncated or non-minimal push, and with NON_MINIMAL_VERIFY when a
/// verifiable opcode is followed by an explicit OP_VERIFY.
core::Result<std::vector<Token>> lex(const primitives::script::Script& script);

/// Minimally encoded script number of at most four bytes.
std::optional<int64_t> parse_script_num(const Token& token);

/// Rebuild the Miniscript whose encoding is @p tokens (script order).
/// Every token must be consumed; leftovers fail with TRAILING.  The result
/// is type checked per node but not checked as a top-level expression.
core::Result<NodeRef> decode_tokens(const std::vector<Token>& tokens,
                                    Context ctx);

} // namespace miniscript
