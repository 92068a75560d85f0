// Copyright (c) 2024-2026 The ELMS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "miniscript/decode.h"
#include "core/logging.h"

#include <algorithm>
#include <tuple>

namespace miniscript {

using core::ErrorCode;
using core::make_error;
using primitives::script::Opcode;
using primitives::script::Script;

// ===================================================================
// Lexer
// ===================================================================

namespace {

bool is_verifiable(Opcode op) {
    return op == Opcode::OP_CHECKSIG || op == Opcode::OP_CHECKMULTISIG ||
           op == Opcode::OP_EQUAL || op == Opcode::OP_NUMEQUAL ||
           op == Opcode::OP_CHECKSIGFROMSTACK;
}

/// Base opcode of a VERIFY form, if @p op is one.
std::optional<Opcode> verify_base(Opcode op) {
    switch (op) {
    case Opcode::OP_CHECKSIGVERIFY:          return Opcode::OP_CHECKSIG;
    case Opcode::OP_CHECKMULTISIGVERIFY:     return Opcode::OP_CHECKMULTISIG;
    case Opcode::OP_EQUALVERIFY:             return Opcode::OP_EQUAL;
    case Opcode::OP_NUMEQUALVERIFY:          return Opcode::OP_NUMEQUAL;
    case Opcode::OP_CHECKSIGFROMSTACKVERIFY: return Opcode::OP_CHECKSIGFROMSTACK;
    default:                                 return std::nullopt;
    }
}

} // anonymous namespace

core::Result<std::vector<Token>> lex(const Script& script) {
    std::vector<Token> out;
    auto it = script.begin_iter();
    while (auto elem = it.next()) {
        const auto raw = static_cast<uint8_t>(elem->opcode);
        if (raw <= static_cast<uint8_t>(Opcode::OP_PUSHDATA4)) {
            if (!primitives::script::is_minimal_push(*elem)) {
                return make_error(ErrorCode::BAD_SCRIPT,
                                  "non-minimal push in script");
            }
            out.push_back(Token{elem->opcode, std::vector<uint8_t>(
                                                  elem->data.begin(),
                                                  elem->data.end())});
            continue;
        }
        if (auto n = primitives::script::decode_small_int(elem->opcode)) {
            out.push_back(Token{elem->opcode,
                                {static_cast<uint8_t>(*n)}});
            continue;
        }
        if (elem->opcode == Opcode::OP_VERIFY && !out.empty() &&
            is_verifiable(out.back().opcode)) {
            return make_error(ErrorCode::NON_MINIMAL_VERIFY,
                              std::string(primitives::script::opcode_name(
                                  out.back().opcode)) +
                                  " followed by OP_VERIFY");
        }
        if (auto base = verify_base(elem->opcode)) {
            out.push_back(Token{*base, {}});
            out.push_back(Token{Opcode::OP_VERIFY, {}});
            continue;
        }
        out.push_back(Token{elem->opcode, {}});
    }
    if (it.failed()) {
        return make_error(ErrorCode::BAD_SCRIPT, "truncated push in script");
    }
    return out;
}

std::optional<int64_t> parse_script_num(const Token& token) {
    if (token.opcode == Opcode::OP_0) return 0;
    const auto& v = token.data;
    if (v.empty() || v.size() > 4) return std::nullopt;
    if ((v.back() & 0x7f) == 0 &&
        (v.size() == 1 || (v[v.size() - 2] & 0x80) == 0)) {
        return std::nullopt;
    }
    int64_t result = 0;
    for (size_t i = 0; i < v.size(); ++i) {
        result |= static_cast<int64_t>(v[i]) << (8 * i);
    }
    if (v.back() & 0x80) {
        return -(result & ~(int64_t{0x80} << (8 * (v.size() - 1))));
    }
    return result;
}

// ===================================================================
// Decoder
// ===================================================================
// The script is read back to front.  Each pending step on the work stack
// either consumes tokens and pushes nodes, or combines nodes already
// built.  Nodes are constructed through make_node, so every partial
// result is type checked as soon as it exists.
// ===================================================================

namespace {

enum class Step {
    SINGLE_BKV_EXPR,  // a B, K or V expression that is not an and_v
    BKV_EXPR,         // a B, K or V expression, possibly an and_v
    W_EXPR,           // a W expression (a: or s: wrapped)
    MAYBE_AND_V,      // another and_v operand may precede
    SWAP,
    ALT,
    CHECK,
    DUP_IF,
    VERIFY,
    NON_ZERO,
    ZERO_NOTEQUAL,
    AND_V,
    AND_B,
    OR_B,
    OR_C,
    OR_D,
    ANDOR,
    THRESH_W,         // reading the OP_ADD chain of a thresh
    THRESH_E,         // first thresh operand done; assemble
    ENDIF,            // just read OP_ENDIF
    ENDIF_NOTIF,      // read [Y] OP_ENDIF after an OP_NOTIF
    ENDIF_ELSE,       // read [Y] OP_ELSE [Z] OP_ENDIF
};

class Decoder {
public:
    Decoder(const std::vector<Token>& tokens, Context ctx)
        : toks_(tokens.rbegin(), tokens.rend()), ctx_(ctx) {}

    core::Result<NodeRef> run();

private:
    size_t left() const { return toks_.size() - pos_; }
    const Token& at(size_t i) const { return toks_[pos_ + i]; }
    Opcode op(size_t i) const { return at(i).opcode; }

    core::Result<NodeRef> make(Fragment f, std::vector<NodeRef> subs = {},
                               std::vector<PublicKey> keys = {},
                               std::vector<uint8_t> data = {},
                               uint32_t k = 0) const {
        return make_node(ctx_, f, std::move(subs), std::move(keys),
                         std::move(data), k);
    }

    core::Result<void> single_expr();
    core::Result<void> wrap_back(Fragment f);
    core::Result<void> build_back(Fragment f);
    core::Result<PublicKey> key_at(size_t i) const;

    core::Error unexpected() const {
        if (left() == 0) {
            return make_error(ErrorCode::BAD_SCRIPT,
                              "unexpected end of script");
        }
        return make_error(ErrorCode::BAD_SCRIPT,
                          "unexpected " +
                              std::string(primitives::script::opcode_name(
                                  op(0))));
    }

    std::vector<Token> toks_;
    size_t pos_ = 0;
    Context ctx_;

    std::vector<std::tuple<Step, int64_t, int64_t>> todo_;
    std::vector<NodeRef> built_;
};

bool is_key_push(const Token& t) {
    const size_t n = t.data.size();
    return t.opcode != Opcode::OP_0 && (n == 32 || n == 33 || n == 65);
}

core::Result<PublicKey> Decoder::key_at(size_t i) const {
    return PublicKey::from_bytes(at(i).data);
}

core::Result<void> Decoder::wrap_back(Fragment f) {
    if (built_.empty()) return unexpected();
    ELMS_TRY_ASSIGN(node, make(f, {std::move(built_.back())}));
    built_.back() = std::move(node);
    return core::make_ok();
}

// Combine the two most recent nodes; the later one is the left operand.
core::Result<void> Decoder::build_back(Fragment f) {
    if (built_.size() < 2) return unexpected();
    NodeRef child = std::move(built_.back());
    built_.pop_back();
    ELMS_TRY_ASSIGN(node, make(f, {std::move(child),
                                   std::move(built_.back())}));
    built_.back() = std::move(node);
    return core::make_ok();
}

core::Result<void> Decoder::single_expr() {
    if (left() == 0) return unexpected();

    // Constants
    if (op(0) == Opcode::OP_1) {
        ++pos_;
        ELMS_TRY_ASSIGN(node, make(Fragment::JUST_1));
        built_.push_back(std::move(node));
        return core::make_ok();
    }
    if (op(0) == Opcode::OP_0) {
        ++pos_;
        ELMS_TRY_ASSIGN(node, make(Fragment::JUST_0));
        built_.push_back(std::move(node));
        return core::make_ok();
    }

    // Keys
    if (is_key_push(at(0))) {
        ELMS_TRY_ASSIGN(key, key_at(0));
        ++pos_;
        ELMS_TRY_ASSIGN(node, make(Fragment::PK_K, {}, {std::move(key)}));
        built_.push_back(std::move(node));
        return core::make_ok();
    }
    if (left() >= 5 && op(0) == Opcode::OP_VERIFY &&
        op(1) == Opcode::OP_EQUAL && op(3) == Opcode::OP_HASH160 &&
        op(4) == Opcode::OP_DUP && at(2).data.size() == 20) {
        KeyHash hash{core::uint160::from_bytes(
                         std::span<const uint8_t, 20>(at(2).data.data(), 20)),
                     is_tapscript(ctx_) ? PublicKey::Kind::XONLY
                                        : PublicKey::Kind::FULL};
        pos_ += 5;
        ELMS_TRY_ASSIGN(node, make_raw_pkh(ctx_, hash));
        built_.push_back(std::move(node));
        return core::make_ok();
    }

    // Timelocks
    std::optional<int64_t> num;
    if (left() >= 2 &&
        (op(0) == Opcode::OP_CHECKSEQUENCEVERIFY ||
         op(0) == Opcode::OP_CHECKLOCKTIMEVERIFY) &&
        (num = parse_script_num(at(1)))) {
        const Fragment f = op(0) == Opcode::OP_CHECKSEQUENCEVERIFY
                               ? Fragment::OLDER
                               : Fragment::AFTER;
        if (*num < 1 || *num > 0x7fffffffL) {
            return make_error(ErrorCode::BAD_NUMBER,
                              std::string(fragment_name(f)) +
                                  " value out of range: " +
                                  std::to_string(*num));
        }
        pos_ += 2;
        ELMS_TRY_ASSIGN(node, make(f, {}, {}, {}, static_cast<uint32_t>(*num)));
        built_.push_back(std::move(node));
        return core::make_ok();
    }

    // Hashes
    if (left() >= 7 && op(0) == Opcode::OP_EQUAL &&
        op(3) == Opcode::OP_VERIFY && op(4) == Opcode::OP_EQUAL &&
        (num = parse_script_num(at(5))) && *num == 32 &&
        op(6) == Opcode::OP_SIZE) {
        std::optional<Fragment> f;
        const size_t len = at(1).data.size();
        if (op(2) == Opcode::OP_SHA256 && len == 32) f = Fragment::SHA256;
        if (op(2) == Opcode::OP_HASH256 && len == 32) f = Fragment::HASH256;
        if (op(2) == Opcode::OP_RIPEMD160 && len == 20) f = Fragment::RIPEMD160;
        if (op(2) == Opcode::OP_HASH160 && len == 20) f = Fragment::HASH160;
        if (f) {
            ELMS_TRY_ASSIGN(node, make(*f, {}, {}, at(1).data));
            pos_ += 7;
            built_.push_back(std::move(node));
            return core::make_ok();
        }
    }

    // multi
    if (left() >= 3 && op(0) == Opcode::OP_CHECKMULTISIG) {
        auto n = parse_script_num(at(1));
        if (!n || *n < 1 ||
            *n > primitives::script::MAX_PUBKEYS_PER_MULTISIG ||
            left() < static_cast<size_t>(3 + *n)) {
            return make_error(ErrorCode::BAD_SCRIPT,
                              "malformed CHECKMULTISIG key list");
        }
        std::vector<PublicKey> keys;
        for (int64_t i = 0; i < *n; ++i) {
            const Token& t = at(2 + static_cast<size_t>(i));
            if (t.data.size() != 33 && t.data.size() != 65) {
                return make_error(ErrorCode::BAD_SCRIPT,
                                  "CHECKMULTISIG operand is not a key");
            }
            ELMS_TRY_ASSIGN(key, key_at(2 + static_cast<size_t>(i)));
            keys.push_back(std::move(key));
        }
        auto k = parse_script_num(at(2 + static_cast<size_t>(*n)));
        if (!k || *k < 1 || *k > *n) {
            return make_error(ErrorCode::BAD_NUMBER,
                              "bad CHECKMULTISIG threshold");
        }
        pos_ += 3 + static_cast<size_t>(*n);
        std::reverse(keys.begin(), keys.end());
        ELMS_TRY_ASSIGN(node, make(Fragment::MULTI, {}, std::move(keys), {},
                                   static_cast<uint32_t>(*k)));
        built_.push_back(std::move(node));
        return core::make_ok();
    }

    // multi_a
    if (left() >= 4 && op(0) == Opcode::OP_NUMEQUAL) {
        auto k = parse_script_num(at(1));
        if (k && *k >= 1 && *k <= static_cast<int64_t>(MAX_PUBKEYS_PER_MULTI_A) &&
            left() >= static_cast<size_t>(2 + *k * 2) &&
            (op(2) == Opcode::OP_CHECKSIG || op(2) == Opcode::OP_CHECKSIGADD)) {
            std::vector<PublicKey> keys;
            for (size_t p = 2;; p += 2) {
                if (left() < p + 2) return unexpected();
                if (op(p) != Opcode::OP_CHECKSIGADD &&
                    op(p) != Opcode::OP_CHECKSIG) {
                    return make_error(ErrorCode::BAD_SCRIPT,
                                      "malformed multi_a key list");
                }
                if (at(p + 1).data.size() != 32) {
                    return make_error(ErrorCode::BAD_SCRIPT,
                                      "multi_a operand is not an x-only key");
                }
                ELMS_TRY_ASSIGN(key, key_at(p + 1));
                keys.push_back(std::move(key));
                if (keys.size() > MAX_PUBKEYS_PER_MULTI_A) {
                    return make_error(ErrorCode::BAD_SCRIPT,
                                      "too many multi_a keys");
                }
                if (op(p) == Opcode::OP_CHECKSIG) break;
            }
            if (keys.size() < static_cast<size_t>(*k)) {
                return make_error(ErrorCode::BAD_NUMBER,
                                  "bad multi_a threshold");
            }
            pos_ += 2 + keys.size() * 2;
            std::reverse(keys.begin(), keys.end());
            ELMS_TRY_ASSIGN(node, make(Fragment::MULTI_A, {}, std::move(keys),
                                       {}, static_cast<uint32_t>(*k)));
            built_.push_back(std::move(node));
            return core::make_ok();
        }
    }

    // The wrappers below commute with and_v, so a single expression is
    // enough: c:and_v(X,Y) encodes like and_v(X,c:Y).
    if (op(0) == Opcode::OP_CHECKSIG) {
        ++pos_;
        todo_.emplace_back(Step::CHECK, -1, -1);
        todo_.emplace_back(Step::SINGLE_BKV_EXPR, -1, -1);
        return core::make_ok();
    }
    if (op(0) == Opcode::OP_VERIFY) {
        ++pos_;
        todo_.emplace_back(Step::VERIFY, -1, -1);
        todo_.emplace_back(Step::SINGLE_BKV_EXPR, -1, -1);
        return core::make_ok();
    }
    if (op(0) == Opcode::OP_0NOTEQUAL) {
        ++pos_;
        todo_.emplace_back(Step::ZERO_NOTEQUAL, -1, -1);
        todo_.emplace_back(Step::SINGLE_BKV_EXPR, -1, -1);
        return core::make_ok();
    }

    // thresh
    if (left() >= 3 && op(0) == Opcode::OP_EQUAL &&
        (num = parse_script_num(at(1)))) {
        if (*num < 1) {
            return make_error(ErrorCode::BAD_NUMBER, "thresh with k < 1");
        }
        pos_ += 2;
        todo_.emplace_back(Step::THRESH_W, 0, *num);
        return core::make_ok();
    }

    // j: d: andor or_c or_d or_i
    if (op(0) == Opcode::OP_ENDIF) {
        ++pos_;
        todo_.emplace_back(Step::ENDIF, -1, -1);
        todo_.emplace_back(Step::BKV_EXPR, -1, -1);
        return core::make_ok();
    }

    // and_v stays outside and_b/or_b: or_b(and_v(X,Y),Z) is not valid but
    // and_v(X,or_b(Y,Z)) has the same script.
    if (op(0) == Opcode::OP_BOOLAND || op(0) == Opcode::OP_BOOLOR) {
        const Step s = op(0) == Opcode::OP_BOOLAND ? Step::AND_B : Step::OR_B;
        ++pos_;
        todo_.emplace_back(s, -1, -1);
        todo_.emplace_back(Step::SINGLE_BKV_EXPR, -1, -1);
        todo_.emplace_back(Step::W_EXPR, -1, -1);
        return core::make_ok();
    }

    return unexpected();
}

core::Result<NodeRef> Decoder::run() {
    todo_.emplace_back(Step::BKV_EXPR, -1, -1);

    while (!todo_.empty()) {
        auto [step, n, k] = todo_.back();
        todo_.pop_back();

        switch (step) {
        case Step::SINGLE_BKV_EXPR:
            ELMS_TRY_VOID(single_expr());
            break;
        case Step::BKV_EXPR:
            todo_.emplace_back(Step::MAYBE_AND_V, -1, -1);
            todo_.emplace_back(Step::SINGLE_BKV_EXPR, -1, -1);
            break;
        case Step::W_EXPR:
            if (left() == 0) return unexpected();
            if (op(0) == Opcode::OP_FROMALTSTACK) {
                ++pos_;
                todo_.emplace_back(Step::ALT, -1, -1);
            } else {
                todo_.emplace_back(Step::SWAP, -1, -1);
            }
            todo_.emplace_back(Step::BKV_EXPR, -1, -1);
            break;
        case Step::MAYBE_AND_V:
            // None of these can end a well-formed expression.
            if (left() > 0 && op(0) != Opcode::OP_IF &&
                op(0) != Opcode::OP_ELSE && op(0) != Opcode::OP_NOTIF &&
                op(0) != Opcode::OP_TOALTSTACK && op(0) != Opcode::OP_SWAP) {
                todo_.emplace_back(Step::AND_V, -1, -1);
                todo_.emplace_back(Step::BKV_EXPR, -1, -1);
            }
            break;
        case Step::SWAP:
            if (left() == 0 || op(0) != Opcode::OP_SWAP) return unexpected();
            ++pos_;
            ELMS_TRY_VOID(wrap_back(Fragment::WRAP_S));
            break;
        case Step::ALT:
            if (left() == 0 || op(0) != Opcode::OP_TOALTSTACK) {
                return unexpected();
            }
            ++pos_;
            ELMS_TRY_VOID(wrap_back(Fragment::WRAP_A));
            break;
        case Step::CHECK:
            ELMS_TRY_VOID(wrap_back(Fragment::WRAP_C));
            break;
        case Step::DUP_IF:
            ELMS_TRY_VOID(wrap_back(Fragment::WRAP_D));
            break;
        case Step::VERIFY:
            ELMS_TRY_VOID(wrap_back(Fragment::WRAP_V));
            break;
        case Step::NON_ZERO:
            ELMS_TRY_VOID(wrap_back(Fragment::WRAP_J));
            break;
        case Step::ZERO_NOTEQUAL:
            ELMS_TRY_VOID(wrap_back(Fragment::WRAP_N));
            break;
        case Step::AND_V:
            ELMS_TRY_VOID(build_back(Fragment::AND_V));
            break;
        case Step::AND_B:
            ELMS_TRY_VOID(build_back(Fragment::AND_B));
            break;
        case Step::OR_B:
            ELMS_TRY_VOID(build_back(Fragment::OR_B));
            break;
        case Step::OR_C:
            ELMS_TRY_VOID(build_back(Fragment::OR_C));
            break;
        case Step::OR_D:
            ELMS_TRY_VOID(build_back(Fragment::OR_D));
            break;
        case Step::ANDOR: {
            if (built_.size() < 3) return unexpected();
            NodeRef x = std::move(built_.back());
            built_.pop_back();
            NodeRef z = std::move(built_.back());
            built_.pop_back();
            NodeRef y = std::move(built_.back());
            ELMS_TRY_ASSIGN(node, make(Fragment::ANDOR, {std::move(x),
                                                         std::move(y),
                                                         std::move(z)}));
            built_.back() = std::move(node);
            break;
        }
        case Step::THRESH_W:
            if (left() == 0) return unexpected();
            if (op(0) == Opcode::OP_ADD) {
                ++pos_;
                todo_.emplace_back(Step::THRESH_W, n + 1, k);
                todo_.emplace_back(Step::W_EXPR, -1, -1);
            } else {
                // Thresh operands are d-typed, so never and_v.
                todo_.emplace_back(Step::THRESH_E, n + 1, k);
                todo_.emplace_back(Step::SINGLE_BKV_EXPR, -1, -1);
            }
            break;
        case Step::THRESH_E: {
            if (k < 1 || k > n || built_.size() < static_cast<size_t>(n)) {
                return make_error(ErrorCode::BAD_NUMBER,
                                  "thresh(" + std::to_string(k) + ") over " +
                                      std::to_string(n) + " subexpressions");
            }
            std::vector<NodeRef> subs;
            for (int64_t i = 0; i < n; ++i) {
                subs.push_back(std::move(built_.back()));
                built_.pop_back();
            }
            ELMS_TRY_ASSIGN(node, make(Fragment::THRESH, std::move(subs), {},
                                       {}, static_cast<uint32_t>(k)));
            built_.push_back(std::move(node));
            break;
        }
        case Step::ENDIF:
            if (left() == 0) return unexpected();
            if (op(0) == Opcode::OP_ELSE) {
                ++pos_;
                todo_.emplace_back(Step::ENDIF_ELSE, -1, -1);
                todo_.emplace_back(Step::BKV_EXPR, -1, -1);
            } else if (op(0) == Opcode::OP_IF) {
                if (left() >= 2 && op(1) == Opcode::OP_DUP) {
                    pos_ += 2;
                    todo_.emplace_back(Step::DUP_IF, -1, -1);
                } else if (left() >= 3 && op(1) == Opcode::OP_0NOTEQUAL &&
                           op(2) == Opcode::OP_SIZE) {
                    pos_ += 3;
                    todo_.emplace_back(Step::NON_ZERO, -1, -1);
                } else {
                    return unexpected();
                }
            } else if (op(0) == Opcode::OP_NOTIF) {
                ++pos_;
                todo_.emplace_back(Step::ENDIF_NOTIF, -1, -1);
            } else {
                return unexpected();
            }
            break;
        case Step::ENDIF_NOTIF:
            if (left() == 0) return unexpected();
            if (op(0) == Opcode::OP_IFDUP) {
                ++pos_;
                todo_.emplace_back(Step::OR_D, -1, -1);
            } else {
                todo_.emplace_back(Step::OR_C, -1, -1);
            }
            todo_.emplace_back(Step::SINGLE_BKV_EXPR, -1, -1);
            break;
        case Step::ENDIF_ELSE:
            if (left() == 0) return unexpected();
            if (op(0) == Opcode::OP_IF) {
                ++pos_;
                ELMS_TRY_VOID(build_back(Fragment::OR_I));
            } else if (op(0) == Opcode::OP_NOTIF) {
                ++pos_;
                todo_.emplace_back(Step::ANDOR, -1, -1);
                todo_.emplace_back(Step::SINGLE_BKV_EXPR, -1, -1);
            } else {
                return unexpected();
            }
            break;
        }
    }

    if (left() != 0) {
        return make_error(ErrorCode::TRAILING,
                          std::to_string(left()) +
                              " trailing opcodes before the expression");
    }
    if (built_.size() != 1) {
        return make_error(ErrorCode::BAD_SCRIPT,
                          "script does not decode to a single expression");
    }
    return std::move(built_.front());
}

} // anonymous namespace

core::Result<NodeRef> decode_tokens(const std::vector<Token>& tokens,
                                    Context ctx) {
    Decoder decoder(tokens, ctx);
    auto res = decoder.run();
    if (!res.ok()) {
        LOG_TRACE(core::LogCategory::PARSE,
                  "script decode failed: " + res.error().message());
    }
    return res;
}

} // namespace miniscript
